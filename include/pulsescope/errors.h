#pragma once

#include <stdexcept>
#include <string>

namespace pulsescope {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad channel count, event count, mode name, channel name or trigger placement.
// Always raised before any command reaches the instrument.
class InvalidArgument : public Error {
public:
    using Error::Error;
};

// No prescaler in the table covers the requested timing window.
class TimingUnattainable : public Error {
public:
    using Error::Error;
};

// A capture is already running on the instrument.
class HardwareBusy : public Error {
public:
    using Error::Error;
};

class Timeout : public Error {
public:
    using Error::Error;
};

// Short or malformed response, bad acknowledge, driver failure.
class TransportError : public Error {
public:
    using Error::Error;
};

// The operation is not valid in the session's current state.
class SessionStateError : public Error {
public:
    using Error::Error;
};

} // namespace pulsescope
