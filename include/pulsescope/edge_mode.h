#pragma once

#include "pulsescope/protocol.h"

#include <QString>

namespace pulsescope {

enum class EdgeMode : quint8 {
    Any,
    Rising,
    Falling,
    FourRising,
    SixteenRising
};

struct EdgeModeCode {
    quint8 hardwareCode;
    // Physical transitions consumed per recorded event.
    int multiplier;
};

constexpr quint8 MODE_DISABLED = 0;

EdgeModeCode encode(EdgeMode mode);
EdgeMode parseEdgeMode(const QString& name);
QString edgeModeName(EdgeMode mode);

enum class TriggerDirection : quint8 {
    Disabled,
    Rising,
    Falling
};

struct TriggerConfig {
    Channel channel = Channel::ID1;
    TriggerDirection direction = TriggerDirection::Disabled;
};

TriggerDirection parseTriggerDirection(const QString& name);
QString triggerDirectionName(TriggerDirection direction);

// Trigger byte of the layout's start command. The firmware numbers trigger
// directions differently in each layout.
quint8 encodeTrigger(const TriggerConfig& trigger, Layout layout);

} // namespace pulsescope
