#pragma once

#include <vector>

namespace pulsescope {

// Longest span, in microseconds, a register of `bits` can hold at `prescaler`.
double maxSpanUs(int prescaler, int bits, double clockRateHz);

// Finest prescaler in the ascending `table` whose range still covers
// `requestedSpanUs`. Throws TimingUnattainable when none does.
int selectPrescaler(double requestedSpanUs, int registerWidthBits, double clockRateHz, const std::vector<int>& table);

} // namespace pulsescope
