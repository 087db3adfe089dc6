#include "pulsescope/prescaler.h"

#include "pulsescope/errors.h"

#include <cmath>
#include <string>

namespace pulsescope {

double maxSpanUs(int prescaler, int bits, double clockRateHz) {
    return (std::ldexp(1.0, bits) - 1.0) * prescaler / clockRateHz * 1e6;
}

int selectPrescaler(double requestedSpanUs, int registerWidthBits, double clockRateHz, const std::vector<int>& table) {
    if (!std::isfinite(requestedSpanUs) || requestedSpanUs < 0) {
        throw TimingUnattainable("requested span " + std::to_string(requestedSpanUs) + " us cannot be timed");
    }
    for (int p : table) {
        if (maxSpanUs(p, registerWidthBits, clockRateHz) >= requestedSpanUs) {
            return p;
        }
    }
    const double longest = table.empty() ? 0.0 : maxSpanUs(table.back(), registerWidthBits, clockRateHz);
    throw TimingUnattainable("requested span " + std::to_string(requestedSpanUs) + " us exceeds the longest timer range of " + std::to_string(longest) + " us");
}

} // namespace pulsescope
