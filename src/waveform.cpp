#include "pulsescope/waveform.h"

#include <algorithm>
#include <iterator>

namespace pulsescope {

size_t edgesBefore(const Waveform& w, double t) {
    return size_t(std::distance(w.x.begin(), std::upper_bound(w.x.begin(), w.x.end(), t)));
}

std::optional<size_t> nearestEdge(const Waveform& w, double t) {
    if (w.x.empty()) {
        return std::nullopt;
    }
    const size_t i = size_t(std::distance(w.x.begin(), std::lower_bound(w.x.begin(), w.x.end(), t)));
    if (i == 0) {
        return 0;
    }
    if (i == w.x.size()) {
        return i - 1;
    }
    return (w.x[i] - t < t - w.x[i - 1]) ? i : i - 1;
}

std::optional<bool> levelAt(const Waveform& w, double t) {
    if (w.y.empty()) {
        return std::nullopt;
    }
    const size_t i = edgesBefore(w, t);
    if (i < w.y.size()) {
        return w.y[i];
    }
    return !w.y.back();
}

} // namespace pulsescope
