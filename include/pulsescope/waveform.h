#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace pulsescope {

// One reconstructed trace, x in microseconds. In an Any-mode trace y[i] is the
// level held up to edge i and the levels alternate; counted traces repeat the
// polarity of the counted edge.
struct Waveform {
    std::vector<double> x;
    std::vector<bool> y;
};

// Edges recorded at or before `t`.
size_t edgesBefore(const Waveform& w, double t);

// Index of the edge closest to `t`; ties go to the earlier edge.
std::optional<size_t> nearestEdge(const Waveform& w, double t);

// Level of an alternating trace at `t`, nullopt for an empty trace.
std::optional<bool> levelAt(const Waveform& w, double t);

} // namespace pulsescope
