#ifndef FLUXED_COORDINATES_HPP
#define FLUXED_COORDINATES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fluxed {

using Extents = std::vector<std::size_t>;

// One 1-D coordinate array per axis. Empty means "use integer indices".
using Axis = std::vector<double>;
using Coordinates = std::vector<Axis>;

Axis linspace(double lo, double hi, std::size_t n);
Axis arange(double start, double stop, double step = 1.0);
Axis indices(std::size_t n);

// One axis per dimension, each of length extents[k]; empty coords become
// integer indices. Throws std::invalid_argument on count or length mismatch.
Coordinates resolve(const Coordinates& coords, const Extents& extents);

// Hash of every coordinate value, used to key cached intensity fields.
uint64_t fingerprint(const Coordinates& coords);

} // namespace fluxed

#endif // FLUXED_COORDINATES_HPP
