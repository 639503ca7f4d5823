#include "fluxed/coordinates.hpp"
#include "fluxed/hash.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace fluxed {

Axis linspace(double lo, double hi, std::size_t n) {
    Axis a(n);
    if (n == 0) return a;
    if (n == 1) { a[0] = lo; return a; }
    double step = (hi - lo) / double(n - 1);
    for (std::size_t i = 0; i < n; i++) a[i] = lo + step * double(i);
    a[n - 1] = hi;
    return a;
}

Axis arange(double start, double stop, double step) {
    if (step == 0.0 || !std::isfinite(step))
        throw std::invalid_argument("arange step must be finite and non-zero");
    double span = std::ceil((stop - start) / step);
    Axis a;
    if (!(span > 0.0)) return a;
    std::size_t n = (std::size_t)span;
    a.reserve(n);
    for (std::size_t i = 0; i < n; i++) a.push_back(start + step * double(i));
    return a;
}

Axis indices(std::size_t n) {
    Axis a(n);
    for (std::size_t i = 0; i < n; i++) a[i] = double(i);
    return a;
}

Coordinates resolve(const Coordinates& coords, const Extents& extents) {
    if (coords.empty()) {
        Coordinates out;
        out.reserve(extents.size());
        for (std::size_t n : extents) out.push_back(indices(n));
        return out;
    }

    if (coords.size() != extents.size()) {
        std::ostringstream msg;
        msg << "Expected " << extents.size() << " coordinate arrays, got "
            << coords.size();
        throw std::invalid_argument(msg.str());
    }

    for (std::size_t k = 0; k < coords.size(); k++) {
        if (coords[k].size() != extents[k]) {
            std::ostringstream msg;
            msg << "Coordinate array for axis " << k << " has length "
                << coords[k].size() << ", shape extent is " << extents[k];
            throw std::invalid_argument(msg.str());
        }
    }
    return coords;
}

uint64_t fingerprint(const Coordinates& coords) {
    uint64_t h = hash_u64(coords.size());
    for (std::size_t k = 0; k < coords.size(); k++) {
        h = hash_mix(h, uint64_t(k) * MIX_AXIS);
        for (double v : coords[k]) h = hash_double(h, v);
    }
    return h;
}

} // namespace fluxed
