#include "fluxed/shape.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fluxed {

// ============================================================
// Construction
// ============================================================
std::size_t NdShape::cell_count(const Extents& extents) {
    if (extents.empty())
        throw std::invalid_argument("Shape must have at least one dimension.");

    std::size_t n = 1;
    for (std::size_t e : extents) {
        if (e == 0)
            throw std::invalid_argument("Shape extents must be non-zero.");
        if (e > MAX_CELLS / n) {
            std::ostringstream msg;
            msg << "Shape has more than " << MAX_CELLS << " cells.";
            throw std::invalid_argument(msg.str());
        }
        n *= e;
    }
    return n;
}

NdShape::NdShape(Extents extents, const std::vector<int>& values)
    : extents_(std::move(extents)) {
    std::size_t n = cell_count(extents_);

    if (values.size() != n) {
        std::ostringstream msg;
        msg << "Shape array has " << values.size() << " values, extents require " << n;
        throw std::invalid_argument(msg.str());
    }

    std::set<int> unique(values.begin(), values.end());
    for (int v : unique) {
        if (v != 0 && v != 1) {
            std::ostringstream msg;
            msg << "Shape array must contain only 0s and 1s. Found: [";
            bool first = true;
            for (int u : unique) {
                if (!first) msg << " ";
                msg << u;
                first = false;
            }
            msg << "]";
            throw std::invalid_argument(msg.str());
        }
    }

    cells_.assign(values.begin(), values.end());

    strides_.assign(extents_.size(), 1);
    for (std::size_t k = extents_.size() - 1; k > 0; k--)
        strides_[k - 1] = strides_[k] * extents_[k];

    build_neighbors();
}

NdShape NdShape::hollow_box(const Extents& extents) {
    std::vector<int> values(cell_count(extents), 1);

    std::vector<std::size_t> m(extents.size(), 0);
    for (std::size_t i = 0; i < values.size(); i++) {
        bool inside = true;
        for (std::size_t k = 0; k < extents.size(); k++)
            if (m[k] == 0 || m[k] + 1 >= extents[k]) { inside = false; break; }
        if (inside) values[i] = 0;

        for (std::size_t k = extents.size(); k-- > 0;) {
            if (++m[k] < extents[k]) break;
            m[k] = 0;
        }
    }
    return NdShape(extents, values);
}

std::size_t NdShape::index(const std::vector<std::size_t>& multi) const {
    if (multi.size() != dimensions())
        throw std::invalid_argument("Index has wrong number of dimensions");
    std::size_t flat = 0;
    for (std::size_t k = 0; k < multi.size(); k++) {
        if (multi[k] >= extents_[k])
            throw std::out_of_range("Index out of range on axis " + std::to_string(k));
        flat += multi[k] * strides_[k];
    }
    return flat;
}

std::vector<std::size_t> NdShape::unravel(std::size_t flat) const {
    std::vector<std::size_t> m(dimensions());
    for (std::size_t k = 0; k < dimensions(); k++) {
        m[k] = flat / strides_[k];
        flat %= strides_[k];
    }
    return m;
}

std::size_t NdShape::border_count() const {
    return (std::size_t)std::count(cells_.begin(), cells_.end(), uint8_t(1));
}

// --------------------------------------------------------
// Precompute face neighbours (2N per cell)
// --------------------------------------------------------
void NdShape::build_neighbors() {
    const std::size_t nd = dimensions();
    const std::size_t n = size();
    nbr_.assign(n * 2 * nd, -1);

    std::vector<std::size_t> m(nd, 0);
    for (std::size_t i = 0; i < n; i++) {
        for (std::size_t k = 0; k < nd; k++) {
            long* nb = &nbr_[i * 2 * nd + 2 * k];
            nb[0] = (m[k] + 1 < extents_[k]) ? long(i + strides_[k]) : -1;
            nb[1] = (m[k] >= 1)               ? long(i - strides_[k]) : -1;
        }
        for (std::size_t k = nd; k-- > 0;) {
            if (++m[k] < extents_[k]) break;
            m[k] = 0;
        }
    }
}

// ============================================================
// Enclosure
// ============================================================
void NdShape::compute_enclosure() const {
    if (have_enclosure_) return;

    const std::size_t n = size();
    const std::size_t nn = 2 * dimensions();

    // Flood fill the empty space reachable from the grid boundary.
    exterior_.assign(n, 0);
    std::vector<std::size_t> stack;
    for (std::size_t i = 0; i < n; i++) {
        if (cells_[i] != 0) continue;
        bool on_edge = false;
        for (std::size_t d = 0; d < nn; d++) {
            if (nbr_[i * nn + d] < 0) { on_edge = true; break; }
        }
        if (on_edge) {
            exterior_[i] = 1;
            stack.push_back(i);
        }
    }
    while (!stack.empty()) {
        std::size_t i = stack.back();
        stack.pop_back();
        for (std::size_t d = 0; d < nn; d++) {
            long j = nbr_[i * nn + d];
            if (j < 0) continue;
            if (cells_[j] != 0 || exterior_[j]) continue;
            exterior_[j] = 1;
            stack.push_back((std::size_t)j);
        }
    }

    enclosed_.assign(n, 0);
    enclosed_count_ = 0;
    for (std::size_t i = 0; i < n; i++) {
        if (cells_[i] == 0 && !exterior_[i]) {
            enclosed_[i] = 1;
            enclosed_count_++;
        }
    }

    // Label enclosed components in first-seen flat order.
    labels_.assign(n, 0);
    region_count_ = 0;
    for (std::size_t s = 0; s < n; s++) {
        if (!enclosed_[s] || labels_[s]) continue;
        uint32_t label = (uint32_t)++region_count_;
        labels_[s] = label;
        stack.push_back(s);
        while (!stack.empty()) {
            std::size_t i = stack.back();
            stack.pop_back();
            for (std::size_t d = 0; d < nn; d++) {
                long j = nbr_[i * nn + d];
                if (j < 0) continue;
                if (!enclosed_[j] || labels_[j]) continue;
                labels_[j] = label;
                stack.push_back((std::size_t)j);
            }
        }
    }

    have_enclosure_ = true;
}

bool NdShape::is_closed() const {
    compute_enclosure();
    return enclosed_count_ > 0;
}

const std::vector<uint8_t>& NdShape::enclosed_mask() const {
    compute_enclosure();
    return enclosed_;
}

const std::vector<uint8_t>& NdShape::exterior_mask() const {
    compute_enclosure();
    return exterior_;
}

std::size_t NdShape::enclosed_count() const {
    compute_enclosure();
    return enclosed_count_;
}

const std::vector<uint32_t>& NdShape::region_labels() const {
    compute_enclosure();
    return labels_;
}

std::size_t NdShape::region_count() const {
    compute_enclosure();
    return region_count_;
}

// ============================================================
// Intensity
// ============================================================
void NdShape::fill_intensity(const Distribution& dist, const Coordinates& coords) {
    if (!dist.accepts(dimensions())) {
        std::ostringstream msg;
        msg << dist.name() << " takes " << dist.variables().size()
            << " coordinate(s) but the shape has " << dimensions() << " dimensions";
        throw std::invalid_argument(msg.str());
    }

    Coordinates axes = resolve(coords, extents_);
    std::string key = dist.cache_key();
    uint64_t fp = fingerprint(axes);
    if (have_intensity_ && key == intensity_key_ && fp == intensity_coords_)
        return;

    const std::size_t nd = dimensions();
    intensity_.assign(size(), 0.0);
    have_intensity_ = false;

    std::vector<std::size_t> m(nd, 0);
    std::vector<double> point(nd);
    for (std::size_t k = 0; k < nd; k++) point[k] = axes[k][0];

    for (std::size_t i = 0; i < size(); i++) {
        intensity_[i] = dist.evaluate(point);

        for (std::size_t k = nd; k-- > 0;) {
            if (++m[k] < extents_[k]) {
                point[k] = axes[k][m[k]];
                break;
            }
            m[k] = 0;
            point[k] = axes[k][0];
        }
    }

    intensity_key_ = std::move(key);
    intensity_coords_ = fp;
    have_intensity_ = true;
    fill_count_++;
}

double NdShape::get_flux(const Distribution& dist, const Coordinates& coords, FluxRegion region) {
    if (!is_closed()) {
        std::cerr << "warning: Shape is not closed. Flux is ill-defined for border shapes. "
                  << "Returning 0.0.\n";
        return 0.0;
    }

    fill_intensity(dist, coords);

    double flux = 0.0;
    for (std::size_t i = 0; i < size(); i++) {
        bool counted = (region == FluxRegion::interior)
            ? enclosed_[i] != 0
            : exterior_[i] == 0;
        if (counted) flux += intensity_[i];
    }
    return flux;
}

std::vector<double> NdShape::region_fluxes(const Distribution& dist, const Coordinates& coords) {
    if (!is_closed()) {
        std::cerr << "warning: Shape is not closed. No enclosed regions to integrate.\n";
        return {};
    }

    fill_intensity(dist, coords);

    std::vector<double> out(region_count_, 0.0);
    for (std::size_t i = 0; i < size(); i++) {
        if (labels_[i]) out[labels_[i] - 1] += intensity_[i];
    }
    return out;
}

IntensityStats NdShape::summarize_intensity() const {
    IntensityStats st;
    if (!have_intensity_) return st;
    compute_enclosure();

    std::vector<double> vals;
    vals.reserve(enclosed_count_);
    for (std::size_t i = 0; i < size(); i++)
        if (enclosed_[i]) vals.push_back(intensity_[i]);
    if (vals.empty()) return st;

    st.count = vals.size();
    st.min = vals[0];
    st.max = vals[0];
    for (double v : vals) {
        st.sum += v;
        st.min = std::min(st.min, v);
        st.max = std::max(st.max, v);
    }
    st.mean = st.sum / double(st.count);

    auto q_at = [&](double q) -> double {
        std::size_t k = (std::size_t)std::floor(q * double(vals.size() - 1));
        std::nth_element(vals.begin(), vals.begin() + k, vals.end());
        return vals[k];
    };
    st.q50 = q_at(0.50);
    st.q95 = q_at(0.95);
    return st;
}

} // namespace fluxed
