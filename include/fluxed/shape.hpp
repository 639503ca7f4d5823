#ifndef FLUXED_SHAPE_HPP
#define FLUXED_SHAPE_HPP

#include "fluxed/coordinates.hpp"
#include "fluxed/distribution.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fluxed {

// Which cells a flux sums over.
enum class FluxRegion {
    interior, // enclosed empty cells only
    filled    // enclosed cells plus the border (hole-filled shape)
};

struct IntensityStats {
    std::size_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double q50 = 0.0;
    double q95 = 0.0;
};

// N-dimensional shape: a border of 1s in a row-major grid of 0s (axis 0
// slowest). The intensity field is cached per distribution key and coords.
class NdShape {
public:
    // Row-major 0/1 values. Throws std::invalid_argument on bad extents,
    // a count mismatch or any other value.
    NdShape(Extents extents, const std::vector<int>& values);

    // Largest grid the shape accepts.
    static constexpr std::size_t MAX_CELLS = std::size_t(1) << 28;

    // Product of extents. Throws std::invalid_argument when extents are empty
    // or zero, or the product exceeds MAX_CELLS.
    static std::size_t cell_count(const Extents& extents);

    // Border shell one cell thick around an empty interior.
    static NdShape hollow_box(const Extents& extents);

    const Extents& extents() const { return extents_; }
    std::size_t dimensions() const { return extents_.size(); }
    std::size_t size() const { return cells_.size(); }

    std::size_t index(const std::vector<std::size_t>& multi) const;
    std::vector<std::size_t> unravel(std::size_t flat) const;

    uint8_t at(std::size_t flat) const { return cells_[flat]; }
    uint8_t at(const std::vector<std::size_t>& multi) const { return cells_[index(multi)]; }
    const std::vector<uint8_t>& cells() const { return cells_; }

    std::size_t border_count() const;

    // Face neighbour of cell i along direction d (axis d/2, +1 when d is
    // even, -1 when odd); -1 outside the grid.
    long neighbor(std::size_t i, std::size_t d) const { return nbr_[i * 2 * dimensions() + d]; }

    // --------------------------------------------------------
    // Enclosure (cached after first use)
    // --------------------------------------------------------
    bool is_closed() const;
    const std::vector<uint8_t>& enclosed_mask() const;
    const std::vector<uint8_t>& exterior_mask() const;
    std::size_t enclosed_count() const;

    // 0 outside enclosed regions, 1..region_count() inside.
    const std::vector<uint32_t>& region_labels() const;
    std::size_t region_count() const;

    // --------------------------------------------------------
    // Intensity and flux
    // --------------------------------------------------------
    // Evaluate dist at every cell. Empty coords use integer indices.
    void fill_intensity(const Distribution& dist, const Coordinates& coords = {});

    const std::vector<double>& intensity() const { return intensity_; }
    bool has_intensity() const { return have_intensity_; }

    // 0.0 and a warning on std::cerr when the shape is not closed.
    double get_flux(const Distribution& dist, const Coordinates& coords = {},
                    FluxRegion region = FluxRegion::interior);

    // Flux of each enclosed component, indexed by label - 1.
    std::vector<double> region_fluxes(const Distribution& dist, const Coordinates& coords = {});

    // Summary of the current intensity field over the enclosed cells.
    IntensityStats summarize_intensity() const;

    // Number of times fill_intensity actually evaluated the distribution.
    uint64_t fill_count() const { return fill_count_; }

private:
    void build_neighbors();
    void compute_enclosure() const;

    Extents extents_;
    std::vector<std::size_t> strides_;
    std::vector<uint8_t> cells_;
    std::vector<long> nbr_; // size() * 2N, -1 = out of bounds

    mutable bool have_enclosure_ = false;
    mutable std::vector<uint8_t> exterior_;
    mutable std::vector<uint8_t> enclosed_;
    mutable std::vector<uint32_t> labels_;
    mutable std::size_t enclosed_count_ = 0;
    mutable std::size_t region_count_ = 0;

    std::vector<double> intensity_;
    bool have_intensity_ = false;
    std::string intensity_key_;
    uint64_t intensity_coords_ = 0;
    uint64_t fill_count_ = 0;
};

} // namespace fluxed

#endif // FLUXED_SHAPE_HPP
