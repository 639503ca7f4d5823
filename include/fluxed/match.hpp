#ifndef FLUXED_MATCH_HPP
#define FLUXED_MATCH_HPP

#include "fluxed/distribution.hpp"
#include "fluxed/optimize.hpp"
#include "fluxed/shape.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace fluxed {

struct Bound {
    double lower = -std::numeric_limits<double>::infinity();
    double upper = std::numeric_limits<double>::infinity();
};

struct MatchOptions {
    MinimizeOptions minimize;
    int restarts = 0;      // extra random starts after the initial guess
    uint64_t seed = 15ull;
};

struct MatchSettings {
    Coordinates source_coords;
    Coordinates target_coords;
    std::vector<Bound> bounds;            // empty = unbounded
    std::vector<std::size_t> target_axes; // bind the target family to these axes
    ParameterList fixed;                  // target parameters held constant
    MatchOptions options;
};

struct MatchResult {
    bool success = false;
    std::string message;
    ParameterList parameters;
    double target_flux = 0.0; // source flux the target was fitted to
    double final_flux = 0.0;
    double objective = 0.0;
    int iterations = 0;
    int evaluations = 0;
    int starts = 0;
};

// Fit target-family parameters so the target shape's flux equals the
// source shape's flux. Minimises (flux_target(params) - flux_source)^2 over param_names, starting
// at initial_guess and staying inside settings.bounds. Parameters of the family
// not listed take settings.fixed values or the family defaults.
// Throws std::invalid_argument on inconsistent names, guesses or bounds, or
// when the target shape encloses nothing.
MatchResult match_flux_parameters(NdShape& source_shape,
                                  const Distribution& source_dist,
                                  NdShape& target_shape,
                                  const DistributionFamily& target_family,
                                  const std::vector<std::string>& param_names,
                                  const std::vector<double>& initial_guess,
                                  const MatchSettings& settings = MatchSettings());

// Distribution built from a result, bound to the same axes as the fit.
DistributionPtr fitted_distribution(const DistributionFamily& family,
                                    const MatchResult& result,
                                    const MatchSettings& settings);

} // namespace fluxed

#endif // FLUXED_MATCH_HPP
