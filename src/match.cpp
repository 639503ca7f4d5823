#include "fluxed/match.hpp"
#include "fluxed/hash.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

namespace fluxed {

static void validate(const NdShape& target_shape,
                     const DistributionFamily& family,
                     const std::vector<std::string>& names,
                     const std::vector<double>& guess,
                     const MatchSettings& settings) {
    if (names.empty())
        throw std::invalid_argument("At least one parameter must be fitted.");
    if (guess.size() != names.size())
        throw std::invalid_argument("initial_guess must have one value per parameter name.");
    if (!settings.bounds.empty() && settings.bounds.size() != names.size())
        throw std::invalid_argument("bounds must be empty or have one entry per parameter name.");

    std::set<std::string> seen;
    for (const auto& n : names) {
        if (family.index_of(n) < 0)
            throw std::invalid_argument("Unknown parameter '" + n + "' for family " + family.name);
        if (!seen.insert(n).second)
            throw std::invalid_argument("Parameter '" + n + "' listed twice.");
    }
    for (const auto& [k, v] : settings.fixed) {
        (void)v;
        if (family.index_of(k) < 0)
            throw std::invalid_argument("Unknown fixed parameter '" + k + "' for family " + family.name);
        if (seen.count(k))
            throw std::invalid_argument("Parameter '" + k + "' is both fitted and fixed.");
    }
    for (std::size_t i = 0; i < settings.bounds.size(); i++) {
        const Bound& b = settings.bounds[i];
        if (std::isnan(b.lower) || std::isnan(b.upper) || b.lower > b.upper)
            throw std::invalid_argument("Invalid bounds for parameter '" + names[i] + "'.");
    }

    if (!target_shape.is_closed())
        throw std::invalid_argument("Target shape is not closed; its flux cannot depend on parameters.");

    DistributionPtr sample = bind_axes(make_distribution(family, settings.fixed), settings.target_axes);
    if (!sample->accepts(target_shape.dimensions())) {
        throw std::invalid_argument(family.name + " cannot be evaluated on the " +
                                    std::to_string(target_shape.dimensions()) +
                                    "-dimensional target shape; bind it to axes.");
    }
}

static ParameterList assemble(const std::vector<std::string>& names,
                              const Eigen::VectorXd& x,
                              const ParameterList& fixed) {
    ParameterList p = fixed;
    for (std::size_t i = 0; i < names.size(); i++)
        p.emplace_back(names[i], x[(Eigen::Index)i]);
    return p;
}

MatchResult match_flux_parameters(NdShape& source_shape,
                                  const Distribution& source_dist,
                                  NdShape& target_shape,
                                  const DistributionFamily& target_family,
                                  const std::vector<std::string>& param_names,
                                  const std::vector<double>& initial_guess,
                                  const MatchSettings& settings) {
    validate(target_shape, target_family, param_names, initial_guess, settings);

    const Eigen::Index n = (Eigen::Index)param_names.size();
    Eigen::VectorXd lower(n), upper(n), x0(n);
    for (Eigen::Index i = 0; i < n; i++) {
        Bound b = settings.bounds.empty() ? Bound() : settings.bounds[(std::size_t)i];
        lower[i] = b.lower;
        upper[i] = b.upper;
        x0[i] = initial_guess[(std::size_t)i];
    }

    MatchResult result;
    result.target_flux = source_shape.get_flux(source_dist, settings.source_coords);

    const double target = result.target_flux;
    Objective objective = [&](const Eigen::VectorXd& x) -> double {
        DistributionPtr d;
        try {
            d = bind_axes(make_distribution(target_family, assemble(param_names, x, settings.fixed)),
                          settings.target_axes);
        } catch (const std::invalid_argument&) {
            // Parameter values the family rejects (e.g. stddev <= 0).
            return std::numeric_limits<double>::infinity();
        }
        double r = target_shape.get_flux(*d, settings.target_coords) - target;
        return r * r;
    };

    const MinimizeOptions& mopt = settings.options.minimize;
    MinimizeResult best = minimize_box(objective, x0, lower, upper, mopt);
    int evaluations = best.evaluations;
    int iterations = best.iterations;
    result.starts = 1;

    // Deterministic multi-start: uniform inside finite boxes, otherwise a
    // spread around the initial guess.
    SplitMix64 rng(hash_u64(settings.options.seed));
    Eigen::VectorXd centre = clip(x0, lower, upper);
    for (int r = 0; r < settings.options.restarts; r++) {
        Eigen::VectorXd xs(n);
        for (Eigen::Index i = 0; i < n; i++) {
            if (std::isfinite(lower[i]) && std::isfinite(upper[i])) {
                xs[i] = lower[i] + (upper[i] - lower[i]) * rng.next_f01();
            } else {
                double scale = std::max(1.0, std::abs(centre[i]));
                xs[i] = centre[i] + scale * rng.next_f11();
            }
        }

        MinimizeResult trial = minimize_box(objective, xs, lower, upper, mopt);
        evaluations += trial.evaluations;
        iterations += trial.iterations;
        result.starts++;

        if (mopt.disp) {
            std::cout << "restart=" << (r + 1) << " f=" << trial.f
                      << " success=" << trial.success << "\n";
        }

        bool better = (trial.success && !best.success) ||
                      (trial.success == best.success && trial.f < best.f);
        if (better) best = trial;
    }

    result.success = best.success;
    result.message = best.message;
    result.objective = best.f;
    result.iterations = iterations;
    result.evaluations = evaluations;
    for (Eigen::Index i = 0; i < n; i++)
        result.parameters.emplace_back(param_names[(std::size_t)i], best.x[i]);

    if (std::isfinite(best.f)) {
        DistributionPtr final_dist = fitted_distribution(target_family, result, settings);
        result.final_flux = target_shape.get_flux(*final_dist, settings.target_coords);
    } else {
        result.final_flux = std::numeric_limits<double>::quiet_NaN();
    }
    return result;
}

DistributionPtr fitted_distribution(const DistributionFamily& family,
                                    const MatchResult& result,
                                    const MatchSettings& settings) {
    ParameterList p = settings.fixed;
    p.insert(p.end(), result.parameters.begin(), result.parameters.end());
    return bind_axes(make_distribution(family, p), settings.target_axes);
}

} // namespace fluxed
