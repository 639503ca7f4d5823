// fluxed: flux of an intensity distribution through N-dimensional shapes,
// and inverse modelling of distribution parameters to match a reference flux.
//
// example:
// fluxed --params configs/donut_to_cube.params --set disp=1 --csv results.csv

#include "fluxed/config.hpp"
#include "fluxed/match.hpp"
#include "fluxed/report.hpp"
#include "fluxed/shape.hpp"
#include "fluxed/shape_io.hpp"

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace fluxed;

static const DistributionFamily& require_family(const std::string& name) {
    const DistributionFamily* f = find_family(name);
    if (!f) {
        std::string known;
        for (const auto& b : builtin_families()) known += (known.empty() ? "" : ", ") + b.name;
        throw std::invalid_argument("Unknown distribution '" + name + "' (known: " + known + ")");
    }
    return *f;
}

// Same tolerance rule as numpy.isclose.
static bool is_close(double a, double b, double rtol = 1e-5, double atol = 1e-8) {
    return std::abs(a - b) <= atol + rtol * std::abs(b);
}

static int run(const RunParams& p, const std::string& csv_path) {
    std::unique_ptr<NdShape> source;
    if (p.source_shape.empty()) {
        std::cerr << "source_shape is not set\n";
        return 1;
    }
    if (!parse_shape_spec(p.resolve_path(p.source_shape), source)) return 1;

    const DistributionFamily& source_family = require_family(p.source_dist);
    DistributionPtr source_dist = bind_axes(
        make_distribution(source_family, parse_parameters(p.source_params)),
        parse_axes(p.source_axes));
    Coordinates source_coords = parse_coordinates(p.source_coords, source->extents());

    print_shape_summary(std::cout, "source", *source);
    double source_flux = source->get_flux(*source_dist, source_coords);
    std::cout << "source_dist=" << source_dist->describe() << "\n"
              << "source_flux=" << std::fixed << std::setprecision(6) << source_flux
              << std::defaultfloat << "\n";
    if (source->has_intensity())
        print_intensity_stats(std::cout, source->summarize_intensity());

    if (!p.dump_path.empty() && source->has_intensity()) {
        if (!dump_intensity(p.dump_path, *source)) {
            std::cerr << "Failed to dump intensity to " << p.dump_path << "\n";
            return 1;
        }
    }

    ResultRow row;
    row.mode = p.mode;
    row.source_shape = p.source_shape;
    row.source_flux = source_flux;

    MatchResult result;
    bool verified = true;

    if (p.mode == "match") {
        std::unique_ptr<NdShape> target;
        if (p.target_shape.empty()) {
            std::cerr << "target_shape is not set\n";
            return 1;
        }
        if (!parse_shape_spec(p.resolve_path(p.target_shape), target)) return 1;
        print_shape_summary(std::cout, "target", *target);

        const DistributionFamily& family = require_family(p.target_dist);

        MatchSettings settings;
        settings.source_coords = source_coords;
        settings.target_coords = parse_coordinates(p.target_coords, target->extents());
        settings.bounds = parse_bounds(p.bounds);
        settings.target_axes = parse_axes(p.target_axes);
        settings.fixed = parse_parameters(p.target_params);
        settings.options = p.match_options();

        std::vector<std::string> names = parse_names(p.fit_params);
        std::vector<double> guess = parse_doubles(p.initial_guess);

        result = match_flux_parameters(*source, *source_dist, *target, family,
                                       names, guess, settings);

        std::cout << "\n--- OPTIMIZATION FINISHED ---\n";
        print_match_result(std::cout, result);

        if (std::isfinite(result.final_flux)) {
            DistributionPtr fitted = fitted_distribution(family, result, settings);
            double check = target->get_flux(*fitted, settings.target_coords);
            verified = is_close(check, result.target_flux);
            std::cout << "verification_flux=" << std::fixed << std::setprecision(4) << check
                      << std::defaultfloat
                      << (verified ? " Verification PASSED" : " Verification FAILED")
                      << "\n";
            if (!verified) {
                std::cout << "difference=" << std::abs(check - result.target_flux) << "\n";
            }
        } else {
            verified = false;
        }

        row.target_shape = p.target_shape;
        row.target_dist = p.target_dist;
        row.match = &result;
    }

    if (!csv_path.empty()) {
        if (!append_result_csv(csv_path, row)) return 1;
    }

    if (p.mode == "match" && (!result.success || !verified)) return 2;
    return 0;
}

// ============================================================
// Main
// ============================================================
int main(int argc, char** argv) {

    RunParams p;

    std::string param_file;
    std::string csv_path;
    std::string mode;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i=1; i<argc; i++) {
        std::string a = argv[i];
        if (a == "--params" && i+1 < argc) param_file = argv[++i];
        else if (a == "--csv" && i+1 < argc) csv_path = argv[++i];
        else if (a == "--mode" && i+1 < argc) mode = argv[++i];
        else if (a == "--set" && i+1 < argc) {
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Bad --set format, expected key=value\n";
                return 1;
            }
            overrides.emplace_back(
                kv.substr(0, eq),
                kv.substr(eq + 1)
            );
        }
        else if (a == "--help" || a == "-h") {
            std::cout << "usage: fluxed [--params FILE] [--set key=value]... "
                      << "[--mode flux|match] [--csv FILE]\n";
            return 0;
        }
        else {
            std::cerr << "Unknown argument: " << a << "\n";
            return 1;
        }
    }

    try {
        if (!param_file.empty()) {
            if (!p.load_from_file(param_file)) {
                std::cerr << "Failed to load params\n";
                return 1;
            }
        }

        for (auto& [k, v] : overrides) {
            if (!p.set_param(k, v)) {
                std::cerr << "Unknown parameter: " << k << "\n";
                return 1;
            }
        }
        if (!mode.empty() && !p.set_param("mode", mode)) return 1;
        if (csv_path.empty()) csv_path = p.results_csv;

        return run(p, csv_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
