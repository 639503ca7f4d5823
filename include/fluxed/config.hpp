#ifndef FLUXED_CONFIG_HPP
#define FLUXED_CONFIG_HPP

#include "fluxed/coordinates.hpp"
#include "fluxed/distribution.hpp"
#include "fluxed/match.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fluxed {

// ============================================================
// Run parameters (key = value file, overridable with --set)
// ============================================================
struct RunParams {
    std::string mode = "match"; // flux | match

    // Source: the reference flux.
    std::string source_shape;
    std::string source_dist = "normal2d";
    std::string source_params;   // "mean_x=1.5,mean_y=4.5"
    std::string source_axes;     // "0,1"; empty = distribution takes every axis
    std::string source_coords;   // "linspace:-10:10;linspace:-10:10"

    // Target: the shape whose distribution is fitted.
    std::string target_shape;
    std::string target_dist = "linear1d";
    std::string target_params;   // values held fixed
    std::string target_axes;
    std::string target_coords;

    std::string fit_params;      // "slope,intercept"
    std::string initial_guess;   // "0,1"
    std::string bounds;          // "0.001:inf;-10:10"

    // Optimiser
    double ftol = 2.220446049250313e-09;
    double gtol = 1e-5;
    int max_iterations = 15000;
    int max_evaluations = 15000;
    int history = 10;
    int max_line_search = 20;
    int restarts = 0;
    uint64_t seed = 15ull;
    bool disp = false;

    // Output
    std::string results_csv;
    std::string dump_path;

    // Directory of the loaded params file; relative shape paths resolve
    // against it.
    std::string base_dir;

    bool load_from_file(const std::string& path);
    bool set_param(const std::string& key, const std::string& val);

    std::string resolve_path(const std::string& spec) const;

    MatchOptions match_options() const;
};

// ============================================================
// Value parsers; all throw std::invalid_argument on bad input
// ============================================================
double parse_double(const std::string& s);
std::vector<double> parse_doubles(const std::string& s);
std::vector<std::string> parse_names(const std::string& s);
std::vector<std::size_t> parse_axes(const std::string& s);
ParameterList parse_parameters(const std::string& s);

// "lo:hi;lo:hi"; an empty side, "none" or "inf" means unbounded.
std::vector<Bound> parse_bounds(const std::string& s);

// Per-axis coordinate spec separated by ';'
// index              0..n-1
// linspace:lo:hi     n evenly spaced values
// arange:start:step  start + k*step
// values:a,b,c       explicit values
// n is the extent of the axis. An empty spec means integer indices.
Coordinates parse_coordinates(const std::string& s, const Extents& extents);

} // namespace fluxed

#endif // FLUXED_CONFIG_HPP
