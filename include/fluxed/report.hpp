#ifndef FLUXED_REPORT_HPP
#define FLUXED_REPORT_HPP

#include "fluxed/match.hpp"
#include "fluxed/shape.hpp"

#include <ostream>
#include <string>

namespace fluxed {

// "slope=2;intercept=0.5"
std::string format_parameters(const ParameterList& p);

void print_shape_summary(std::ostream& os, const std::string& label, const NdShape& shape);
void print_intensity_stats(std::ostream& os, const IntensityStats& st);
void print_match_result(std::ostream& os, const MatchResult& r);

struct ResultRow {
    std::string mode;
    std::string source_shape;
    std::string target_shape;
    std::string target_dist;
    double source_flux = 0.0;
    const MatchResult* match = nullptr; // null for flux-only runs
};

// Appends one row, writing the header first when the file is new.
bool append_result_csv(const std::string& path, const ResultRow& row);

} // namespace fluxed

#endif // FLUXED_REPORT_HPP
