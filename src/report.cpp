#include "fluxed/report.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fluxed {

std::string format_parameters(const ParameterList& p) {
    std::ostringstream os;
    os.precision(10);
    for (std::size_t i = 0; i < p.size(); i++) {
        if (i) os << ";";
        os << p[i].first << "=" << p[i].second;
    }
    return os.str();
}

void print_shape_summary(std::ostream& os, const std::string& label, const NdShape& shape) {
    os << label << ":"
       << " dims=" << shape.dimensions()
       << " extents=";
    for (std::size_t k = 0; k < shape.dimensions(); k++)
        os << (k ? "x" : "") << shape.extents()[k];
    os << " border=" << shape.border_count()
       << " enclosed=" << shape.enclosed_count()
       << " regions=" << shape.region_count()
       << " closed=" << (shape.is_closed() ? "yes" : "no")
       << "\n";
}

void print_intensity_stats(std::ostream& os, const IntensityStats& st) {
    os << "intensity:"
       << " n=" << st.count
       << std::fixed << std::setprecision(6)
       << " sum=" << st.sum
       << " mean=" << st.mean
       << " min=" << st.min
       << " max=" << st.max
       << " q50=" << st.q50
       << " q95=" << st.q95
       << std::defaultfloat << "\n";
}

void print_match_result(std::ostream& os, const MatchResult& r) {
    os << "success=" << (r.success ? "true" : "false")
       << " message=" << r.message << "\n"
       << std::fixed << std::setprecision(4)
       << "target_flux=" << r.target_flux
       << " final_flux=" << r.final_flux << "\n"
       << std::scientific << std::setprecision(3)
       << "objective=" << r.objective
       << std::defaultfloat
       << " iterations=" << r.iterations
       << " evaluations=" << r.evaluations
       << " starts=" << r.starts << "\n"
       << "parameters: " << format_parameters(r.parameters) << "\n";
}

bool append_result_csv(const std::string& path, const ResultRow& row) {
    bool exists = false;
    {
        std::ifstream f(path);
        exists = f.good();
    }

    std::ofstream out(path, std::ios::app);
    if (!out) {
        std::cerr << "Could not open results file: " << path << "\n";
        return false;
    }

    // Header (only once)
    if (!exists) {
        out
            << "mode,source_shape,target_shape,target_dist,"
            << "source_flux,final_flux,objective,success,"
            << "iterations,evaluations,parameters\n";
    }

    out.precision(12);
    out
        << row.mode << ","
        << row.source_shape << ","
        << row.target_shape << ","
        << row.target_dist << ","
        << row.source_flux << ",";

    if (row.match) {
        out
            << row.match->final_flux << ","
            << row.match->objective << ","
            << (row.match->success ? 1 : 0) << ","
            << row.match->iterations << ","
            << row.match->evaluations << ","
            << format_parameters(row.match->parameters);
    } else {
        out << ",,,,,";
    }
    out << "\n";

    return (bool)out;
}

} // namespace fluxed
