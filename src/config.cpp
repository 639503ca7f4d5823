#include "fluxed/config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fluxed {

static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return std::string();
    return s.substr(a, b - a + 1);
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string tok;
    std::istringstream ss(s);
    while (std::getline(ss, tok, sep)) out.push_back(trim(tok));
    if (!s.empty() && s.back() == sep) out.push_back(std::string());
    return out;
}

// ============================================================
// RunParams
// ============================================================
bool RunParams::load_from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "Could not open params file: " << path << "\n";
        return false;
    }

    auto slash = path.find_last_of('/');
    base_dir = (slash == std::string::npos) ? std::string() : path.substr(0, slash);

    std::unordered_map<std::string, std::string> kv;
    std::vector<std::string> order;
    std::string line;

    while (std::getline(f, line)) {
        // strip comments
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (key.empty()) continue;
        if (!kv.count(key)) order.push_back(key);
        kv[key] = val;
    }

    for (const auto& key : order) {
        try {
            if (!set_param(key, kv[key]))
                std::cerr << "Ignoring unknown parameter in " << path << ": " << key << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Bad value for " << key << " in " << path << ": " << e.what() << "\n";
            return false;
        }
    }
    return true;
}

bool RunParams::set_param(const std::string& key, const std::string& val) {
    auto to_f = [&](double& x) { x = parse_double(val); };
    auto to_i = [&](int& x) {
        std::size_t used = 0;
        x = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument("not an integer: " + val);
    };
    auto to_u64 = [&](uint64_t& x) {
        std::size_t used = 0;
        x = std::stoull(val, &used);
        if (used != val.size()) throw std::invalid_argument("not an integer: " + val);
    };
    auto to_b = [&](bool& x) {
        x = (val == "1" || val == "true" || val == "True");
    };

    if (key == "mode") {
        if (val != "flux" && val != "match")
            throw std::invalid_argument("mode must be 'flux' or 'match', got '" + val + "'");
        mode = val;
        return true;
    }

    // Source
    if (key == "source_shape")  { source_shape = val; return true; }
    if (key == "source_dist")   { source_dist = val; return true; }
    if (key == "source_params") { source_params = val; return true; }
    if (key == "source_axes")   { source_axes = val; return true; }
    if (key == "source_coords") { source_coords = val; return true; }

    // Target
    if (key == "target_shape")  { target_shape = val; return true; }
    if (key == "target_dist")   { target_dist = val; return true; }
    if (key == "target_params") { target_params = val; return true; }
    if (key == "target_axes")   { target_axes = val; return true; }
    if (key == "target_coords") { target_coords = val; return true; }

    // Fit
    if (key == "fit_params")    { fit_params = val; return true; }
    if (key == "initial_guess") { initial_guess = val; return true; }
    if (key == "bounds")        { bounds = val; return true; }

    // Optimiser
    if (key == "ftol")            { to_f(ftol); return true; }
    if (key == "gtol")            { to_f(gtol); return true; }
    if (key == "max_iterations")  { to_i(max_iterations); return true; }
    if (key == "max_evaluations") { to_i(max_evaluations); return true; }
    if (key == "history")         { to_i(history); return true; }
    if (key == "max_line_search") { to_i(max_line_search); return true; }
    if (key == "restarts")        { to_i(restarts); return true; }
    if (key == "seed")            { to_u64(seed); return true; }
    if (key == "disp")            { to_b(disp); return true; }

    // Output
    if (key == "results_csv") { results_csv = val; return true; }
    if (key == "dump_path")   { dump_path = val; return true; }

    return false;
}

std::string RunParams::resolve_path(const std::string& spec) const {
    if (spec.empty() || base_dir.empty() || spec[0] == '/' ||
        spec.compare(0, 4, "box:") == 0)
        return spec;
    return base_dir + "/" + spec;
}

MatchOptions RunParams::match_options() const {
    MatchOptions o;
    o.minimize.ftol = ftol;
    o.minimize.gtol = gtol;
    o.minimize.max_iterations = max_iterations;
    o.minimize.max_evaluations = max_evaluations;
    o.minimize.history = history;
    o.minimize.max_line_search = max_line_search;
    o.minimize.disp = disp;
    o.restarts = restarts;
    o.seed = seed;
    return o;
}

// ============================================================
// Parsers
// ============================================================
double parse_double(const std::string& s) {
    std::string t = trim(s);
    if (t == "inf" || t == "+inf") return std::numeric_limits<double>::infinity();
    if (t == "-inf") return -std::numeric_limits<double>::infinity();

    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(t, &used);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("number out of range: '" + t + "'");
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("not a number: '" + t + "'");
    }
    if (used != t.size())
        throw std::invalid_argument("not a number: '" + t + "'");
    return v;
}

std::vector<double> parse_doubles(const std::string& s) {
    std::vector<double> out;
    if (trim(s).empty()) return out;
    for (const auto& tok : split(s, ',')) out.push_back(parse_double(tok));
    return out;
}

std::vector<std::string> parse_names(const std::string& s) {
    std::vector<std::string> out;
    if (trim(s).empty()) return out;
    for (const auto& tok : split(s, ',')) {
        if (tok.empty()) throw std::invalid_argument("empty name in list '" + s + "'");
        out.push_back(tok);
    }
    return out;
}

std::vector<std::size_t> parse_axes(const std::string& s) {
    std::vector<std::size_t> out;
    for (double v : parse_doubles(s)) {
        if (!std::isfinite(v) || v < 0.0 || v != std::floor(v))
            throw std::invalid_argument("axis must be a non-negative integer in '" + s + "'");
        out.push_back((std::size_t)v);
    }
    return out;
}

ParameterList parse_parameters(const std::string& s) {
    ParameterList out;
    if (trim(s).empty()) return out;
    for (const auto& tok : split(s, ',')) {
        auto eq = tok.find('=');
        if (eq == std::string::npos)
            throw std::invalid_argument("expected name=value, got '" + tok + "'");
        std::string name = trim(tok.substr(0, eq));
        if (name.empty())
            throw std::invalid_argument("missing parameter name in '" + tok + "'");
        out.emplace_back(name, parse_double(tok.substr(eq + 1)));
    }
    return out;
}

std::vector<Bound> parse_bounds(const std::string& s) {
    std::vector<Bound> out;
    if (trim(s).empty()) return out;

    auto side = [](const std::string& t, double unbounded) {
        std::string v = trim(t);
        if (v.empty() || v == "none" || v == "None") return unbounded;
        return parse_double(v);
    };

    for (const auto& tok : split(s, ';')) {
        auto colon = tok.find(':');
        if (colon == std::string::npos)
            throw std::invalid_argument("expected lo:hi, got '" + tok + "'");
        Bound b;
        b.lower = side(tok.substr(0, colon), -std::numeric_limits<double>::infinity());
        b.upper = side(tok.substr(colon + 1), std::numeric_limits<double>::infinity());
        if (b.lower > b.upper)
            throw std::invalid_argument("lower bound above upper bound in '" + tok + "'");
        out.push_back(b);
    }
    return out;
}

Coordinates parse_coordinates(const std::string& s, const Extents& extents) {
    if (trim(s).empty()) return {};

    std::vector<std::string> axes = split(s, ';');
    if (axes.size() != extents.size()) {
        std::ostringstream msg;
        msg << "coordinate spec has " << axes.size() << " axes, shape has " << extents.size();
        throw std::invalid_argument(msg.str());
    }

    Coordinates out;
    for (std::size_t k = 0; k < axes.size(); k++) {
        const std::string& a = axes[k];
        std::size_t n = extents[k];
        std::vector<std::string> parts = split(a, ':');
        const std::string& kind = parts.empty() ? a : parts[0];

        if (kind == "index" && parts.size() == 1) {
            out.push_back(indices(n));
        } else if (kind == "linspace" && parts.size() == 3) {
            out.push_back(linspace(parse_double(parts[1]), parse_double(parts[2]), n));
        } else if (kind == "arange" && parts.size() == 3) {
            double start = parse_double(parts[1]);
            double step = parse_double(parts[2]);
            Axis axis(n);
            for (std::size_t i = 0; i < n; i++) axis[i] = start + step * double(i);
            out.push_back(axis);
        } else if (kind == "values" && parts.size() == 2) {
            out.push_back(parse_doubles(parts[1]));
        } else {
            throw std::invalid_argument("bad coordinate spec for axis " + std::to_string(k) + ": '" + a + "'");
        }
    }
    return resolve(out, extents);
}

} // namespace fluxed
