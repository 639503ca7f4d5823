#include "fluxed/optimize.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace fluxed {

namespace {

constexpr double kEps = std::numeric_limits<double>::epsilon();
constexpr double kArmijo = 1e-4;

struct Counted {
    const Objective& f;
    int evaluations = 0;

    double operator()(const Eigen::VectorXd& x) {
        evaluations++;
        double v = f(x);
        return std::isfinite(v) ? v : std::numeric_limits<double>::infinity();
    }
};

// Central differences inside the box, one-sided next to a bound or next to a
// rejected (non-finite) point.
Eigen::VectorXd gradient(Counted& f, const Eigen::VectorXd& x, double fx,
                         const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
    const double base = std::cbrt(kEps);
    Eigen::VectorXd g(x.size());
    Eigen::VectorXd trial = x;

    for (Eigen::Index i = 0; i < x.size(); i++) {
        double h = base * std::max(1.0, std::abs(x[i]));
        double room_up = upper[i] - x[i];
        double room_dn = x[i] - lower[i];
        if (room_up < h && room_dn < h) {
            h = std::max(room_up, room_dn);
            if (!(h > 0.0)) { g[i] = 0.0; continue; }
        }

        double fp = std::numeric_limits<double>::infinity();
        double fm = std::numeric_limits<double>::infinity();
        if (room_up >= h) {
            trial[i] = x[i] + h;
            fp = f(trial);
        }
        if (room_dn >= h) {
            trial[i] = x[i] - h;
            fm = f(trial);
        }
        trial[i] = x[i];

        bool up = std::isfinite(fp), dn = std::isfinite(fm);
        if (up && dn)  g[i] = (fp - fm) / (2.0 * h);
        else if (up)   g[i] = (fp - fx) / h;
        else if (dn)   g[i] = (fx - fm) / h;
        else           g[i] = 0.0;
    }
    return g;
}

// Variables held at a bound by a gradient pointing out of the box.
Eigen::VectorXd free_mask(const Eigen::VectorXd& x, const Eigen::VectorXd& g,
                          const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
    Eigen::VectorXd m = Eigen::VectorXd::Ones(x.size());
    for (Eigen::Index i = 0; i < x.size(); i++) {
        bool at_lower = x[i] <= lower[i] && g[i] > 0.0;
        bool at_upper = x[i] >= upper[i] && g[i] < 0.0;
        if (at_lower || at_upper || lower[i] == upper[i]) m[i] = 0.0;
    }
    return m;
}

// Two-loop recursion restricted to the free variables.
Eigen::VectorXd lbfgs_direction(const Eigen::VectorXd& g, const Eigen::VectorXd& mask,
                                const std::deque<Eigen::VectorXd>& S,
                                const std::deque<Eigen::VectorXd>& Y) {
    const std::size_t m = S.size();
    std::vector<Eigen::VectorXd> s(m), y(m);
    std::vector<double> rho(m, 0.0), alpha(m, 0.0);
    double gamma = 1.0;
    bool have_gamma = false;

    for (std::size_t k = 0; k < m; k++) {
        s[k] = S[k].cwiseProduct(mask);
        y[k] = Y[k].cwiseProduct(mask);
        double sy = s[k].dot(y[k]);
        if (sy > kEps * y[k].squaredNorm()) {
            rho[k] = 1.0 / sy;
            gamma = sy / y[k].squaredNorm();
            have_gamma = true;
        }
    }
    if (!have_gamma) gamma = 1.0;

    Eigen::VectorXd q = g.cwiseProduct(mask);
    for (std::size_t k = m; k-- > 0;) {
        if (rho[k] == 0.0) continue;
        alpha[k] = rho[k] * s[k].dot(q);
        q -= alpha[k] * y[k];
    }
    Eigen::VectorXd r = gamma * q;
    for (std::size_t k = 0; k < m; k++) {
        if (rho[k] == 0.0) continue;
        double beta = rho[k] * y[k].dot(r);
        r += (alpha[k] - beta) * s[k];
    }
    return -r.cwiseProduct(mask);
}

} // namespace

Eigen::VectorXd clip(const Eigen::VectorXd& x, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
    return x.cwiseMax(lower).cwiseMin(upper);
}

MinimizeResult minimize_box(const Objective& fun,
                            const Eigen::VectorXd& x0,
                            const Eigen::VectorXd& lower,
                            const Eigen::VectorXd& upper,
                            const MinimizeOptions& opt) {
    if (x0.size() == 0)
        throw std::invalid_argument("minimize_box needs at least one variable");
    if (lower.size() != x0.size() || upper.size() != x0.size())
        throw std::invalid_argument("bounds must have one entry per variable");
    for (Eigen::Index i = 0; i < x0.size(); i++) {
        if (lower[i] > upper[i])
            throw std::invalid_argument("lower bound exceeds upper bound for variable " + std::to_string(i));
    }

    Counted f{fun};
    MinimizeResult res;
    res.x = clip(x0, lower, upper);
    res.f = f(res.x);
    if (!std::isfinite(res.f)) {
        res.message = "ABNORMAL: objective is not finite at the initial point";
        res.evaluations = f.evaluations;
        return res;
    }

    Eigen::VectorXd g = gradient(f, res.x, res.f, lower, upper);
    std::deque<Eigen::VectorXd> S, Y;
    res.message = "STOP: TOTAL NO. OF ITERATIONS REACHED LIMIT";

    for (int iter = 0; iter < opt.max_iterations; iter++) {
        Eigen::VectorXd mask = free_mask(res.x, g, lower, upper);
        Eigen::VectorXd pg = g.cwiseProduct(mask);
        double pg_norm = pg.lpNorm<Eigen::Infinity>();

        if (opt.disp) {
            std::cout << "iter=" << iter
                      << " f=" << std::scientific << std::setprecision(6) << res.f
                      << " |pg|=" << pg_norm
                      << " evals=" << f.evaluations
                      << std::defaultfloat << "\n";
        }

        if (pg_norm <= opt.gtol) {
            res.success = true;
            res.message = "CONVERGENCE: NORM_OF_PROJECTED_GRADIENT_<=_PGTOL";
            break;
        }
        if (f.evaluations >= opt.max_evaluations) {
            res.message = "STOP: TOTAL NO. OF f AND g EVALUATIONS EXCEEDS LIMIT";
            break;
        }

        Eigen::VectorXd d = lbfgs_direction(g, mask, S, Y);
        if (!d.allFinite() || d.dot(g) >= 0.0) {
            S.clear();
            Y.clear();
            d = -pg;
        }

        double t = S.empty() ? std::min(1.0, 1.0 / d.norm()) : 1.0;

        // Armijo backtracking along the projected path.
        bool accepted = false;
        bool exhausted = false;
        Eigen::VectorXd xn;
        double fn = res.f;
        for (int ls = 0; ls < opt.max_line_search; ls++) {
            if (f.evaluations >= opt.max_evaluations) {
                exhausted = true;
                break;
            }
            xn = clip(res.x + t * d, lower, upper);
            Eigen::VectorXd step = xn - res.x;
            if (step.lpNorm<Eigen::Infinity>() == 0.0) break;
            fn = f(xn);
            if (std::isfinite(fn) && fn <= res.f + kArmijo * g.dot(step)) {
                accepted = true;
                break;
            }
            t *= 0.5;
        }

        if (!accepted) {
            if (exhausted) {
                res.message = "STOP: TOTAL NO. OF f AND g EVALUATIONS EXCEEDS LIMIT";
                break;
            }
            if (!S.empty()) {
                // Retry once from steepest descent.
                S.clear();
                Y.clear();
                continue;
            }
            res.message = "ABNORMAL_TERMINATION_IN_LNSRCH";
            break;
        }

        Eigen::VectorXd gn = gradient(f, xn, fn, lower, upper);
        Eigen::VectorXd s = xn - res.x;
        Eigen::VectorXd y = gn - g;
        if (s.dot(y) > kEps * y.squaredNorm()) {
            S.push_back(s);
            Y.push_back(y);
            if ((int)S.size() > std::max(1, opt.history)) {
                S.pop_front();
                Y.pop_front();
            }
        }

        double rel = (res.f - fn) / std::max({std::abs(res.f), std::abs(fn), 1.0});
        res.x = xn;
        res.f = fn;
        g = gn;
        res.iterations++;

        if (rel <= opt.ftol) {
            res.success = true;
            res.message = "CONVERGENCE: REL_REDUCTION_OF_F_<=_FACTR*EPSMCH";
            break;
        }
    }

    res.evaluations = f.evaluations;
    return res;
}

} // namespace fluxed
