#ifndef FLUXED_OPTIMIZE_HPP
#define FLUXED_OPTIMIZE_HPP

#include <Eigen/Dense>

#include <functional>
#include <string>

namespace fluxed {

struct MinimizeOptions {
    double ftol = 2.220446049250313e-09; // relative reduction of f
    double gtol = 1e-5;                  // infinity norm of projected gradient
    int max_iterations = 15000;
    int max_evaluations = 15000;
    int history = 10;                    // stored correction pairs
    int max_line_search = 20;
    bool disp = false;
};

struct MinimizeResult {
    Eigen::VectorXd x;
    double f = 0.0;
    bool success = false;
    std::string message;
    int iterations = 0;
    int evaluations = 0;
};

using Objective = std::function<double(const Eigen::VectorXd&)>;

// Projected L-BFGS over lower <= x <= upper with finite-difference
// gradients. Bounds may be infinite; x0 is clipped into the box. Non-finite
// values are rejected points for the line search.
MinimizeResult minimize_box(const Objective& f,
                            const Eigen::VectorXd& x0,
                            const Eigen::VectorXd& lower,
                            const Eigen::VectorXd& upper,
                            const MinimizeOptions& opt = MinimizeOptions());

Eigen::VectorXd clip(const Eigen::VectorXd& x, const Eigen::VectorXd& lower, const Eigen::VectorXd& upper);

} // namespace fluxed

#endif // FLUXED_OPTIMIZE_HPP
