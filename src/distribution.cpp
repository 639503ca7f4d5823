#include "fluxed/distribution.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace fluxed {

// ============================================================
// Utility
// ============================================================
static constexpr double kSqrt2Pi = 2.5066282746310002;

static inline double normal_pdf(double x, double mean, double stddev) {
    double z = (x - mean) / stddev;
    return std::exp(-0.5 * z * z) / (stddev * kSqrt2Pi);
}

static void require_positive(const std::string& dist, const char* what, double v) {
    if (!(v > 0.0) || !std::isfinite(v)) {
        std::ostringstream msg;
        msg << dist << ": " << what << " must be positive and finite, got " << v;
        throw std::invalid_argument(msg.str());
    }
}

static void require_arity(const Distribution& d, const std::vector<double>& point, std::size_t n) {
    if (point.size() != n) {
        std::ostringstream msg;
        msg << d.name() << " takes " << n << " coordinate(s), got " << point.size();
        throw std::invalid_argument(msg.str());
    }
}

// ============================================================
// Distribution
// ============================================================
static uint64_t next_serial() {
    static std::atomic<uint64_t> serial{1};
    return serial++;
}

Distribution::Distribution(std::string name, std::vector<std::string> variables)
    : name_(std::move(name)), variables_(std::move(variables)), serial_(next_serial()) {
    if (variables_.empty())
        throw std::invalid_argument(name_ + " must have at least one parameter.");
}

std::string Distribution::cache_key() const {
    // State outside parameters() is invisible to describe().
    return describe() + "#" + std::to_string(serial_);
}

std::string Distribution::describe() const {
    std::ostringstream os;
    os.precision(17);
    os << name_ << "(";
    bool first = true;
    for (const auto& [k, v] : parameters()) {
        if (!first) os << ", ";
        os << k << "=" << v;
        first = false;
    }
    os << ")";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Distribution& d) {
    return os << d.name();
}

FunctionDistribution::FunctionDistribution(std::string name, std::vector<std::string> variables, Function fn)
    : Distribution(name, std::move(variables)), fn_(std::move(fn)) {
    if (!fn_)
        throw std::invalid_argument(name + " must be a callable function.");
}

double FunctionDistribution::evaluate(const std::vector<double>& point) const {
    return fn_(point);
}

// ============================================================
// Built-ins
// ============================================================
NormalDistribution1D::NormalDistribution1D(double mean, double stddev)
    : Distribution("NormalDistribution1D", {"x"}), mean_(mean), stddev_(stddev) {
    require_positive(name(), "stddev", stddev);
}

ParameterList NormalDistribution1D::parameters() const {
    return {{"mean", mean_}, {"stddev", stddev_}};
}

double NormalDistribution1D::evaluate(const std::vector<double>& point) const {
    require_arity(*this, point, 1);
    return normal_pdf(point[0], mean_, stddev_);
}

NormalDistribution2D::NormalDistribution2D(double mean_x, double mean_y,
                                           double stddev_x, double stddev_y)
    : Distribution("NormalDistribution2D", {"x", "y"}),
      mean_x_(mean_x), mean_y_(mean_y),
      stddev_x_(stddev_x), stddev_y_(stddev_y) {
    require_positive(name(), "stddev_x", stddev_x);
    require_positive(name(), "stddev_y", stddev_y);
}

ParameterList NormalDistribution2D::parameters() const {
    return {{"mean_x", mean_x_}, {"mean_y", mean_y_},
            {"stddev_x", stddev_x_}, {"stddev_y", stddev_y_}};
}

double NormalDistribution2D::evaluate(const std::vector<double>& point) const {
    require_arity(*this, point, 2);
    return normal_pdf(point[0], mean_x_, stddev_x_) *
           normal_pdf(point[1], mean_y_, stddev_y_);
}

LinearDistribution1D::LinearDistribution1D(double slope, double intercept)
    : Distribution("LinearDistribution1D", {"x"}), slope_(slope), intercept_(intercept) {}

ParameterList LinearDistribution1D::parameters() const {
    return {{"slope", slope_}, {"intercept", intercept_}};
}

double LinearDistribution1D::evaluate(const std::vector<double>& point) const {
    require_arity(*this, point, 1);
    return slope_ * point[0] + intercept_;
}

UniformDistribution::UniformDistribution(double value)
    : Distribution("UniformDistribution", {"coords"}), value_(value) {}

ParameterList UniformDistribution::parameters() const {
    return {{"value", value_}};
}

double UniformDistribution::evaluate(const std::vector<double>&) const {
    return value_;
}

// ============================================================
// Projection onto axes
// ============================================================
static std::vector<std::string> projected_variables(const DistributionPtr& inner,
                                                    const std::vector<std::size_t>& axes) {
    if (!inner)
        throw std::invalid_argument("ProjectedDistribution needs an inner distribution");
    if (axes.empty())
        throw std::invalid_argument("ProjectedDistribution needs at least one axis");
    if (!inner->accepts(axes.size())) {
        std::ostringstream msg;
        msg << inner->name() << " cannot be evaluated on " << axes.size() << " axes";
        throw std::invalid_argument(msg.str());
    }
    std::vector<std::string> vars;
    for (std::size_t a : axes) vars.push_back("x" + std::to_string(a));
    return vars;
}

ProjectedDistribution::ProjectedDistribution(DistributionPtr inner, std::vector<std::size_t> axes)
    : Distribution(inner ? inner->name() : std::string("ProjectedDistribution"),
                   projected_variables(inner, axes)),
      inner_(std::move(inner)), axes_(std::move(axes)) {}

static std::string axes_suffix(const std::vector<std::size_t>& axes) {
    std::string on = "@axes(";
    for (std::size_t k = 0; k < axes.size(); k++) {
        if (k) on += ",";
        on += std::to_string(axes[k]);
    }
    return on + ")";
}

std::string ProjectedDistribution::describe() const {
    return inner_->describe() + axes_suffix(axes_);
}

std::string ProjectedDistribution::cache_key() const {
    return inner_->cache_key() + axes_suffix(axes_);
}

bool ProjectedDistribution::accepts(std::size_t ndim) const {
    return *std::max_element(axes_.begin(), axes_.end()) < ndim;
}

double ProjectedDistribution::evaluate(const std::vector<double>& point) const {
    std::vector<double> sub(axes_.size());
    for (std::size_t k = 0; k < axes_.size(); k++) {
        if (axes_[k] >= point.size()) {
            std::ostringstream msg;
            msg << name() << " bound to axis " << axes_[k]
                << " but point has " << point.size() << " coordinate(s)";
            throw std::invalid_argument(msg.str());
        }
        sub[k] = point[axes_[k]];
    }
    return inner_->evaluate(sub);
}

// ============================================================
// Families
// ============================================================
int DistributionFamily::index_of(const std::string& parameter) const {
    for (std::size_t i = 0; i < parameters.size(); i++)
        if (parameters[i] == parameter) return (int)i;
    return -1;
}

const std::vector<DistributionFamily>& builtin_families() {
    static const std::vector<DistributionFamily> families = {
        {"normal1d", {"mean", "stddev"}, {0.0, 1.0},
         [](const std::vector<double>& v) -> DistributionPtr {
             return std::make_shared<NormalDistribution1D>(v[0], v[1]);
         }},
        {"normal2d", {"mean_x", "mean_y", "stddev_x", "stddev_y"}, {0.0, 0.0, 1.0, 1.0},
         [](const std::vector<double>& v) -> DistributionPtr {
             return std::make_shared<NormalDistribution2D>(v[0], v[1], v[2], v[3]);
         }},
        {"linear1d", {"slope", "intercept"}, {1.0, 0.0},
         [](const std::vector<double>& v) -> DistributionPtr {
             return std::make_shared<LinearDistribution1D>(v[0], v[1]);
         }},
        {"uniform", {"value"}, {1.0},
         [](const std::vector<double>& v) -> DistributionPtr {
             return std::make_shared<UniformDistribution>(v[0]);
         }},
    };
    return families;
}

const DistributionFamily* find_family(const std::string& name) {
    for (const auto& f : builtin_families())
        if (f.name == name) return &f;
    return nullptr;
}

DistributionPtr make_distribution(const DistributionFamily& family, const ParameterList& values) {
    std::vector<double> v = family.defaults;
    for (const auto& [k, x] : values) {
        int i = family.index_of(k);
        if (i < 0)
            throw std::invalid_argument("Unknown parameter '" + k + "' for family " + family.name);
        v[(std::size_t)i] = x;
    }
    return family.make(v);
}

DistributionPtr bind_axes(DistributionPtr d, const std::vector<std::size_t>& axes) {
    if (axes.empty()) return d;
    return std::make_shared<ProjectedDistribution>(std::move(d), axes);
}

} // namespace fluxed
