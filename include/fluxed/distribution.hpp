#ifndef FLUXED_DISTRIBUTION_HPP
#define FLUXED_DISTRIBUTION_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fluxed {

// Ordered name/value pairs, e.g. {{"slope", 2.0}, {"intercept", 0.5}}.
using ParameterList = std::vector<std::pair<std::string, double>>;

// Intensity as a function of a coordinate point. Subclasses supply evaluate().
class Distribution {
public:
    Distribution(std::string name, std::vector<std::string> variables);
    virtual ~Distribution() = default;

    const std::string& name() const { return name_; }
    const std::vector<std::string>& variables() const { return variables_; }

    // Named parameter values; empty for plain function distributions.
    virtual ParameterList parameters() const { return {}; }

    // Whether this distribution can be evaluated on an ndim-dimensional grid.
    virtual bool accepts(std::size_t ndim) const { return ndim == variables_.size(); }

    virtual double evaluate(const std::vector<double>& point) const = 0;

    double operator()(const std::vector<double>& point) const { return evaluate(point); }

    // "Name(p=v, ...)"
    virtual std::string describe() const;

    // Key of the intensity field this distribution produces; equal keys must
    // evaluate identically. Unique per instance unless a subclass overrides it.
    virtual std::string cache_key() const;

private:
    std::string name_;
    std::vector<std::string> variables_;
    uint64_t serial_;
};

std::ostream& operator<<(std::ostream& os, const Distribution& d);

using DistributionPtr = std::shared_ptr<const Distribution>;

// User-defined distribution backed by any callable.
class FunctionDistribution : public Distribution {
public:
    using Function = std::function<double(const std::vector<double>&)>;

    FunctionDistribution(std::string name, std::vector<std::string> variables, Function fn);

    double evaluate(const std::vector<double>& point) const override;

private:
    Function fn_;
};

class NormalDistribution1D : public Distribution {
public:
    explicit NormalDistribution1D(double mean = 0.0, double stddev = 1.0);

    double mean() const { return mean_; }
    double stddev() const { return stddev_; }

    ParameterList parameters() const override;
    double evaluate(const std::vector<double>& point) const override;
    std::string cache_key() const override { return describe(); }

private:
    double mean_;
    double stddev_;
};

class NormalDistribution2D : public Distribution {
public:
    NormalDistribution2D(double mean_x = 0.0, double mean_y = 0.0,
                         double stddev_x = 1.0, double stddev_y = 1.0);

    ParameterList parameters() const override;
    double evaluate(const std::vector<double>& point) const override;
    std::string cache_key() const override { return describe(); }

private:
    double mean_x_, mean_y_;
    double stddev_x_, stddev_y_;
};

class LinearDistribution1D : public Distribution {
public:
    explicit LinearDistribution1D(double slope = 1.0, double intercept = 0.0);

    double slope() const { return slope_; }
    double intercept() const { return intercept_; }

    ParameterList parameters() const override;
    double evaluate(const std::vector<double>& point) const override;
    std::string cache_key() const override { return describe(); }

private:
    double slope_;
    double intercept_;
};

// Constant intensity on a grid of any dimension.
class UniformDistribution : public Distribution {
public:
    explicit UniformDistribution(double value = 1.0);

    ParameterList parameters() const override;
    bool accepts(std::size_t ndim) const override { return ndim >= 1; }
    double evaluate(const std::vector<double>& point) const override;
    std::string cache_key() const override { return describe(); }

private:
    double value_;
};

// Evaluates a lower-dimensional distribution on selected axes:
// ProjectedDistribution(LinearDistribution1D, {2}) on a 3-D grid depends only
// on the third coordinate.
class ProjectedDistribution : public Distribution {
public:
    ProjectedDistribution(DistributionPtr inner, std::vector<std::size_t> axes);

    const Distribution& inner() const { return *inner_; }
    const std::vector<std::size_t>& axes() const { return axes_; }

    ParameterList parameters() const override { return inner_->parameters(); }
    bool accepts(std::size_t ndim) const override;
    double evaluate(const std::vector<double>& point) const override;
    std::string describe() const override;
    std::string cache_key() const override;

private:
    DistributionPtr inner_;
    std::vector<std::size_t> axes_;
};

// ============================================================
// Families: parameterised constructors used by inverse modelling
// ============================================================
struct DistributionFamily {
    std::string name;
    std::vector<std::string> parameters;
    std::vector<double> defaults;
    std::function<DistributionPtr(const std::vector<double>&)> make;

    // Position of a parameter in `parameters`, or -1.
    int index_of(const std::string& parameter) const;
};

const std::vector<DistributionFamily>& builtin_families();

// nullptr when no family has that name.
const DistributionFamily* find_family(const std::string& name);

// Unspecified parameters take their defaults. Unknown names throw.
DistributionPtr make_distribution(const DistributionFamily& family, const ParameterList& values);

// Wraps d in a ProjectedDistribution when axes is non-empty.
DistributionPtr bind_axes(DistributionPtr d, const std::vector<std::size_t>& axes);

} // namespace fluxed

#endif // FLUXED_DISTRIBUTION_HPP
