#include "parameter_sampler.hpp"
#include "eis_errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace eis_sim {

namespace {

std::string
describe(const ParameterRange &range, const std::string &name) {
    std::ostringstream ss;
    ss << name << " = [" << range.lo << ", " << range.hi << "]";
    return ss.str();
}

void
validate_count(Eigen::Index n) {
    if (n < 0) { throw InvalidRangeError("Sample count must be non-negative (got " + std::to_string(n) + ")."); }
}

} // namespace

void
validate_log_range(const ParameterRange &range, const std::string &name) {
    if (!std::isfinite(range.lo) || !std::isfinite(range.hi) || range.lo <= 0.0 || range.hi <= range.lo) {
        throw InvalidRangeError("Invalid " + describe(range, name) + ": log-spaced ranges need 0 < lo < hi.");
    }
}

void
validate_linear_range(const ParameterRange &range, const std::string &name) {
    if (!std::isfinite(range.lo) || !std::isfinite(range.hi) || range.hi < range.lo) {
        throw InvalidRangeError("Invalid " + describe(range, name) + ": linear ranges need lo <= hi.");
    }
}

double
round_to_milli(double value) {
    // nearbyint honours the default round-half-even mode
    return std::nearbyint(value * 1000.0) / 1000.0;
}

ParameterSampler::ParameterSampler()
  : generator_(std::random_device{}()) {}

ParameterSampler::ParameterSampler(std::uint32_t seed)
  : generator_(seed) {}

Eigen::VectorXd
ParameterSampler::log_uniform(double low, double high, Eigen::Index n) {
    validate_log_range({ low, high }, "log_uniform range");
    validate_count(n);

    const double log_low = std::log(low);
    const double log_high = std::log(high);
    Eigen::VectorXd values(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double u = unit_(generator_);
        // exp(log(low)) can land one ulp outside the range
        values(i) = std::clamp(std::exp(log_low + (log_high - log_low) * u), low, high);
    }
    return values;
}

Eigen::VectorXd
ParameterSampler::linear_uniform(double low, double high, Eigen::Index n) {
    validate_linear_range({ low, high }, "linear_uniform range");
    validate_count(n);

    Eigen::VectorXd values(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double u = unit_(generator_);
        values(i) = round_to_milli(low + (high - low) * u);
    }
    return values;
}

} // namespace eis_sim
