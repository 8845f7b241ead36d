#ifndef PARAMETER_SAMPLER_HPP
#define PARAMETER_SAMPLER_HPP

#include <Eigen/Core>
#include <cstdint>
#include <random>
#include <string>

namespace eis_sim {

/**
 * @brief Closed interval [lo, hi] an element value is drawn from.
 */
struct ParameterRange {
    double lo = 0.0;
    double hi = 0.0;

    bool operator==(const ParameterRange &other) const { return lo == other.lo && hi == other.hi; }
};

/**
 * @brief Throws InvalidRangeError unless 0 < lo < hi (ranges sampled in log space).
 * @param name Used in the error message, e.g. "resistance_range".
 */
void
validate_log_range(const ParameterRange &range, const std::string &name);

/**
 * @brief Throws InvalidRangeError unless lo <= hi and both are finite.
 */
void
validate_linear_range(const ParameterRange &range, const std::string &name);

/**
 * @brief Draws randomized element values from an explicitly owned generator.
 *
 * One sampler is one sequential random stream: two samplers built from the same
 * seed and asked for the same sequence of draws return identical values. The
 * default constructor seeds from std::random_device (unseeded, like a process-wide
 * source); tests and reproducible runs pass a seed.
 *
 * Not thread-safe; parallel callers use one sampler each.
 */
class ParameterSampler {
  public:
    ParameterSampler();
    explicit ParameterSampler(std::uint32_t seed);

    /**
     * @brief n values exp(U(ln(low), ln(high))), each draw independent.
     *
     * Used for R, Q and sigma, which span several orders of magnitude.
     * @throws InvalidRangeError unless 0 < low < high and n >= 0.
     */
    Eigen::VectorXd log_uniform(double low, double high, Eigen::Index n);
    Eigen::VectorXd log_uniform(const ParameterRange &range, Eigen::Index n) {
        return log_uniform(range.lo, range.hi, n);
    }

    /**
     * @brief n values uniform in [low, high], rounded to 3 decimal places.
     *
     * Used only for the CPE ideality factor alpha. Rounding happens after the draw, so a
     * value can sit up to 5e-4 outside [low, high]: a range such as [0.8001, 0.8004] that
     * holds no 3-decimal value yields 0.8 every time.
     * @throws InvalidRangeError unless low <= high and n >= 0.
     */
    Eigen::VectorXd linear_uniform(double low, double high, Eigen::Index n);
    Eigen::VectorXd linear_uniform(const ParameterRange &range, Eigen::Index n) {
        return linear_uniform(range.lo, range.hi, n);
    }

    std::mt19937 &generator() { return generator_; }

  private:
    std::mt19937 generator_;
    std::uniform_real_distribution<double> unit_{ 0.0, 1.0 };
};

/**
 * @brief Rounds to 3 decimal places, half to even (as the ideality factors are stored).
 */
double
round_to_milli(double value);

} // namespace eis_sim

#endif // PARAMETER_SAMPLER_HPP
