#include "frequency_grid.hpp"
#include "eis_errors.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <sstream>
#include <utility>

namespace eis_sim {

double
to_angular(double frequency_hz) {
    return boost::math::constants::two_pi<double>() * frequency_hz;
}

FrequencyGrid::FrequencyGrid(Eigen::VectorXd frequency_hz, Eigen::VectorXd angular_frequency)
  : frequency_hz_(std::move(frequency_hz))
  , angular_frequency_(std::move(angular_frequency)) {}

FrequencyGrid
FrequencyGrid::generate(double f_min, double f_max, int n_points) {
    if (!std::isfinite(f_min) || !std::isfinite(f_max) || f_min <= 0.0 || f_max <= f_min) {
        std::ostringstream ss;
        ss << "Frequency range must satisfy 0 < f_min < f_max (got f_min=" << f_min << ", f_max=" << f_max << ").";
        throw InvalidRangeError(ss.str());
    }
    if (n_points < 2) {
        throw InvalidRangeError("Frequency grid needs at least 2 points (got " + std::to_string(n_points) + ").");
    }

    // Same construction as a base-10 logspace: linear spacing of the exponents.
    const double log_min = std::log10(f_min);
    const double log_max = std::log10(f_max);
    const double step = (log_max - log_min) / static_cast<double>(n_points - 1);

    Eigen::VectorXd hz(n_points);
    for (int i = 0; i < n_points; ++i) { hz(i) = std::pow(10.0, log_min + step * static_cast<double>(i)); }
    hz(0) = f_min;
    hz(n_points - 1) = f_max;

    Eigen::VectorXd omega = boost::math::constants::two_pi<double>() * hz;
    return FrequencyGrid(std::move(hz), std::move(omega));
}

} // namespace eis_sim
