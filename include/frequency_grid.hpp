#ifndef FREQUENCY_GRID_HPP
#define FREQUENCY_GRID_HPP

#include <Eigen/Core>
#include <cstddef>

namespace eis_sim {

/**
 * @brief Log-spaced frequency sweep shared by every spectrum of a batch.
 *
 * frequency_hz is strictly increasing from f_min to f_max (both endpoints exact),
 * and angular_frequency[i] == 2*pi*frequency_hz[i].
 */
class FrequencyGrid {
  public:
    /**
     * @brief Builds a base-10 log-spaced sweep.
     *
     * @param f_min Lowest frequency in Hz (> 0).
     * @param f_max Highest frequency in Hz (> f_min).
     * @param n_points Number of points (>= 2).
     * @throws InvalidRangeError if any argument is out of range or not finite.
     */
    static FrequencyGrid generate(double f_min, double f_max, int n_points);

    const Eigen::VectorXd &frequency_hz() const { return frequency_hz_; }
    const Eigen::VectorXd &angular_frequency() const { return angular_frequency_; }

    Eigen::Index size() const { return frequency_hz_.size(); }
    double f_min() const { return frequency_hz_(0); }
    double f_max() const { return frequency_hz_(frequency_hz_.size() - 1); }

  private:
    FrequencyGrid(Eigen::VectorXd frequency_hz, Eigen::VectorXd angular_frequency);

    Eigen::VectorXd frequency_hz_;
    Eigen::VectorXd angular_frequency_;
};

/**
 * @brief Angular frequency of a frequency in Hz, 2*pi*f.
 */
double
to_angular(double frequency_hz);

} // namespace eis_sim

#endif // FREQUENCY_GRID_HPP
