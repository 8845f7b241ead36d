#ifndef CIRCUIT_FITTER_HPP
#define CIRCUIT_FITTER_HPP

#include "circuit_model.hpp"

#include <Eigen/Core>
#include <string>

namespace eis_sim {

/**
 * @brief Solver settings for CircuitFitter.
 */
struct FitOptions {
    int max_iterations = 200;
    double function_tolerance = 1e-12;
    double gradient_tolerance = 1e-14;
    double parameter_tolerance = 1e-12;
    bool verbose = false; ///< Print Ceres progress and a summary line.
};

/**
 * @brief Outcome of a single-spectrum fit.
 */
struct FitResult {
    Eigen::VectorXd parameters; ///< Circuit column order, physical units.
    double residual_rms = 0.0;  ///< RMS of the modulus-weighted real and imaginary residuals.
    bool converged = false;     ///< Ceres reported CONVERGENCE.
    int iterations = 0;
    std::string summary; ///< Ceres brief report.
};

/**
 * @brief Fits the element values of an equivalent circuit to one measured spectrum.
 *
 * Minimizes sum_j |Z_model(w_j) - Z_meas(w_j)|^2 / |Z_meas(w_j)|^2, with each term split into
 * its real and imaginary residual. Resistances, CPE coefficients and Warburg coefficients are
 * optimized as ln(value) so they stay positive over many decades; ideality factors are
 * optimized directly and bounded to [0, 1]. The model's alpha coupling is honoured, so a
 * SharedFirstAlpha circuit cannot identify alpha2.
 *
 * The model must outlive the fitter.
 */
class CircuitFitter {
  public:
    explicit CircuitFitter(const CircuitModel &model, FitOptions options = {});

    /**
     * @param omega Angular frequencies [rad/s] of the measurement.
     * @param measured Measured complex impedance, one entry per frequency.
     * @param initial_guess Starting parameter row in circuit column order.
     * @throws ShapeError if the sizes of omega, measured and initial_guess are inconsistent.
     * @throws InvalidRangeError for a non-positive initial R/Q/sigma, an initial alpha
     *         outside [0, 1], a non-positive frequency, or a zero measured impedance.
     */
    FitResult
    fit(const Eigen::VectorXd &omega, const Eigen::VectorXcd &measured, const Eigen::VectorXd &initial_guess) const;

    const FitOptions &options() const { return options_; }

  private:
    const CircuitModel &model_;
    FitOptions options_;
};

/**
 * @brief A neutral starting point: geometric mean of each log-sampled range,
 * midpoint of the ideality range.
 */
Eigen::VectorXd
default_initial_guess(const CircuitModel &model, const ElementRanges &ranges = {});

} // namespace eis_sim

#endif // CIRCUIT_FITTER_HPP
