#ifndef IMPEDANCE_ELEMENTS_HPP
#define IMPEDANCE_ELEMENTS_HPP

#include <Eigen/Core>
#include <complex>

namespace eis_sim {

using Complex = std::complex<double>;

// --- Scalar element impedances ---

/**
 * @brief Impedance of an ideal resistor [Ohm]. Real and frequency independent.
 */
Complex
z_resistor(double resistance);

/**
 * @brief Impedance of a constant phase element, 1 / (Q (j*omega)^alpha).
 *
 * (j*omega)^alpha is the principal power, omega^alpha * (cos(alpha*pi/2) + j sin(alpha*pi/2)).
 * alpha is not clamped here; keeping it inside (0, 1] is the sampler's job.
 *
 * @param q CPE coefficient Q [s^alpha / Ohm], must be > 0.
 * @param alpha Ideality factor.
 * @param omega Angular frequency [rad/s], must be > 0.
 * @throws DomainError if q <= 0 or omega <= 0.
 */
Complex
z_cpe(double q, double alpha, double omega);

/**
 * @brief Impedance of a semi-infinite Warburg element, sigma*sqrt(2) / sqrt(j*omega).
 *
 * @param sigma Warburg coefficient [Ohm s^-1/2].
 * @param omega Angular frequency [rad/s], must be > 0.
 * @throws DomainError if omega <= 0.
 */
Complex
z_warburg(double sigma, double omega);

// --- Broadcast forms: one row per spectrum, one column per frequency point ---

/**
 * @brief Resistances broadcast over n_points columns.
 */
Eigen::MatrixXcd
resistor_matrix(const Eigen::VectorXd &resistance, Eigen::Index n_points);

/**
 * @brief CPE impedance for every (spectrum, frequency) pair.
 *
 * Row i uses q(i) and alpha(i); column j uses omega(j). Numerically identical to z_cpe.
 *
 * @throws DomainError if any q or omega is non-positive.
 * @throws ShapeError if q and alpha differ in length.
 */
Eigen::MatrixXcd
cpe_matrix(const Eigen::VectorXd &q, const Eigen::VectorXd &alpha, const Eigen::VectorXd &omega);

/**
 * @brief Warburg impedance for every (spectrum, frequency) pair.
 *
 * @throws DomainError if any omega is non-positive.
 */
Eigen::MatrixXcd
warburg_matrix(const Eigen::VectorXd &sigma, const Eigen::VectorXd &omega);

/**
 * @brief Element-wise parallel combination 1 / (1/a + 1/b).
 */
Eigen::MatrixXcd
parallel(const Eigen::MatrixXcd &a, const Eigen::MatrixXcd &b);

} // namespace eis_sim

#endif // IMPEDANCE_ELEMENTS_HPP
