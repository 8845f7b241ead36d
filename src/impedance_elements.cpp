#include "impedance_elements.hpp"
#include "eis_errors.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <sstream>

namespace eis_sim {

namespace { // Unchecked kernels shared by the scalar and broadcast forms

Complex
cpe_kernel(double q, double alpha, double omega) {
    // Principal branch: arg(j*omega) = pi/2 for omega > 0
    const Complex j_omega_pow = std::polar(std::pow(omega, alpha), alpha * boost::math::constants::half_pi<double>());
    return 1.0 / (q * j_omega_pow);
}

Complex
warburg_kernel(double sigma, double omega) {
    return (sigma * boost::math::constants::root_two<double>()) / std::sqrt(Complex(0.0, omega));
}

void
require_positive_omega(double omega) {
    if (!(omega > 0.0)) {
        std::ostringstream ss;
        ss << "Angular frequency must be > 0 (got " << omega << ").";
        throw DomainError(ss.str());
    }
}

void
require_positive_omega(const Eigen::VectorXd &omega) {
    for (Eigen::Index j = 0; j < omega.size(); ++j) { require_positive_omega(omega(j)); }
}

void
require_positive_q(double q) {
    if (!(q > 0.0)) {
        std::ostringstream ss;
        ss << "CPE coefficient Q must be > 0 (got " << q << ").";
        throw DomainError(ss.str());
    }
}

} // namespace

Complex
z_resistor(double resistance) {
    return Complex(resistance, 0.0);
}

Complex
z_cpe(double q, double alpha, double omega) {
    require_positive_q(q);
    require_positive_omega(omega);
    return cpe_kernel(q, alpha, omega);
}

Complex
z_warburg(double sigma, double omega) {
    require_positive_omega(omega);
    return warburg_kernel(sigma, omega);
}

Eigen::MatrixXcd
resistor_matrix(const Eigen::VectorXd &resistance, Eigen::Index n_points) {
    return resistance.cast<Complex>().replicate(1, n_points);
}

Eigen::MatrixXcd
cpe_matrix(const Eigen::VectorXd &q, const Eigen::VectorXd &alpha, const Eigen::VectorXd &omega) {
    if (q.size() != alpha.size()) {
        throw ShapeError("CPE broadcast: Q has " + std::to_string(q.size()) + " entries but alpha has " +
                         std::to_string(alpha.size()) + ".");
    }
    for (Eigen::Index i = 0; i < q.size(); ++i) { require_positive_q(q(i)); }
    require_positive_omega(omega);

    return Eigen::MatrixXcd::NullaryExpr(
      q.size(), omega.size(), [&](Eigen::Index i, Eigen::Index j) { return cpe_kernel(q(i), alpha(i), omega(j)); });
}

Eigen::MatrixXcd
warburg_matrix(const Eigen::VectorXd &sigma, const Eigen::VectorXd &omega) {
    require_positive_omega(omega);
    return Eigen::MatrixXcd::NullaryExpr(
      sigma.size(), omega.size(), [&](Eigen::Index i, Eigen::Index j) { return warburg_kernel(sigma(i), omega(j)); });
}

Eigen::MatrixXcd
parallel(const Eigen::MatrixXcd &a, const Eigen::MatrixXcd &b) {
    return (a.array().inverse() + b.array().inverse()).inverse().matrix();
}

} // namespace eis_sim
