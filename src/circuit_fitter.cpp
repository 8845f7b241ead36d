#include "circuit_fitter.hpp"
#include "eis_errors.hpp"

#include <ceres/ceres.h>

#include <cmath>
#include <iostream>
#include <vector>

namespace eis_sim {

namespace {

bool
is_log_scaled(ParameterKind kind) {
    return kind != ParameterKind::Ideality;
}

// Maps the solver's unconstrained vector back to physical parameter values.
Eigen::MatrixXd
to_parameter_row(const double *x, const std::vector<ParameterKind> &kinds) {
    Eigen::MatrixXd row(1, static_cast<Eigen::Index>(kinds.size()));
    for (std::size_t k = 0; k < kinds.size(); ++k) {
        row(0, static_cast<Eigen::Index>(k)) = is_log_scaled(kinds[k]) ? std::exp(x[k]) : x[k];
    }
    return row;
}

// Modulus-weighted residuals: 2 per frequency (real, imaginary).
class ImpedanceResidual {
  public:
    ImpedanceResidual(const CircuitModel &model, Eigen::VectorXd omega, Eigen::VectorXcd measured)
      : model_(model)
      , kinds_(model.parameter_kinds())
      , omega_(std::move(omega))
      , measured_(std::move(measured))
      , weight_(measured_.cwiseAbs().cwiseInverse()) {}

    bool operator()(double const *const *parameters, double *residuals) const {
        Eigen::MatrixXcd model_z;
        try {
            model_z = model_.evaluate(to_parameter_row(parameters[0], kinds_), omega_);
        } catch (const DomainError &) {
            // exp() underflowed a coefficient to zero; reject the step
            return false;
        }

        for (Eigen::Index j = 0; j < omega_.size(); ++j) {
            const Complex diff = (model_z(0, j) - measured_(j)) * weight_(j);
            residuals[2 * j] = diff.real();
            residuals[2 * j + 1] = diff.imag();
            if (!std::isfinite(residuals[2 * j]) || !std::isfinite(residuals[2 * j + 1])) { return false; }
        }
        return true;
    }

  private:
    const CircuitModel &model_;
    std::vector<ParameterKind> kinds_;
    Eigen::VectorXd omega_;
    Eigen::VectorXcd measured_;
    Eigen::VectorXd weight_;
};

} // namespace

CircuitFitter::CircuitFitter(const CircuitModel &model, FitOptions options)
  : model_(model)
  , options_(options) {}

FitResult
CircuitFitter::fit(const Eigen::VectorXd &omega,
                   const Eigen::VectorXcd &measured,
                   const Eigen::VectorXd &initial_guess) const {
    const std::vector<ParameterKind> kinds = model_.parameter_kinds();
    const int n_params = static_cast<int>(kinds.size());

    if (omega.size() == 0 || omega.size() != measured.size()) {
        throw ShapeError("Fit needs one measured impedance per frequency (got " + std::to_string(omega.size()) +
                         " frequencies, " + std::to_string(measured.size()) + " impedances).");
    }
    if (initial_guess.size() != n_params) {
        throw ShapeError("Initial guess has " + std::to_string(initial_guess.size()) + " values but circuit " +
                         std::to_string(model_.id()) + " has " + std::to_string(n_params) + " parameters.");
    }
    if ((omega.array() <= 0.0).any()) { throw InvalidRangeError("Fit frequencies must be > 0."); }
    if ((measured.cwiseAbs().array() == 0.0).any()) {
        throw InvalidRangeError("Measured impedance has a zero-magnitude point; modulus weighting is undefined.");
    }

    std::vector<double> x(static_cast<std::size_t>(n_params));
    for (int k = 0; k < n_params; ++k) {
        const double value = initial_guess(k);
        if (is_log_scaled(kinds[k])) {
            if (!(value > 0.0)) {
                throw InvalidRangeError("Initial value of " + model_.parameter_names()[k] + " must be > 0 (got " +
                                        std::to_string(value) + ").");
            }
            x[k] = std::log(value);
        } else {
            if (!(value >= 0.0 && value <= 1.0)) {
                throw InvalidRangeError("Initial value of " + model_.parameter_names()[k] +
                                        " must lie in [0, 1] (got " + std::to_string(value) + ").");
            }
            x[k] = value;
        }
    }

    ceres::Problem problem;
    auto *cost_function = new ceres::DynamicNumericDiffCostFunction<ImpedanceResidual, ceres::CENTRAL>(
      new ImpedanceResidual(model_, omega, measured));
    cost_function->AddParameterBlock(n_params);
    cost_function->SetNumResiduals(static_cast<int>(2 * omega.size()));
    problem.AddResidualBlock(cost_function, nullptr, x.data());

    for (int k = 0; k < n_params; ++k) {
        if (!is_log_scaled(kinds[k])) {
            problem.SetParameterLowerBound(x.data(), k, 0.0);
            problem.SetParameterUpperBound(x.data(), k, 1.0);
        }
    }

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.max_num_iterations = options_.max_iterations;
    options.function_tolerance = options_.function_tolerance;
    options.gradient_tolerance = options_.gradient_tolerance;
    options.parameter_tolerance = options_.parameter_tolerance;
    options.minimizer_progress_to_stdout = options_.verbose;

    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);

    FitResult result;
    result.parameters = to_parameter_row(x.data(), kinds).row(0).transpose();
    result.residual_rms = std::sqrt(2.0 * summary.final_cost / static_cast<double>(2 * omega.size()));
    result.converged = summary.termination_type == ceres::CONVERGENCE;
    result.iterations = summary.num_successful_steps + summary.num_unsuccessful_steps;
    result.summary = summary.BriefReport();

    if (options_.verbose) {
        std::cout << "[CircuitFitter] " << model_.name() << ": " << result.summary << std::endl;
    }
    if (!summary.IsSolutionUsable()) {
        std::cerr << "[CircuitFitter] Warning: Ceres did not find a usable solution." << std::endl;
    }
    return result;
}

Eigen::VectorXd
default_initial_guess(const CircuitModel &model, const ElementRanges &ranges) {
    const std::vector<ParameterKind> kinds = model.parameter_kinds();
    Eigen::VectorXd guess(static_cast<Eigen::Index>(kinds.size()));
    for (std::size_t k = 0; k < kinds.size(); ++k) {
        const ParameterRange &range = ranges.for_kind(kinds[k]);
        guess(static_cast<Eigen::Index>(k)) =
          is_log_scaled(kinds[k]) ? std::sqrt(range.lo * range.hi) : 0.5 * (range.lo + range.hi);
    }
    return guess;
}

} // namespace eis_sim
