#include "circuit_model.hpp"
#include "eis_errors.hpp"

#include <algorithm>

namespace eis_sim {

std::string
to_string(CpeAlphaCoupling coupling) {
    switch (coupling) {
        case CpeAlphaCoupling::SharedFirstAlpha:
            return "shared_first";
        case CpeAlphaCoupling::Independent:
            return "independent";
    }
    return "unknown";
}

const ParameterRange &
ElementRanges::for_kind(ParameterKind kind) const {
    switch (kind) {
        case ParameterKind::Resistance:
            return resistance;
        case ParameterKind::Ideality:
            return alpha;
        case ParameterKind::Capacitance:
            return q;
        case ParameterKind::Diffusion:
            return sigma;
    }
    throw std::logic_error("ElementRanges::for_kind: unhandled ParameterKind.");
}

bool
CircuitModel::uses_warburg() const {
    const auto kinds = parameter_kinds();
    return std::find(kinds.begin(), kinds.end(), ParameterKind::Diffusion) != kinds.end();
}

bool
CircuitModel::has_second_cpe() const {
    const auto kinds = parameter_kinds();
    return std::count(kinds.begin(), kinds.end(), ParameterKind::Ideality) > 1;
}

void
CircuitModel::validate_ranges(const ElementRanges &ranges) const {
    validate_log_range(ranges.resistance, "resistance_range");
    validate_linear_range(ranges.alpha, "alpha_range");
    if (ranges.alpha.lo <= 0.0 || ranges.alpha.hi > 1.0) {
        throw InvalidRangeError("Invalid alpha_range = [" + std::to_string(ranges.alpha.lo) + ", " +
                                std::to_string(ranges.alpha.hi) + "]: CPE ideality must lie in (0, 1].");
    }
    if (round_to_milli(ranges.alpha.lo) <= 0.0) {
        throw InvalidRangeError("Invalid alpha_range = [" + std::to_string(ranges.alpha.lo) + ", " +
                                std::to_string(ranges.alpha.hi) + "]: draws near lo round to 0 at 3 decimals.");
    }
    validate_log_range(ranges.q, "q_range");
    if (uses_warburg()) { validate_log_range(ranges.sigma, "sigma_range"); }
}

Eigen::VectorXcd
CircuitModel::evaluate_row(const Eigen::VectorXd &parameter_row, const Eigen::VectorXd &omega) const {
    Eigen::MatrixXd one_row = parameter_row.transpose();
    return evaluate(one_row, omega).row(0).transpose();
}

void
CircuitModel::check_parameter_columns(const Eigen::MatrixXd &parameters) const {
    if (parameters.cols() != parameter_count()) {
        throw ShapeError("Circuit " + std::to_string(id()) + " expects " + std::to_string(parameter_count()) +
                         " parameter columns, got " + std::to_string(parameters.cols()) + ".");
    }
}

Eigen::VectorXd
CircuitModel::second_cpe_alpha(const Eigen::MatrixXd &parameters, Eigen::Index alpha1_col, Eigen::Index alpha2_col)
  const {
    if (alpha_coupling_ == CpeAlphaCoupling::SharedFirstAlpha) { return parameters.col(alpha1_col); }
    return parameters.col(alpha2_col);
}

std::unique_ptr<CircuitModel>
make_circuit(int circuit_id, CpeAlphaCoupling coupling) {
    switch (circuit_id) {
        case 1:
            return std::make_unique<SingleRcCircuit>(coupling);
        case 2:
            return std::make_unique<DoubleRcCircuit>(coupling);
        case 3:
            return std::make_unique<RandlesCircuit>(coupling);
        case 4:
            return std::make_unique<RcRandlesCircuit>(coupling);
        case 5:
            return std::make_unique<NestedRandlesCircuit>(coupling);
        default:
            throw UnsupportedCircuitError(circuit_id);
    }
}

std::vector<int>
supported_circuit_ids() {
    return { 1, 2, 3, 4, 5 };
}

} // namespace eis_sim
