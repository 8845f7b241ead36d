#include "circuit_model.hpp"
#include "impedance_elements.hpp"

namespace eis_sim {

namespace {

using Kind = ParameterKind;

// Column layouts shared by the circuits. Circuits 4 and 5 use the same one.
namespace single_rc {
constexpr Eigen::Index R1 = 0, R2 = 1, ALPHA1 = 2, Q1 = 3;
}
namespace double_rc {
constexpr Eigen::Index R1 = 0, R2 = 1, R3 = 2, ALPHA1 = 3, Q1 = 4, ALPHA2 = 5, Q2 = 6;
}
namespace randles {
constexpr Eigen::Index R1 = 0, R2 = 1, ALPHA1 = 2, Q1 = 3, SIGMA = 4;
}
namespace two_cpe_warburg {
constexpr Eigen::Index R1 = 0, R2 = 1, R3 = 2, ALPHA1 = 3, Q1 = 4, ALPHA2 = 5, Q2 = 6, SIGMA = 7;
}

} // namespace

// --- Circuit 1 ---

std::string
SingleRcCircuit::name() const {
    return "Circuit 1: R₁ + (R₂ ∥ Q₁)";
}

std::string
SingleRcCircuit::description() const {
    return "Series resistor with one R//CPE loop";
}

std::vector<std::string>
SingleRcCircuit::parameter_names() const {
    return { "R1", "R2", "α₁", "Q1" };
}

std::vector<ParameterKind>
SingleRcCircuit::parameter_kinds() const {
    return { Kind::Resistance, Kind::Resistance, Kind::Ideality, Kind::Capacitance };
}

Eigen::MatrixXd
SingleRcCircuit::sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const {
    using namespace single_rc;
    validate_ranges(ranges);

    Eigen::MatrixXd p(n, parameter_count());
    p.col(R1) = sampler.log_uniform(ranges.resistance, n);
    p.col(R2) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA1) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q1) = sampler.log_uniform(ranges.q, n);
    return p;
}

Eigen::MatrixXcd
SingleRcCircuit::evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const {
    using namespace single_rc;
    check_parameter_columns(parameters);
    const Eigen::Index points = omega.size();

    const Eigen::MatrixXcd zr1 = resistor_matrix(parameters.col(R1), points);
    const Eigen::MatrixXcd zr2 = resistor_matrix(parameters.col(R2), points);
    const Eigen::MatrixXcd zq1 = cpe_matrix(parameters.col(Q1), parameters.col(ALPHA1), omega);

    return zr1 + parallel(zr2, zq1);
}

// --- Circuit 2 ---

std::string
DoubleRcCircuit::name() const {
    return "Circuit 2: R₁ + (R₂ ∥ Q₁) + (R₃ ∥ Q₂)";
}

std::string
DoubleRcCircuit::description() const {
    return "Series resistor with two R//CPE loops";
}

std::vector<std::string>
DoubleRcCircuit::parameter_names() const {
    return { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2" };
}

std::vector<ParameterKind>
DoubleRcCircuit::parameter_kinds() const {
    return { Kind::Resistance, Kind::Resistance, Kind::Resistance, Kind::Ideality,
             Kind::Capacitance, Kind::Ideality,   Kind::Capacitance };
}

Eigen::MatrixXd
DoubleRcCircuit::sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const {
    using namespace double_rc;
    validate_ranges(ranges);

    Eigen::MatrixXd p(n, parameter_count());
    p.col(R1) = sampler.log_uniform(ranges.resistance, n);
    p.col(R2) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA1) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q1) = sampler.log_uniform(ranges.q, n);
    p.col(R3) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA2) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q2) = sampler.log_uniform(ranges.q, n);
    return p;
}

Eigen::MatrixXcd
DoubleRcCircuit::evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const {
    using namespace double_rc;
    check_parameter_columns(parameters);
    const Eigen::Index points = omega.size();

    const Eigen::MatrixXcd zr1 = resistor_matrix(parameters.col(R1), points);
    const Eigen::MatrixXcd zr2 = resistor_matrix(parameters.col(R2), points);
    const Eigen::MatrixXcd zr3 = resistor_matrix(parameters.col(R3), points);
    const Eigen::MatrixXcd zq1 = cpe_matrix(parameters.col(Q1), parameters.col(ALPHA1), omega);
    const Eigen::MatrixXcd zq2 = cpe_matrix(parameters.col(Q2), second_cpe_alpha(parameters, ALPHA1, ALPHA2), omega);

    return zr1 + parallel(zr2, zq1) + parallel(zr3, zq2);
}

// --- Circuit 3 ---

std::string
RandlesCircuit::name() const {
    return "Circuit 3: R₁ + (Q₁ ∥ (R₂ + W))";
}

std::string
RandlesCircuit::description() const {
    return "Series resistor with CPE parallel to R+Warburg";
}

std::vector<std::string>
RandlesCircuit::parameter_names() const {
    return { "R1", "R2", "α₁", "Q1", "σ" };
}

std::vector<ParameterKind>
RandlesCircuit::parameter_kinds() const {
    return { Kind::Resistance, Kind::Resistance, Kind::Ideality, Kind::Capacitance, Kind::Diffusion };
}

Eigen::MatrixXd
RandlesCircuit::sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const {
    using namespace randles;
    validate_ranges(ranges);

    Eigen::MatrixXd p(n, parameter_count());
    p.col(R1) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA1) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q1) = sampler.log_uniform(ranges.q, n);
    p.col(R2) = sampler.log_uniform(ranges.resistance, n);
    p.col(SIGMA) = sampler.log_uniform(ranges.sigma, n);
    return p;
}

Eigen::MatrixXcd
RandlesCircuit::evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const {
    using namespace randles;
    check_parameter_columns(parameters);
    const Eigen::Index points = omega.size();

    const Eigen::MatrixXcd zr1 = resistor_matrix(parameters.col(R1), points);
    const Eigen::MatrixXcd zr2 = resistor_matrix(parameters.col(R2), points);
    const Eigen::MatrixXcd zq1 = cpe_matrix(parameters.col(Q1), parameters.col(ALPHA1), omega);
    const Eigen::MatrixXcd zw = warburg_matrix(parameters.col(SIGMA), omega);

    return zr1 + parallel(zq1, zr2 + zw);
}

// --- Circuit 4 ---

std::string
RcRandlesCircuit::name() const {
    return "Circuit 4: R₁ + (R₂ ∥ Q₁) + (Q₂ ∥ (R₃ + W))";
}

std::string
RcRandlesCircuit::description() const {
    return "Two loops: one R//CPE and one CPE//(R+Warburg)";
}

std::vector<std::string>
RcRandlesCircuit::parameter_names() const {
    return { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2", "σ" };
}

std::vector<ParameterKind>
RcRandlesCircuit::parameter_kinds() const {
    return { Kind::Resistance, Kind::Resistance,  Kind::Resistance, Kind::Ideality,
             Kind::Capacitance, Kind::Ideality, Kind::Capacitance, Kind::Diffusion };
}

Eigen::MatrixXd
RcRandlesCircuit::sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const {
    using namespace two_cpe_warburg;
    validate_ranges(ranges);

    Eigen::MatrixXd p(n, parameter_count());
    p.col(R1) = sampler.log_uniform(ranges.resistance, n);
    p.col(R2) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA1) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q1) = sampler.log_uniform(ranges.q, n);
    p.col(ALPHA2) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q2) = sampler.log_uniform(ranges.q, n);
    p.col(R3) = sampler.log_uniform(ranges.resistance, n);
    p.col(SIGMA) = sampler.log_uniform(ranges.sigma, n);
    return p;
}

Eigen::MatrixXcd
RcRandlesCircuit::evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const {
    using namespace two_cpe_warburg;
    check_parameter_columns(parameters);
    const Eigen::Index points = omega.size();

    const Eigen::MatrixXcd zr1 = resistor_matrix(parameters.col(R1), points);
    const Eigen::MatrixXcd zr2 = resistor_matrix(parameters.col(R2), points);
    const Eigen::MatrixXcd zr3 = resistor_matrix(parameters.col(R3), points);
    const Eigen::MatrixXcd zq1 = cpe_matrix(parameters.col(Q1), parameters.col(ALPHA1), omega);
    const Eigen::MatrixXcd zq2 = cpe_matrix(parameters.col(Q2), second_cpe_alpha(parameters, ALPHA1, ALPHA2), omega);
    const Eigen::MatrixXcd zw = warburg_matrix(parameters.col(SIGMA), omega);

    return zr1 + parallel(zr2, zq1) + parallel(zq2, zr3 + zw);
}

// --- Circuit 5 ---

std::string
NestedRandlesCircuit::name() const {
    return "Circuit 5: R₁ + ((R₂ + ((R₃ + W) ∥ Q₂)) ∥ Q₁)";
}

std::string
NestedRandlesCircuit::description() const {
    return "Nested circuit with Warburg diffusion";
}

std::vector<std::string>
NestedRandlesCircuit::parameter_names() const {
    return { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2", "σ" };
}

std::vector<ParameterKind>
NestedRandlesCircuit::parameter_kinds() const {
    return { Kind::Resistance, Kind::Resistance,  Kind::Resistance, Kind::Ideality,
             Kind::Capacitance, Kind::Ideality, Kind::Capacitance, Kind::Diffusion };
}

Eigen::MatrixXd
NestedRandlesCircuit::sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n)
  const {
    using namespace two_cpe_warburg;
    validate_ranges(ranges);

    Eigen::MatrixXd p(n, parameter_count());
    p.col(R1) = sampler.log_uniform(ranges.resistance, n);
    p.col(R2) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA1) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q1) = sampler.log_uniform(ranges.q, n);
    p.col(R3) = sampler.log_uniform(ranges.resistance, n);
    p.col(ALPHA2) = sampler.linear_uniform(ranges.alpha, n);
    p.col(Q2) = sampler.log_uniform(ranges.q, n);
    p.col(SIGMA) = sampler.log_uniform(ranges.sigma, n);
    return p;
}

Eigen::MatrixXcd
NestedRandlesCircuit::evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const {
    using namespace two_cpe_warburg;
    check_parameter_columns(parameters);
    const Eigen::Index points = omega.size();

    const Eigen::MatrixXcd zr1 = resistor_matrix(parameters.col(R1), points);
    const Eigen::MatrixXcd zr2 = resistor_matrix(parameters.col(R2), points);
    const Eigen::MatrixXcd zr3 = resistor_matrix(parameters.col(R3), points);
    const Eigen::MatrixXcd zq1 = cpe_matrix(parameters.col(Q1), parameters.col(ALPHA1), omega);
    const Eigen::MatrixXcd zq2 = cpe_matrix(parameters.col(Q2), second_cpe_alpha(parameters, ALPHA1, ALPHA2), omega);
    const Eigen::MatrixXcd zw = warburg_matrix(parameters.col(SIGMA), omega);

    // Inner Randles branch in series with R2, the whole thing across Q1
    const Eigen::MatrixXcd inner = zr2 + parallel(zr3 + zw, zq2);
    return zr1 + parallel(inner, zq1);
}

} // namespace eis_sim
