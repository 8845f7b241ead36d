#ifndef CIRCUIT_MODEL_HPP
#define CIRCUIT_MODEL_HPP

#include "parameter_sampler.hpp"

#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

namespace eis_sim {

/**
 * @brief Which ideality factor drives the second CPE (Q2) of circuits 2, 4 and 5.
 *
 * The reference data generator samples and stores alpha2 but evaluates Q2 with alpha1,
 * so the stored alpha2 ground truth does not match the spectrum. Models trained on that
 * data expect SharedFirstAlpha; Independent gives the physically consistent spectrum.
 * Circuits 1 and 3 have a single CPE and are unaffected.
 */
enum class CpeAlphaCoupling {
    SharedFirstAlpha, ///< Q2 evaluated with alpha1 (reference generator behaviour).
    Independent,      ///< Q2 evaluated with its own alpha2.
};

std::string
to_string(CpeAlphaCoupling coupling);

/**
 * @brief Physical meaning of a parameter column, which also fixes how it is sampled.
 */
enum class ParameterKind {
    Resistance,  ///< R [Ohm], log-uniform
    Ideality,    ///< CPE alpha, linear-uniform rounded to 3 decimals
    Capacitance, ///< CPE Q [s^alpha/Ohm], log-uniform
    Diffusion,   ///< Warburg sigma [Ohm s^-1/2], log-uniform
};

/**
 * @brief User supplied sampling ranges for each kind of element.
 *
 * Defaults are the dashboard defaults of the reference application.
 */
struct ElementRanges {
    ParameterRange resistance{ 1e-1, 1e4 };
    ParameterRange alpha{ 0.8, 1.0 };
    ParameterRange q{ 1e-5, 1e-3 };
    ParameterRange sigma{ 1e0, 1e3 };

    const ParameterRange &for_kind(ParameterKind kind) const;
};

/**
 * @brief Abstract equivalent circuit with a fixed topology.
 *
 * A circuit knows its parameter schema (names and kinds, in output column order), how to
 * draw a batch of parameter rows, and how to turn parameter rows into complex impedance
 * over an angular frequency grid. Parameter matrices are (spectra x P); impedance matrices
 * are (spectra x points), and row i of one always belongs to row i of the other.
 */
class CircuitModel {
  public:
    virtual ~CircuitModel() = default;

    virtual int id() const = 0;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    /// Column names in output order, e.g. {"R1", "R2", "α₁", "Q1"}.
    virtual std::vector<std::string> parameter_names() const = 0;

    /// Column kinds in output order.
    virtual std::vector<ParameterKind> parameter_kinds() const = 0;

    Eigen::Index parameter_count() const { return static_cast<Eigen::Index>(parameter_kinds().size()); }

    bool uses_warburg() const;

    /// True for the circuits whose second CPE is affected by CpeAlphaCoupling.
    bool has_second_cpe() const;

    CpeAlphaCoupling alpha_coupling() const { return alpha_coupling_; }

    /**
     * @brief Checks the ranges this circuit samples from.
     *
     * Resistance, Q and (if used) sigma need 0 < lo < hi; alpha needs 0 < lo <= hi <= 1 and
     * a lo that stays positive after rounding to 3 decimals.
     * @throws InvalidRangeError on the first bad range.
     */
    void validate_ranges(const ElementRanges &ranges) const;

    /**
     * @brief Draws n parameter rows.
     *
     * Draws are taken from the sampler in the circuit's fixed element order, so a seeded
     * sampler reproduces the same batch. Ranges are validated before the first draw.
     *
     * @return (n x parameter_count()) matrix in output column order.
     */
    virtual Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const = 0;

    /**
     * @brief Complex impedance of every parameter row at every angular frequency.
     *
     * @throws ShapeError if parameters does not have parameter_count() columns.
     * @throws DomainError if an element receives a value outside its domain.
     */
    virtual Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const = 0;

    /// Single spectrum convenience form of evaluate().
    Eigen::VectorXcd evaluate_row(const Eigen::VectorXd &parameter_row, const Eigen::VectorXd &omega) const;

  protected:
    explicit CircuitModel(CpeAlphaCoupling coupling)
      : alpha_coupling_(coupling) {}

    void check_parameter_columns(const Eigen::MatrixXd &parameters) const;

    /// Ideality factor used for the second CPE, honouring alpha_coupling().
    Eigen::VectorXd
    second_cpe_alpha(const Eigen::MatrixXd &parameters, Eigen::Index alpha1_col, Eigen::Index alpha2_col) const;

  private:
    CpeAlphaCoupling alpha_coupling_;
};

// --- The five topologies ("||" is the parallel combination) ---

/// Circuit 1: R1 + (R2 || Q1). Columns R1, R2, α₁, Q1.
class SingleRcCircuit : public CircuitModel {
  public:
    explicit SingleRcCircuit(CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha)
      : CircuitModel(coupling) {}

    int id() const override { return 1; }
    std::string name() const override;
    std::string description() const override;
    std::vector<std::string> parameter_names() const override;
    std::vector<ParameterKind> parameter_kinds() const override;
    Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const override;
    Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const override;
};

/// Circuit 2: R1 + (R2 || Q1) + (R3 || Q2). Columns R1, R2, R3, α₁, Q1, α₂, Q2.
class DoubleRcCircuit : public CircuitModel {
  public:
    explicit DoubleRcCircuit(CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha)
      : CircuitModel(coupling) {}

    int id() const override { return 2; }
    std::string name() const override;
    std::string description() const override;
    std::vector<std::string> parameter_names() const override;
    std::vector<ParameterKind> parameter_kinds() const override;
    Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const override;
    Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const override;
};

/// Circuit 3: R1 + (Q1 || (R2 + W)). Columns R1, R2, α₁, Q1, σ.
class RandlesCircuit : public CircuitModel {
  public:
    explicit RandlesCircuit(CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha)
      : CircuitModel(coupling) {}

    int id() const override { return 3; }
    std::string name() const override;
    std::string description() const override;
    std::vector<std::string> parameter_names() const override;
    std::vector<ParameterKind> parameter_kinds() const override;
    Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const override;
    Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const override;
};

/// Circuit 4: R1 + (R2 || Q1) + (Q2 || (R3 + W)). Columns R1, R2, R3, α₁, Q1, α₂, Q2, σ.
class RcRandlesCircuit : public CircuitModel {
  public:
    explicit RcRandlesCircuit(CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha)
      : CircuitModel(coupling) {}

    int id() const override { return 4; }
    std::string name() const override;
    std::string description() const override;
    std::vector<std::string> parameter_names() const override;
    std::vector<ParameterKind> parameter_kinds() const override;
    Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const override;
    Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const override;
};

/// Circuit 5: R1 + ((R2 + ((R3 + W) || Q2)) || Q1). Columns R1, R2, R3, α₁, Q1, α₂, Q2, σ.
class NestedRandlesCircuit : public CircuitModel {
  public:
    explicit NestedRandlesCircuit(CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha)
      : CircuitModel(coupling) {}

    int id() const override { return 5; }
    std::string name() const override;
    std::string description() const override;
    std::vector<std::string> parameter_names() const override;
    std::vector<ParameterKind> parameter_kinds() const override;
    Eigen::MatrixXd
    sample_parameters(ParameterSampler &sampler, const ElementRanges &ranges, Eigen::Index n) const override;
    Eigen::MatrixXcd evaluate(const Eigen::MatrixXd &parameters, const Eigen::VectorXd &omega) const override;
};

/**
 * @brief Creates the circuit with the given identifier.
 * @throws UnsupportedCircuitError for identifiers outside 1..5.
 */
std::unique_ptr<CircuitModel>
make_circuit(int circuit_id, CpeAlphaCoupling coupling = CpeAlphaCoupling::SharedFirstAlpha);

/// All identifiers accepted by make_circuit, ascending.
std::vector<int>
supported_circuit_ids();

} // namespace eis_sim

#endif // CIRCUIT_MODEL_HPP
