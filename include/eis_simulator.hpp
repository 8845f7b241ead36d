#ifndef EIS_SIMULATOR_HPP
#define EIS_SIMULATOR_HPP

#include "circuit_model.hpp"
#include "feature_encoder.hpp"
#include "parameter_sampler.hpp"

#include <Eigen/Core>
#include <string>
#include <vector>

namespace eis_sim {

/**
 * @brief One simulation call: which circuit, how many spectra, on which grid, from which ranges.
 *
 * Defaults match the reference dashboard (circuit 1, 10 spectra of 100 points, 0.01 Hz .. 1 MHz).
 */
struct SimulationRequest {
    int circuit_id = 1;
    int size_number = 10;      ///< Number of spectra (>= 1).
    int number_of_point = 100; ///< Frequency points per spectrum (>= 2).
    double freq_min = 0.01;    ///< Hz
    double freq_max = 1e6;     ///< Hz
    ElementRanges ranges;
    CpeAlphaCoupling alpha_coupling = CpeAlphaCoupling::SharedFirstAlpha;
    bool verbose = false; ///< Log a summary line per call to std::cout.
};

/**
 * @brief Rejects a malformed request before anything is drawn.
 *
 * @throws UnsupportedCircuitError for an unknown circuit id.
 * @throws InvalidRangeError for bad counts, frequency bounds or element ranges.
 */
void
validate_request(const SimulationRequest &request);

/**
 * @brief Spectra and the ground truth that generated them, kept together.
 *
 * Row i of spectra was produced by row i of parameters; all rows share the grid.
 */
struct SimulationResult {
    int circuit_id = 0;
    Eigen::MatrixXcd spectra;                 ///< (size_number x number_of_point)
    Eigen::MatrixXd parameters;               ///< (size_number x P), circuit column order
    Eigen::VectorXd frequency_hz;             ///< (number_of_point)
    Eigen::VectorXd angular_frequency;        ///< (number_of_point)
    std::vector<std::string> parameter_names; ///< P column names

    Eigen::Index size() const { return spectra.rows(); }
    Eigen::Index points() const { return spectra.cols(); }
};

/**
 * @brief Simulates size_number randomized spectra of one circuit.
 *
 * Draws all element values from the given sampler, evaluates the topology on the shared
 * log-spaced grid and returns spectra, parameters and both frequency vectors.
 *
 * @throws UnsupportedCircuitError, InvalidRangeError on a malformed request (before any draw).
 * @throws DomainError if evaluation produced a non-finite impedance.
 */
SimulationResult
simulate(const SimulationRequest &request, ParameterSampler &sampler);

/**
 * @brief Multi-circuit classification set: x_data (n*k, 3, points), y_data = circuit class.
 */
struct ClassificationDataset {
    FeatureTensor x_data;
    Eigen::VectorXd y_data;
    std::vector<int> circuit_ids; ///< y_data value c means circuit_ids[c]
};

/**
 * @brief Simulates every listed circuit with the request's grid and ranges and stacks the
 * channel-major encodings, circuit by circuit, labelling each block with its list position.
 *
 * request.circuit_id is ignored.
 * @throws ShapeError if circuit_ids is empty.
 */
ClassificationDataset
simulate_classification_dataset(const SimulationRequest &request,
                                const std::vector<int> &circuit_ids,
                                ParameterSampler &sampler,
                                PhaseFormula phase_formula = PhaseFormula::Atan2);

} // namespace eis_sim

#endif // EIS_SIMULATOR_HPP
