#include "eis_simulator.hpp"
#include "eis_errors.hpp"
#include "frequency_grid.hpp"

#include <iostream>
#include <memory>

namespace eis_sim {

void
validate_request(const SimulationRequest &request) {
    const std::unique_ptr<CircuitModel> circuit = make_circuit(request.circuit_id, request.alpha_coupling);

    if (request.size_number < 1) {
        throw InvalidRangeError("size_number must be >= 1 (got " + std::to_string(request.size_number) + ").");
    }
    if (request.number_of_point < 2) {
        throw InvalidRangeError("number_of_point must be >= 2 (got " + std::to_string(request.number_of_point) +
                                ").");
    }
    // Frequency bounds are checked by the grid itself; build a 2-point grid to fail fast.
    FrequencyGrid::generate(request.freq_min, request.freq_max, 2);
    circuit->validate_ranges(request.ranges);
}

SimulationResult
simulate(const SimulationRequest &request, ParameterSampler &sampler) {
    validate_request(request);

    const std::unique_ptr<CircuitModel> circuit = make_circuit(request.circuit_id, request.alpha_coupling);
    const FrequencyGrid grid = FrequencyGrid::generate(request.freq_min, request.freq_max, request.number_of_point);

    SimulationResult result;
    result.circuit_id = circuit->id();
    result.parameter_names = circuit->parameter_names();
    result.frequency_hz = grid.frequency_hz();
    result.angular_frequency = grid.angular_frequency();
    result.parameters = circuit->sample_parameters(sampler, request.ranges, request.size_number);
    result.spectra = circuit->evaluate(result.parameters, result.angular_frequency);

    if (!result.spectra.real().allFinite() || !result.spectra.imag().allFinite()) {
        throw DomainError("Circuit " + std::to_string(circuit->id()) +
                          " produced a non-finite impedance; check the element ranges.");
    }

    if (request.verbose) {
        std::cout << "[EisSimulator] " << circuit->name() << ": " << result.size() << " spectra x "
                  << result.points() << " points, " << grid.f_min() << " Hz .. " << grid.f_max() << " Hz" << std::endl;
        if (circuit->has_second_cpe() && circuit->alpha_coupling() == CpeAlphaCoupling::SharedFirstAlpha) {
            std::cerr << "[EisSimulator] Warning: Q2 evaluated with alpha1; stored alpha2 column is not the "
                         "exponent used for Q2."
                      << std::endl;
        }
    }
    return result;
}

ClassificationDataset
simulate_classification_dataset(const SimulationRequest &request,
                                const std::vector<int> &circuit_ids,
                                ParameterSampler &sampler,
                                PhaseFormula phase_formula) {
    if (circuit_ids.empty()) { throw ShapeError("Classification dataset needs at least one circuit id."); }

    // Validate every circuit before the first draw
    for (int id : circuit_ids) {
        SimulationRequest per_circuit = request;
        per_circuit.circuit_id = id;
        validate_request(per_circuit);
    }

    const Eigen::Index block = request.size_number;
    const Eigen::Index points = request.number_of_point;
    const Eigen::Index classes = static_cast<Eigen::Index>(circuit_ids.size());

    ClassificationDataset dataset;
    dataset.circuit_ids = circuit_ids;
    dataset.x_data = FeatureTensor(block * classes, RAW_CHANNEL_COUNT, points);
    dataset.y_data.resize(block * classes);

    const Eigen::array<Eigen::Index, 3> extents{ { block, RAW_CHANNEL_COUNT, points } };
    for (Eigen::Index c = 0; c < classes; ++c) {
        SimulationRequest per_circuit = request;
        per_circuit.circuit_id = circuit_ids[static_cast<std::size_t>(c)];
        const SimulationResult result = simulate(per_circuit, sampler);

        const Eigen::array<Eigen::Index, 3> offset{ { c * block, 0, 0 } };
        dataset.x_data.slice(offset, extents) = encode_channels(result.spectra, phase_formula);
        dataset.y_data.segment(c * block, block).setConstant(static_cast<double>(c));
    }

    if (request.verbose) {
        std::cout << "[EisSimulator] Classification dataset: " << classes << " circuits, " << dataset.y_data.size()
                  << " samples." << std::endl;
    }
    return dataset;
}

} // namespace eis_sim
