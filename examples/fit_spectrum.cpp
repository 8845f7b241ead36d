#include "eis_sim.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>

int
main() {
    std::cout << "--- Equivalent Circuit Fit ---" << '\n';

    try {
        // --- 1. Simulate one spectrum with known values ---
        eis_sim::SimulationRequest request;
        request.circuit_id = 1;
        request.size_number = 1;
        request.number_of_point = 60;

        eis_sim::ParameterSampler sampler(7);
        const eis_sim::SimulationResult truth = eis_sim::simulate(request, sampler);

        // --- 2. Fit it back from a neutral starting point ---
        const std::unique_ptr<eis_sim::CircuitModel> circuit = eis_sim::make_circuit(request.circuit_id);
        eis_sim::FitOptions options;
        options.verbose = true;
        eis_sim::CircuitFitter fitter(*circuit, options);

        const eis_sim::FitResult fit = fitter.fit(truth.angular_frequency,
                                                  truth.spectra.row(0).transpose(),
                                                  eis_sim::default_initial_guess(*circuit, request.ranges));

        // --- 3. Report ---
        std::cout << std::setw(8) << "name" << std::setw(16) << "true" << std::setw(16) << "fitted" << '\n';
        for (Eigen::Index k = 0; k < fit.parameters.size(); ++k) {
            std::cout << std::setw(8) << truth.parameter_names[static_cast<std::size_t>(k)] << std::setw(16)
                      << truth.parameters(0, k) << std::setw(16) << fit.parameters(k) << '\n';
        }
        std::cout << "converged: " << std::boolalpha << fit.converged << ", iterations: " << fit.iterations
                  << ", residual rms: " << fit.residual_rms << '\n';
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
