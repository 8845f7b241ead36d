#include "eis_sim.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

int
main(int argc, char **argv) {
    std::cout << "--- EIS Spectrum Simulation ---" << '\n';

    try {
        eis_sim::SimulationConfig config;
        if (argc > 1) {
            config = eis_sim::load_simulation_config(argv[1]);
        } else {
            config.seed = 42;
            config.request.verbose = true;
        }
        const std::string prefix = argc > 2 ? argv[2] : "eis_simulation";

        eis_sim::ParameterSampler sampler = eis_sim::make_sampler(config);
        const eis_sim::SimulationResult result = eis_sim::simulate(config.request, sampler);

        // Preview of the first spectrum
        std::cout << "f [Hz]\tRe(Z)\t-Im(Z)" << '\n';
        for (Eigen::Index j = 0; j < result.points(); j += std::max<Eigen::Index>(1, result.points() / 10)) {
            std::cout << result.frequency_hz(j) << "\t" << result.spectra(0, j).real() << "\t"
                      << -result.spectra(0, j).imag() << '\n';
        }

        eis_sim::export_simulation(prefix + ".mat", result);
        eis_sim::write_parameter_csv_file(prefix + "_params.csv", result);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
