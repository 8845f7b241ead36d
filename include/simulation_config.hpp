#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "eis_simulator.hpp"
#include "parameter_sampler.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace eis_sim {

/**
 * @brief A simulation request plus the optional seed of its random stream.
 *
 * JSON form (every key optional, missing keys keep the SimulationRequest defaults):
 * @code
 * { "circuit_id": 4, "size_number": 1000, "number_of_point": 100,
 *   "freq_min": 0.01, "freq_max": 1e6,
 *   "resistance_range": [0.1, 1e4], "alpha_range": [0.8, 1.0],
 *   "q_range": [1e-5, 1e-3], "sigma_range": [1, 1e3],
 *   "alpha_coupling": "shared_first", "seed": 42, "verbose": true }
 * @endcode
 */
struct SimulationConfig {
    SimulationRequest request;
    std::optional<std::uint32_t> seed;
};

/// "shared_first" or "independent".
/// @throws InvalidRangeError for any other string.
CpeAlphaCoupling
parse_alpha_coupling(const std::string &text);

/**
 * @brief Reads a configuration object and validates the resulting request.
 * @throws InvalidRangeError for wrong value types, malformed ranges or an unknown coupling.
 * @throws UnsupportedCircuitError for an unknown circuit id.
 */
SimulationConfig
simulation_config_from_json(const nlohmann::json &json);

nlohmann::json
to_json(const SimulationConfig &config);

/// @throws std::runtime_error if the file cannot be opened or is not valid JSON.
SimulationConfig
load_simulation_config(const std::string &path);

void
save_simulation_config(const std::string &path, const SimulationConfig &config);

/// Seeded sampler when the configuration names a seed, otherwise a nondeterministic one.
ParameterSampler
make_sampler(const SimulationConfig &config);

} // namespace eis_sim

#endif // SIMULATION_CONFIG_HPP
