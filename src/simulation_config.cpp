#include "simulation_config.hpp"
#include "eis_errors.hpp"

#include <fstream>
#include <iostream>
#include <limits>

namespace eis_sim {

namespace {

ParameterRange
read_range(const nlohmann::json &json, const std::string &key) {
    const nlohmann::json &value = json.at(key);
    if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number()) {
        throw InvalidRangeError("'" + key + "' must be a [lo, hi] pair of numbers.");
    }
    return { value[0].get<double>(), value[1].get<double>() };
}

nlohmann::json
range_to_json(const ParameterRange &range) {
    return nlohmann::json::array({ range.lo, range.hi });
}

template<typename T>
void
read_if_present(const nlohmann::json &json, const std::string &key, T &target) {
    if (!json.contains(key)) { return; }
    try {
        target = json.at(key).get<T>();
    } catch (const nlohmann::json::type_error &e) {
        throw InvalidRangeError("Configuration key '" + key + "' has the wrong type: " + std::string(e.what()));
    }
}

} // namespace

CpeAlphaCoupling
parse_alpha_coupling(const std::string &text) {
    if (text == "shared_first") { return CpeAlphaCoupling::SharedFirstAlpha; }
    if (text == "independent") { return CpeAlphaCoupling::Independent; }
    throw InvalidRangeError("Unknown alpha_coupling '" + text + "' (expected \"shared_first\" or \"independent\").");
}

SimulationConfig
simulation_config_from_json(const nlohmann::json &json) {
    if (!json.is_object()) { throw InvalidRangeError("Simulation configuration must be a JSON object."); }

    SimulationConfig config;
    SimulationRequest &request = config.request;

    read_if_present(json, "circuit_id", request.circuit_id);
    read_if_present(json, "size_number", request.size_number);
    read_if_present(json, "number_of_point", request.number_of_point);
    read_if_present(json, "freq_min", request.freq_min);
    read_if_present(json, "freq_max", request.freq_max);
    read_if_present(json, "verbose", request.verbose);

    if (json.contains("resistance_range")) { request.ranges.resistance = read_range(json, "resistance_range"); }
    if (json.contains("alpha_range")) { request.ranges.alpha = read_range(json, "alpha_range"); }
    if (json.contains("q_range")) { request.ranges.q = read_range(json, "q_range"); }
    if (json.contains("sigma_range")) { request.ranges.sigma = read_range(json, "sigma_range"); }

    if (json.contains("alpha_coupling")) {
        std::string coupling;
        read_if_present(json, "alpha_coupling", coupling);
        request.alpha_coupling = parse_alpha_coupling(coupling);
    }

    if (json.contains("seed")) {
        const nlohmann::json &seed = json.at("seed");
        if (!seed.is_number_unsigned() || seed.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            throw InvalidRangeError("'seed' must be an unsigned 32-bit integer.");
        }
        config.seed = seed.get<std::uint32_t>();
    }

    validate_request(request);
    return config;
}

nlohmann::json
to_json(const SimulationConfig &config) {
    const SimulationRequest &request = config.request;
    nlohmann::json json = {
        { "circuit_id", request.circuit_id },
        { "size_number", request.size_number },
        { "number_of_point", request.number_of_point },
        { "freq_min", request.freq_min },
        { "freq_max", request.freq_max },
        { "resistance_range", range_to_json(request.ranges.resistance) },
        { "alpha_range", range_to_json(request.ranges.alpha) },
        { "q_range", range_to_json(request.ranges.q) },
        { "sigma_range", range_to_json(request.ranges.sigma) },
        { "alpha_coupling", to_string(request.alpha_coupling) },
        { "verbose", request.verbose },
    };
    if (config.seed) { json["seed"] = *config.seed; }
    return json;
}

SimulationConfig
load_simulation_config(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open configuration file: " + path); }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("JSON parsing error in file '" + path + "': " + std::string(e.what()));
    }

    SimulationConfig config = simulation_config_from_json(json);
    std::cout << "[SimulationConfig] Loaded " << path << " (circuit " << config.request.circuit_id << ", "
              << config.request.size_number << " spectra)" << std::endl;
    return config;
}

void
save_simulation_config(const std::string &path, const SimulationConfig &config) {
    std::ofstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open configuration file for writing: " + path); }
    file << to_json(config).dump(2) << '\n';
    if (!file) { throw std::runtime_error("Failed while writing configuration file: " + path); }
}

ParameterSampler
make_sampler(const SimulationConfig &config) {
    if (config.seed) { return ParameterSampler(*config.seed); }
    return ParameterSampler();
}

} // namespace eis_sim
