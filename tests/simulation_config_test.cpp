#include "eis_errors.hpp"
#include "simulation_config.hpp"
#include "test_utils.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace eis_sim;
using nlohmann::json;

TEST(SimulationConfigTest, EmptyObjectKeepsDefaults) {
    const SimulationConfig config = simulation_config_from_json(json::object());
    const SimulationRequest defaults;
    EXPECT_EQ(config.request.circuit_id, defaults.circuit_id);
    EXPECT_EQ(config.request.size_number, 10);
    EXPECT_EQ(config.request.number_of_point, 100);
    EXPECT_EQ(config.request.freq_min, 0.01);
    EXPECT_EQ(config.request.freq_max, 1e6);
    EXPECT_EQ(config.request.ranges.resistance, (ParameterRange{ 1e-1, 1e4 }));
    EXPECT_EQ(config.request.ranges.alpha, (ParameterRange{ 0.8, 1.0 }));
    EXPECT_EQ(config.request.ranges.q, (ParameterRange{ 1e-5, 1e-3 }));
    EXPECT_EQ(config.request.ranges.sigma, (ParameterRange{ 1.0, 1e3 }));
    EXPECT_EQ(config.request.alpha_coupling, CpeAlphaCoupling::SharedFirstAlpha);
    EXPECT_FALSE(config.seed.has_value());
}

TEST(SimulationConfigTest, ReadsEveryKey) {
    const json j = json::parse(R"({
        "circuit_id": 4, "size_number": 250, "number_of_point": 64,
        "freq_min": 0.1, "freq_max": 1e5,
        "resistance_range": [1, 1000], "alpha_range": [0.7, 0.95],
        "q_range": [1e-6, 1e-4], "sigma_range": [5, 50],
        "alpha_coupling": "independent", "seed": 42, "verbose": true
    })");
    const SimulationConfig config = simulation_config_from_json(j);
    EXPECT_EQ(config.request.circuit_id, 4);
    EXPECT_EQ(config.request.size_number, 250);
    EXPECT_EQ(config.request.number_of_point, 64);
    EXPECT_EQ(config.request.freq_min, 0.1);
    EXPECT_EQ(config.request.freq_max, 1e5);
    EXPECT_EQ(config.request.ranges.resistance, (ParameterRange{ 1.0, 1000.0 }));
    EXPECT_EQ(config.request.ranges.alpha, (ParameterRange{ 0.7, 0.95 }));
    EXPECT_EQ(config.request.ranges.sigma, (ParameterRange{ 5.0, 50.0 }));
    EXPECT_EQ(config.request.alpha_coupling, CpeAlphaCoupling::Independent);
    EXPECT_TRUE(config.request.verbose);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 42u);
}

TEST(SimulationConfigTest, RoundTripThroughFile) {
    SimulationConfig config;
    config.request.circuit_id = 5;
    config.request.size_number = 3;
    config.request.ranges.q = { 2e-6, 3e-4 };
    config.request.alpha_coupling = CpeAlphaCoupling::Independent;
    config.seed = 7;

    const std::string path = ::testing::TempDir() + "simulation_config_test.json";
    save_simulation_config(path, config);
    const SimulationConfig loaded = load_simulation_config(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.request.circuit_id, 5);
    EXPECT_EQ(loaded.request.size_number, 3);
    EXPECT_EQ(loaded.request.ranges.q, config.request.ranges.q);
    EXPECT_EQ(loaded.request.alpha_coupling, CpeAlphaCoupling::Independent);
    EXPECT_EQ(loaded.seed, config.seed);
    EXPECT_EQ(to_json(loaded), to_json(config));
}

TEST(SimulationConfigTest, SeedMakesRunsReproducible) {
    SimulationConfig config;
    config.seed = 99;
    ParameterSampler a = make_sampler(config);
    ParameterSampler b = make_sampler(config);
    EXPECT_EQ(simulate(config.request, a).parameters, simulate(config.request, b).parameters);
}

TEST(SimulationConfigTest, RejectsBadValues) {
    EXPECT_THROW(simulation_config_from_json(json::array()), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "size_number", "ten" } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "alpha_coupling", "both" } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "alpha_coupling", 3 } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "q_range", { 1e-5 } } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "q_range", { 1e-3, 1e-5 } } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "seed", -1 } }), InvalidRangeError);
    EXPECT_THROW(simulation_config_from_json(json{ { "circuit_id", 9 } }), UnsupportedCircuitError);
    EXPECT_EQ(parse_alpha_coupling("shared_first"), CpeAlphaCoupling::SharedFirstAlpha);
}

TEST(SimulationConfigTest, LoadReportsFileProblems) {
    EXPECT_THROW(load_simulation_config(::testing::TempDir() + "missing_config.json"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "broken_config.json";
    {
        std::ofstream out(path);
        out << "{ \"circuit_id\": ";
    }
    EXPECT_THROW(load_simulation_config(path), std::runtime_error);
    std::remove(path.c_str());
}
