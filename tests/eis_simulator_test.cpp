#include "eis_errors.hpp"
#include "eis_simulator.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

using namespace eis_sim;

TEST(EisSimulatorTest, ShapesForCircuitFour) {
    ParameterSampler sampler(11);
    const SimulationResult result = simulate(make_request(4, 10, 50), sampler);
    EXPECT_EQ(result.circuit_id, 4);
    EXPECT_EQ(result.spectra.rows(), 10);
    EXPECT_EQ(result.spectra.cols(), 50);
    EXPECT_EQ(result.parameters.rows(), 10);
    EXPECT_EQ(result.parameters.cols(), 8);
    EXPECT_EQ(result.frequency_hz.size(), 50);
    EXPECT_EQ(result.angular_frequency.size(), 50);
    EXPECT_EQ(result.parameter_names.size(), 8u);
    EXPECT_EQ(result.size(), 10);
    EXPECT_EQ(result.points(), 50);
}

TEST(EisSimulatorTest, ShapesForEveryCircuit) {
    const Eigen::Index widths[] = { 4, 7, 5, 8, 8 };
    for (int id : supported_circuit_ids()) {
        ParameterSampler sampler(static_cast<std::uint32_t>(id));
        const SimulationResult result = simulate(make_request(id, 3, 20), sampler);
        EXPECT_EQ(result.parameters.cols(), widths[id - 1]) << "circuit " << id;
        EXPECT_TRUE(result.spectra.real().allFinite());
        EXPECT_TRUE(result.spectra.imag().allFinite());
    }
}

TEST(EisSimulatorTest, RowsPairSpectraWithParameters) {
    ParameterSampler sampler(21);
    const SimulationResult result = simulate(make_request(3, 6, 30), sampler);
    const auto circuit = make_circuit(3);
    for (Eigen::Index i = 0; i < result.size(); ++i) {
        const Eigen::VectorXcd row =
          circuit->evaluate_row(result.parameters.row(i).transpose(), result.angular_frequency);
        for (Eigen::Index j = 0; j < result.points(); ++j) {
            EXPECT_COMPLEX_REL_NEAR(result.spectra(i, j), row(j), 1e-12);
        }
    }
}

TEST(EisSimulatorTest, GridUsesRequestedBounds) {
    SimulationRequest request = make_request(1, 2, 25);
    request.freq_min = 0.1;
    request.freq_max = 1e5;
    ParameterSampler sampler(1);
    const SimulationResult result = simulate(request, sampler);
    EXPECT_EQ(result.frequency_hz(0), 0.1);
    EXPECT_EQ(result.frequency_hz(24), 1e5);
}

TEST(EisSimulatorTest, SeededRunsAreReproducible) {
    ParameterSampler a(2024);
    ParameterSampler b(2024);
    ParameterSampler c(2025);
    const SimulationResult ra = simulate(make_request(5), a);
    const SimulationResult rb = simulate(make_request(5), b);
    const SimulationResult rc = simulate(make_request(5), c);
    EXPECT_EQ(ra.parameters, rb.parameters);
    EXPECT_EQ(ra.spectra, rb.spectra);
    EXPECT_NE(ra.parameters, rc.parameters);
}

TEST(EisSimulatorTest, SamplerIsOneSequentialStream) {
    ParameterSampler sampler(9);
    const SimulationResult first = simulate(make_request(1, 4, 10), sampler);
    const SimulationResult second = simulate(make_request(1, 4, 10), sampler);
    EXPECT_NE(first.parameters, second.parameters);
}

TEST(EisSimulatorTest, ValidationHappensBeforeDraws) {
    ParameterSampler used(5);
    ParameterSampler fresh(5);

    SimulationRequest bad = make_request(2);
    bad.ranges.q = { 1e-3, 1e-5 };
    EXPECT_THROW(simulate(bad, used), InvalidRangeError);

    // The failed call consumed nothing from the stream
    EXPECT_EQ(simulate(make_request(2), used).parameters, simulate(make_request(2), fresh).parameters);
}

TEST(EisSimulatorTest, RejectsMalformedRequests) {
    ParameterSampler sampler(1);
    EXPECT_THROW(simulate(make_request(0), sampler), UnsupportedCircuitError);
    EXPECT_THROW(simulate(make_request(6), sampler), UnsupportedCircuitError);
    EXPECT_THROW(simulate(make_request(1, 0, 50), sampler), InvalidRangeError);
    EXPECT_THROW(simulate(make_request(1, 5, 1), sampler), InvalidRangeError);

    SimulationRequest inverted = make_request(1);
    inverted.freq_min = 1e6;
    inverted.freq_max = 0.01;
    EXPECT_THROW(simulate(inverted, sampler), InvalidRangeError);

    SimulationRequest zero_min = make_request(1);
    zero_min.freq_min = 0.0;
    EXPECT_THROW(validate_request(zero_min), InvalidRangeError);

    SimulationRequest bad_alpha = make_request(1);
    bad_alpha.ranges.alpha = { 0.9, 1.1 };
    EXPECT_THROW(validate_request(bad_alpha), InvalidRangeError);
}

TEST(EisSimulatorTest, ClassificationDatasetStacksCircuits) {
    ParameterSampler sampler(13);
    const std::vector<int> ids = { 3, 1, 4 };
    const ClassificationDataset dataset = simulate_classification_dataset(make_request(1, 5, 40), ids, sampler);

    ASSERT_EQ(dataset.x_data.dimension(0), 15);
    ASSERT_EQ(dataset.x_data.dimension(1), RAW_CHANNEL_COUNT);
    ASSERT_EQ(dataset.x_data.dimension(2), 40);
    ASSERT_EQ(dataset.y_data.size(), 15);
    EXPECT_EQ(dataset.circuit_ids, ids);
    for (Eigen::Index i = 0; i < 15; ++i) { EXPECT_EQ(dataset.y_data(i), static_cast<double>(i / 5)); }

    // Magnitude channel is positive everywhere
    for (Eigen::Index i = 0; i < 15; ++i) {
        for (Eigen::Index j = 0; j < 40; ++j) { EXPECT_GT(dataset.x_data(i, MAGNITUDE_CHANNEL, j), 0.0); }
    }
}

TEST(EisSimulatorTest, ClassificationDatasetValidatesFirst) {
    ParameterSampler sampler(13);
    EXPECT_THROW(simulate_classification_dataset(make_request(1), {}, sampler), ShapeError);
    EXPECT_THROW(simulate_classification_dataset(make_request(1), { 1, 7 }, sampler), UnsupportedCircuitError);
}
