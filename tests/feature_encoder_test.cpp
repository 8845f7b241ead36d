#include "eis_errors.hpp"
#include "feature_encoder.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

using namespace eis_sim;

namespace {

Eigen::MatrixXcd
sample_spectra() {
    Eigen::MatrixXcd z(2, 3);
    z << Complex(3.0, -4.0), Complex(1.0, -1.0), Complex(10.0, 0.0), //
      Complex(5.0, -12.0), Complex(2.0, -0.5), Complex(-1.0, -1.0);
    return z;
}

} // namespace

TEST(FeatureEncoderTest, ChannelMajorLayout) {
    const Eigen::MatrixXcd z = sample_spectra();
    const FeatureTensor x = encode_channels(z);
    ASSERT_EQ(x.dimension(0), 2);
    ASSERT_EQ(x.dimension(1), 3);
    ASSERT_EQ(x.dimension(2), 3);

    EXPECT_DOUBLE_EQ(x(0, IMAG_CHANNEL, 0), -4.0);
    EXPECT_DOUBLE_EQ(x(0, MAGNITUDE_CHANNEL, 0), 5.0);
    EXPECT_DOUBLE_EQ(x(1, MAGNITUDE_CHANNEL, 0), 13.0);
    EXPECT_NEAR(x(0, PHASE_CHANNEL, 1), -45.0, 1e-12);
    EXPECT_NEAR(x(0, PHASE_CHANNEL, 2), 0.0, 1e-12);
}

TEST(FeatureEncoderTest, PhaseIsQuadrantCorrectByDefault) {
    Eigen::MatrixXcd z(1, 1);
    z << Complex(-1.0, -1.0);
    EXPECT_NEAR(phase_degrees(z)(0, 0), -135.0, 1e-12);
    // The legacy formula folds the left half-plane
    EXPECT_NEAR(phase_degrees(z, PhaseFormula::LegacyAtan)(0, 0), 45.0, 1e-12);

    const FeatureTensor legacy = encode_channels(sample_spectra(), PhaseFormula::LegacyAtan);
    const FeatureTensor modern = encode_channels(sample_spectra());
    EXPECT_NEAR(legacy(0, PHASE_CHANNEL, 0), modern(0, PHASE_CHANNEL, 0), 1e-12);
    EXPECT_NEAR(modern(1, PHASE_CHANNEL, 2), -135.0, 1e-12);
}

TEST(FeatureEncoderTest, PointsMajorSwapsAxes) {
    const FeatureTensor x = encode_channels(sample_spectra());
    const FeatureTensor p = to_points_major(x);
    ASSERT_EQ(p.dimension(0), 2);
    ASSERT_EQ(p.dimension(1), 3);
    ASSERT_EQ(p.dimension(2), 3);
    for (Eigen::Index i = 0; i < 2; ++i) {
        for (Eigen::Index c = 0; c < 3; ++c) {
            for (Eigen::Index j = 0; j < 3; ++j) { EXPECT_EQ(p(i, j, c), x(i, c, j)); }
        }
    }
}

TEST(FeatureEncoderTest, AugmentationAppendsNegatedChannels) {
    Eigen::MatrixXcd z = Eigen::MatrixXcd::Constant(4, 7, Complex(2.0, -3.0));
    z(2, 5) = Complex(8.0, -1.0);
    const FeatureTensor augmented = encode_predictor_input(z);
    ASSERT_EQ(augmented.dimension(0), 4);
    ASSERT_EQ(augmented.dimension(1), 7);
    ASSERT_EQ(augmented.dimension(2), 6);
    for (Eigen::Index i = 0; i < 4; ++i) {
        for (Eigen::Index j = 0; j < 7; ++j) {
            for (Eigen::Index c = 0; c < 3; ++c) { EXPECT_EQ(augmented(i, j, c + 3), -augmented(i, j, c)); }
        }
    }
    EXPECT_DOUBLE_EQ(augmented(2, 5, IMAG_CHANNEL), -1.0);
    EXPECT_DOUBLE_EQ(augmented(2, 5, IMAG_CHANNEL + 3), 1.0);
}

TEST(FeatureEncoderTest, FlattenedSampleIsPointMajor) {
    const FeatureTensor augmented = encode_predictor_input(sample_spectra());
    const Eigen::VectorXd flat = flatten_sample(augmented, 1);
    ASSERT_EQ(flat.size(), 3 * 6);
    for (Eigen::Index j = 0; j < 3; ++j) {
        for (Eigen::Index c = 0; c < 6; ++c) { EXPECT_EQ(flat(j * 6 + c), augmented(1, j, c)); }
    }
    EXPECT_THROW(flatten_sample(augmented, 2), ShapeError);
    EXPECT_THROW(flatten_sample(augmented, -1), ShapeError);
}

TEST(FeatureEncoderTest, RejectsEmptyAndRaggedInput) {
    EXPECT_THROW(encode_channels(Eigen::MatrixXcd(0, 10)), ShapeError);
    EXPECT_THROW(encode_channels(Eigen::MatrixXcd(3, 0)), ShapeError);
    EXPECT_THROW(augment_with_negation(FeatureTensor(0, 4, 3)), ShapeError);

    EXPECT_THROW(spectra_from_rows({}), ShapeError);
    EXPECT_THROW(spectra_from_rows(std::vector<std::vector<Complex>>(1)), ShapeError);
    EXPECT_THROW(spectra_from_rows({ { Complex(1, 0), Complex(2, 0) }, { Complex(1, 0) } }), ShapeError);

    const Eigen::MatrixXcd z =
      spectra_from_rows({ { Complex(1, -1), Complex(2, -2) }, { Complex(3, -3), Complex(4, -4) } });
    EXPECT_EQ(z.rows(), 2);
    EXPECT_EQ(z(1, 0), Complex(3, -3));
}
