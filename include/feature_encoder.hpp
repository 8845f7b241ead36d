#ifndef FEATURE_ENCODER_HPP
#define FEATURE_ENCODER_HPP

#include "impedance_elements.hpp" // For Complex

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

namespace eis_sim {

/**
 * @brief Real 3-D feature tensor, row-major so its memory layout matches the
 * (samples, a, b) arrays the training and inference code index.
 */
using FeatureTensor = Eigen::Tensor<double, 3, Eigen::RowMajor>;

// Channel order of the raw 3-channel encoding
constexpr Eigen::Index IMAG_CHANNEL = 0;
constexpr Eigen::Index PHASE_CHANNEL = 1;
constexpr Eigen::Index MAGNITUDE_CHANNEL = 2;
constexpr Eigen::Index RAW_CHANNEL_COUNT = 3;

/**
 * @brief Phase formula used for channel 1.
 *
 * Atan2 is quadrant-correct and the default. LegacyAtan reproduces the persisted-export
 * formula atan(Im/Re), which folds Re < 0 samples into (-90, 90) degrees. It only exists to
 * regenerate data bit-compatible with files written that way.
 */
enum class PhaseFormula {
    Atan2,
    LegacyAtan,
};

/**
 * @brief Phase in degrees of each entry.
 */
Eigen::MatrixXd
phase_degrees(const Eigen::MatrixXcd &spectra, PhaseFormula formula = PhaseFormula::Atan2);

/**
 * @brief Channel-major encoding (samples, 3, points): imaginary part, phase [deg], |Z|.
 *
 * @throws ShapeError for an empty batch or zero frequency points.
 */
FeatureTensor
encode_channels(const Eigen::MatrixXcd &spectra, PhaseFormula formula = PhaseFormula::Atan2);

/**
 * @brief Swaps the channel and point axes: (samples, C, points) -> (samples, points, C).
 */
FeatureTensor
to_points_major(const FeatureTensor &channel_major);

/**
 * @brief Appends the negation of every channel: (samples, points, C) -> (samples, points, 2C).
 *
 * Channel C + k is -1 times channel k. Every trained regressor expects this doubled width.
 * @throws ShapeError for an empty tensor.
 */
FeatureTensor
augment_with_negation(const FeatureTensor &points_major);

/**
 * @brief Full predictor input: augment_with_negation(to_points_major(encode_channels(...))).
 */
FeatureTensor
encode_predictor_input(const Eigen::MatrixXcd &spectra, PhaseFormula formula = PhaseFormula::Atan2);

/**
 * @brief Flattens one sample (row-major over the last two axes) into a feature vector.
 *
 * For a (samples, points, 6) tensor this is the points*6 vector a flat regressor consumes.
 * @throws ShapeError if the sample index is out of range.
 */
Eigen::VectorXd
flatten_sample(const FeatureTensor &tensor, Eigen::Index sample);

/**
 * @brief Builds a ComplexSpectrum matrix from per-spectrum rows.
 *
 * @throws ShapeError for no rows, empty rows, or rows of different lengths.
 */
Eigen::MatrixXcd
spectra_from_rows(const std::vector<std::vector<Complex>> &rows);

} // namespace eis_sim

#endif // FEATURE_ENCODER_HPP
