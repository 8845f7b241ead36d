#include "feature_encoder.hpp"
#include "eis_errors.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <string>

namespace eis_sim {

namespace {

void
require_non_empty(const Eigen::MatrixXcd &spectra) {
    if (spectra.rows() == 0 || spectra.cols() == 0) {
        throw ShapeError("Feature encoder needs a non-empty batch (got " + std::to_string(spectra.rows()) + " x " +
                         std::to_string(spectra.cols()) + ").");
    }
}

void
require_non_empty(const FeatureTensor &tensor) {
    if (tensor.size() == 0) {
        throw ShapeError("Feature tensor is empty (" + std::to_string(tensor.dimension(0)) + " x " +
                         std::to_string(tensor.dimension(1)) + " x " + std::to_string(tensor.dimension(2)) + ").");
    }
}

} // namespace

Eigen::MatrixXd
phase_degrees(const Eigen::MatrixXcd &spectra, PhaseFormula formula) {
    const double to_degrees = boost::math::constants::radian<double>();
    return spectra.unaryExpr([&](const Complex &z) {
        if (formula == PhaseFormula::LegacyAtan) { return std::atan(z.imag() / z.real()) * to_degrees; }
        return std::atan2(z.imag(), z.real()) * to_degrees;
    });
}

FeatureTensor
encode_channels(const Eigen::MatrixXcd &spectra, PhaseFormula formula) {
    require_non_empty(spectra);

    const Eigen::Index samples = spectra.rows();
    const Eigen::Index points = spectra.cols();
    const Eigen::MatrixXd imag = spectra.imag();
    const Eigen::MatrixXd phase = phase_degrees(spectra, formula);
    const Eigen::MatrixXd magnitude = spectra.cwiseAbs();

    FeatureTensor x(samples, RAW_CHANNEL_COUNT, points);
    for (Eigen::Index i = 0; i < samples; ++i) {
        for (Eigen::Index j = 0; j < points; ++j) {
            x(i, IMAG_CHANNEL, j) = imag(i, j);
            x(i, PHASE_CHANNEL, j) = phase(i, j);
            x(i, MAGNITUDE_CHANNEL, j) = magnitude(i, j);
        }
    }
    return x;
}

FeatureTensor
to_points_major(const FeatureTensor &channel_major) {
    const Eigen::array<int, 3> swap_last_two{ { 0, 2, 1 } };
    FeatureTensor points_major = channel_major.shuffle(swap_last_two);
    return points_major;
}

FeatureTensor
augment_with_negation(const FeatureTensor &points_major) {
    require_non_empty(points_major);

    const Eigen::Index samples = points_major.dimension(0);
    const Eigen::Index points = points_major.dimension(1);
    const Eigen::Index channels = points_major.dimension(2);

    FeatureTensor augmented(samples, points, 2 * channels);
    const Eigen::array<Eigen::Index, 3> extents{ { samples, points, channels } };
    const Eigen::array<Eigen::Index, 3> original_offset{ { 0, 0, 0 } };
    const Eigen::array<Eigen::Index, 3> negated_offset{ { 0, 0, channels } };
    augmented.slice(original_offset, extents) = points_major;
    augmented.slice(negated_offset, extents) = -points_major;
    return augmented;
}

FeatureTensor
encode_predictor_input(const Eigen::MatrixXcd &spectra, PhaseFormula formula) {
    return augment_with_negation(to_points_major(encode_channels(spectra, formula)));
}

Eigen::VectorXd
flatten_sample(const FeatureTensor &tensor, Eigen::Index sample) {
    require_non_empty(tensor);
    if (sample < 0 || sample >= tensor.dimension(0)) {
        throw ShapeError("Sample index " + std::to_string(sample) + " out of range for " +
                         std::to_string(tensor.dimension(0)) + " samples.");
    }
    const Eigen::Index width = tensor.dimension(1) * tensor.dimension(2);
    return Eigen::Map<const Eigen::VectorXd>(tensor.data() + sample * width, width);
}

Eigen::MatrixXcd
spectra_from_rows(const std::vector<std::vector<Complex>> &rows) {
    if (rows.empty()) { throw ShapeError("Cannot build a spectrum batch from zero rows."); }
    const std::size_t points = rows.front().size();
    if (points == 0) { throw ShapeError("Spectrum rows must contain at least one point."); }

    Eigen::MatrixXcd spectra(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(points));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != points) {
            throw ShapeError("Ragged spectrum batch: row " + std::to_string(i) + " has " +
                             std::to_string(rows[i].size()) + " points, expected " + std::to_string(points) + ".");
        }
        for (std::size_t j = 0; j < points; ++j) {
            spectra(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
        }
    }
    return spectra;
}

} // namespace eis_sim
