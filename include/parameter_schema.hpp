#ifndef PARAMETER_SCHEMA_HPP
#define PARAMETER_SCHEMA_HPP

#include "feature_encoder.hpp"

#include <Eigen/Core>
#include <string>
#include <variant>
#include <vector>

namespace eis_sim {

/**
 * @brief Raw 8-column ground truth of circuits 4 and 5:
 * R1, R2, R3, alpha1, Q1, alpha2, Q2, sigma.
 */
struct Full8Column {};

/**
 * @brief Already reduced 6-column targets Rs, R1, R2, Q1, Q2, Sigma (no ideality columns).
 */
struct Reduced6Column {};

/**
 * @brief Layout of a target matrix handed to the training preprocessor.
 *
 * Chosen by the caller. Never inferred from the matrix width, since circuit 1 produces
 * 4 columns and circuit 3 produces 5, and a width-based guess would silently accept them.
 */
using ParameterSchema = std::variant<Full8Column, Reduced6Column>;

/// Training-time scaling differs between the training and the held-out test files.
enum class TargetMode {
    Train,
    Test,
};

/// Number of columns a matrix in this schema must have.
Eigen::Index
expected_width(const ParameterSchema &schema);

/// Names of the prepared target columns (always 6).
std::vector<std::string>
prepared_target_names();

/**
 * @brief Applies the training-time target contract.
 *
 * Full8Column, Train: alpha columns (3, 5) x 1e4, Q columns (4, 6) x 1e7.
 * Full8Column, Test: Q columns (4, 6) x 1e6.
 * Then the alpha columns are removed, leaving 6 columns.
 * Reduced6Column: returned unchanged.
 *
 * The simulator never applies this itself; doing it twice would double-scale Q.
 *
 * @throws ShapeError if y has no rows or the wrong number of columns for the schema.
 */
Eigen::MatrixXd
prepare_targets(const Eigen::MatrixXd &y, const ParameterSchema &schema, TargetMode mode);

/**
 * @brief Inputs and targets ready for a regressor.
 */
struct TrainingData {
    FeatureTensor x; ///< (samples, points, 2C) augmented, points-major
    Eigen::MatrixXd y; ///< (samples, 6)
};

/**
 * @brief Reproduces the training preprocessor: channel-major x is swapped to points-major and
 * augmented with negated channels, y goes through prepare_targets.
 *
 * @throws ShapeError if x and y disagree on the number of samples.
 */
TrainingData
prepare_training_data(const FeatureTensor &x_channel_major,
                      const Eigen::MatrixXd &y,
                      const ParameterSchema &schema,
                      TargetMode mode);

} // namespace eis_sim

#endif // PARAMETER_SCHEMA_HPP
