#include "parameter_schema.hpp"
#include "eis_errors.hpp"

#include <type_traits>

namespace eis_sim {

namespace {

// Column positions in the Full8Column layout
constexpr Eigen::Index ALPHA1_COL = 3;
constexpr Eigen::Index Q1_COL = 4;
constexpr Eigen::Index ALPHA2_COL = 5;
constexpr Eigen::Index Q2_COL = 6;

constexpr double TRAIN_ALPHA_SCALE = 1e4;
constexpr double TRAIN_Q_SCALE = 1e7;
constexpr double TEST_Q_SCALE = 1e6;

Eigen::MatrixXd
reduce_full_layout(const Eigen::MatrixXd &y, TargetMode mode) {
    Eigen::MatrixXd scaled = y;
    if (mode == TargetMode::Train) {
        scaled.col(ALPHA1_COL) *= TRAIN_ALPHA_SCALE;
        scaled.col(Q1_COL) *= TRAIN_Q_SCALE;
        scaled.col(ALPHA2_COL) *= TRAIN_ALPHA_SCALE;
        scaled.col(Q2_COL) *= TRAIN_Q_SCALE;
    } else {
        scaled.col(Q1_COL) *= TEST_Q_SCALE;
        scaled.col(Q2_COL) *= TEST_Q_SCALE;
    }

    // Drop the two ideality columns: keep 0,1,2,4,6,7
    Eigen::MatrixXd reduced(scaled.rows(), 6);
    reduced.leftCols(3) = scaled.leftCols(3);
    reduced.col(3) = scaled.col(Q1_COL);
    reduced.col(4) = scaled.col(Q2_COL);
    reduced.col(5) = scaled.col(7);
    return reduced;
}

} // namespace

Eigen::Index
expected_width(const ParameterSchema &schema) {
    return std::visit(
      [](const auto &layout) -> Eigen::Index {
          using Layout = std::decay_t<decltype(layout)>;
          if constexpr (std::is_same_v<Layout, Full8Column>) {
              return 8;
          } else {
              return 6;
          }
      },
      schema);
}

std::vector<std::string>
prepared_target_names() {
    return { "Rs", "R1", "R2", "Q1", "Q2", "Sigma" };
}

Eigen::MatrixXd
prepare_targets(const Eigen::MatrixXd &y, const ParameterSchema &schema, TargetMode mode) {
    const Eigen::Index width = expected_width(schema);
    if (y.rows() == 0) { throw ShapeError("Target matrix has no rows."); }
    if (y.cols() != width) {
        throw ShapeError("Target matrix has " + std::to_string(y.cols()) + " columns but the selected schema expects " +
                         std::to_string(width) + ".");
    }

    if (std::holds_alternative<Full8Column>(schema)) { return reduce_full_layout(y, mode); }
    return y;
}

TrainingData
prepare_training_data(const FeatureTensor &x_channel_major,
                      const Eigen::MatrixXd &y,
                      const ParameterSchema &schema,
                      TargetMode mode) {
    if (x_channel_major.dimension(0) != y.rows()) {
        throw ShapeError("x_data has " + std::to_string(x_channel_major.dimension(0)) + " samples but y_data has " +
                         std::to_string(y.rows()) + " rows.");
    }
    TrainingData data;
    data.x = augment_with_negation(to_points_major(x_channel_major));
    data.y = prepare_targets(y, schema, mode);
    return data;
}

} // namespace eis_sim
