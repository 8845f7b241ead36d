#ifndef DATASET_EXPORT_HPP
#define DATASET_EXPORT_HPP

#include "eis_simulator.hpp"
#include "mat_file.hpp"

#include <string>

namespace eis_sim {

/**
 * @brief Persisted form of a simulation: x_data = channel-major encoding (n, 3, N),
 * y_data = raw parameters (n, P) in circuit column order.
 *
 * Targets are stored unscaled. Training-time scaling belongs to prepare_targets.
 */
MatVariables
to_mat_variables(const SimulationResult &result, PhaseFormula phase_formula = PhaseFormula::Atan2);

/// x_data (n*k, 3, N) and y_data (1, n*k) class labels.
MatVariables
to_mat_variables(const ClassificationDataset &dataset);

void
export_simulation(const std::string &path,
                  const SimulationResult &result,
                  PhaseFormula phase_formula = PhaseFormula::Atan2);

void
export_classification_dataset(const std::string &path, const ClassificationDataset &dataset);

/**
 * @brief x_data and y_data read back from a persisted simulation.
 */
struct LoadedDataset {
    FeatureTensor x_data;
    Eigen::MatrixXd y_data;
};

/**
 * @brief Loads x_data (3-D) and y_data (2-D) from a MAT-file.
 *
 * A y_data row of one label per sample (as export_classification_dataset writes it)
 * comes back as an (n, 1) column.
 * @throws std::runtime_error if either variable is missing or the file is malformed.
 * @throws ShapeError if the variables have the wrong rank or disagree on the sample count.
 */
LoadedDataset
load_dataset(const std::string &path);

} // namespace eis_sim

#endif // DATASET_EXPORT_HPP
