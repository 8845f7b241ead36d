#include "dataset_export.hpp"
#include "eis_errors.hpp"

namespace eis_sim {

MatVariables
to_mat_variables(const SimulationResult &result, PhaseFormula phase_formula) {
    MatVariables variables;
    variables["x_data"] = to_mat_array(encode_channels(result.spectra, phase_formula));
    variables["y_data"] = to_mat_array(result.parameters);
    return variables;
}

MatVariables
to_mat_variables(const ClassificationDataset &dataset) {
    MatVariables variables;
    variables["x_data"] = to_mat_array(dataset.x_data);
    variables["y_data"] = to_mat_array(dataset.y_data);
    return variables;
}

void
export_simulation(const std::string &path, const SimulationResult &result, PhaseFormula phase_formula) {
    write_mat_file(path, to_mat_variables(result, phase_formula));
}

void
export_classification_dataset(const std::string &path, const ClassificationDataset &dataset) {
    write_mat_file(path, to_mat_variables(dataset));
}

LoadedDataset
load_dataset(const std::string &path) {
    const MatVariables variables = read_mat_file(path);

    LoadedDataset loaded;
    loaded.x_data = to_feature_tensor(require_variable(variables, "x_data"));
    loaded.y_data = to_matrix(require_variable(variables, "y_data"));

    // Class labels are stored as a (1, n) row
    const Eigen::Index samples = loaded.x_data.dimension(0);
    if (loaded.y_data.rows() == 1 && loaded.y_data.cols() == samples && samples != 1) {
        loaded.y_data.transposeInPlace();
    }

    if (loaded.x_data.dimension(0) != loaded.y_data.rows()) {
        throw ShapeError("x_data has " + std::to_string(loaded.x_data.dimension(0)) + " samples but y_data has " +
                         std::to_string(loaded.y_data.rows()) + " rows.");
    }
    return loaded;
}

} // namespace eis_sim
