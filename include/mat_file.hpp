#ifndef MAT_FILE_HPP
#define MAT_FILE_HPP

#include "feature_encoder.hpp" // For FeatureTensor

#include <Eigen/Core>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace eis_sim {

/**
 * @brief A named real N-d array as stored in a MATLAB Level-5 MAT-file.
 *
 * values are kept in row-major (C) order, the order the tensors of this library use.
 * The file itself is column-major; conversion happens in the reader and writer.
 */
struct MatArray {
    std::vector<Eigen::Index> dims;
    std::vector<double> values;

    Eigen::Index element_count() const;
};

using MatVariables = std::map<std::string, MatArray>;

// --- Conversions ---

MatArray
to_mat_array(const FeatureTensor &tensor);

MatArray
to_mat_array(const Eigen::MatrixXd &matrix);

/// A vector is stored as a 1 x n row, as scipy.io.savemat does for 1-D arrays.
MatArray
to_mat_array(const Eigen::VectorXd &vector);

/// @throws ShapeError unless the array has exactly 3 dimensions.
FeatureTensor
to_feature_tensor(const MatArray &array);

/// @throws ShapeError unless the array has 1 or 2 dimensions.
Eigen::MatrixXd
to_matrix(const MatArray &array);

// --- Level-5 (uncompressed) reading and writing ---

/**
 * @brief Writes every variable as an uncompressed double matrix (mxDOUBLE_CLASS).
 *
 * The output is what scipy.io.savemat produces by default and loads with scipy.io.loadmat.
 * @throws std::invalid_argument for empty names or values that do not match dims.
 * @throws std::runtime_error if the stream fails.
 */
void
write_mat(std::ostream &out, const MatVariables &variables);

void
write_mat_file(const std::string &path, const MatVariables &variables);

/**
 * @brief Reads all real numeric matrices of a little-endian Level-5 MAT-file.
 *
 * Numeric storage types (int8 .. double) are widened to double. Compressed, complex, sparse,
 * cell and struct variables are skipped with a warning on std::cerr.
 * @throws std::runtime_error for a truncated or malformed file.
 */
MatVariables
read_mat(std::istream &in);

MatVariables
read_mat_file(const std::string &path);

/// Finds a variable or throws std::runtime_error naming the missing key.
const MatArray &
require_variable(const MatVariables &variables, const std::string &name);

} // namespace eis_sim

#endif // MAT_FILE_HPP
