#ifndef CSV_IO_HPP
#define CSV_IO_HPP

#include "eis_simulator.hpp"

#include <Eigen/Core>
#include <iosfwd>
#include <string>
#include <vector>

namespace eis_sim {

/// Number formatting of exported parameter tables.
enum class CsvPrecision {
    Full,    ///< std::numeric_limits<double>::max_digits10, reads back bit-exact
    Display, ///< 4 significant digits, as shown in the parameter table
};

/**
 * @brief Writes one row per spectrum: an index label "Spectrum i" (1-based) followed by the
 * parameter columns. The header row starts with an empty cell, e.g. ",R1,R2,α₁,Q1".
 *
 * @throws ShapeError if names and parameter columns differ in count.
 */
void
write_parameter_csv(std::ostream &out,
                    const Eigen::MatrixXd &parameters,
                    const std::vector<std::string> &names,
                    CsvPrecision precision = CsvPrecision::Full);

void
write_parameter_csv_file(const std::string &path,
                         const SimulationResult &result,
                         CsvPrecision precision = CsvPrecision::Full);

/**
 * @brief Writes "frequency_hz,z_real,z_imag" followed by one line per frequency point.
 * @throws ShapeError if the vectors differ in length.
 */
void
write_spectrum_csv(std::ostream &out, const Eigen::VectorXd &frequency_hz, const Eigen::VectorXcd &spectrum);

/**
 * @brief Numeric columns of a CSV table.
 */
struct NumericTable {
    std::vector<std::string> columns;
    Eigen::MatrixXd values; ///< (rows x columns.size())
};

/**
 * @brief Reads a comma separated table with a header row and keeps only its numeric columns.
 *
 * A column is numeric when every non-empty cell parses as a number; empty cells become NaN.
 * @throws ShapeError if the table has no data rows, a row has more cells than the header,
 * or no column is numeric.
 */
NumericTable
read_numeric_csv(std::istream &in);

/// @throws std::runtime_error if the file cannot be opened.
NumericTable
read_numeric_csv_file(const std::string &path);

} // namespace eis_sim

#endif // CSV_IO_HPP
