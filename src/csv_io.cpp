#include "csv_io.hpp"
#include "eis_errors.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace eis_sim {

namespace {

constexpr int DISPLAY_DIGITS = 4;

std::vector<std::string>
split_line(std::string line) {
    boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of("\r\n"));
    std::vector<std::string> cells;
    boost::algorithm::split(cells, line, boost::algorithm::is_any_of(","));
    for (auto &cell : cells) { boost::algorithm::trim(cell); }
    return cells;
}

std::optional<double>
parse_number(const std::string &cell) {
    if (cell.empty()) { return std::numeric_limits<double>::quiet_NaN(); }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(cell, &consumed);
        if (consumed == cell.size()) { return value; }
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

void
write_parameter_csv(std::ostream &out,
                    const Eigen::MatrixXd &parameters,
                    const std::vector<std::string> &names,
                    CsvPrecision precision) {
    if (static_cast<Eigen::Index>(names.size()) != parameters.cols()) {
        throw ShapeError("Parameter table has " + std::to_string(parameters.cols()) + " columns but " +
                         std::to_string(names.size()) + " names.");
    }

    std::ostringstream buffer;
    buffer.precision(precision == CsvPrecision::Full ? std::numeric_limits<double>::max_digits10 : DISPLAY_DIGITS);

    for (const auto &name : names) { buffer << ',' << name; }
    buffer << '\n';
    for (Eigen::Index i = 0; i < parameters.rows(); ++i) {
        buffer << "Spectrum " << (i + 1);
        for (Eigen::Index j = 0; j < parameters.cols(); ++j) { buffer << ',' << parameters(i, j); }
        buffer << '\n';
    }

    out << buffer.str();
    if (!out) { throw std::runtime_error("[CsvIo] Failed while writing the parameter table."); }
}

void
write_parameter_csv_file(const std::string &path, const SimulationResult &result, CsvPrecision precision) {
    std::ofstream out(path);
    if (!out) { throw std::runtime_error("[CsvIo] Cannot open '" + path + "' for writing."); }
    write_parameter_csv(out, result.parameters, result.parameter_names, precision);
    std::cout << "[CsvIo] Wrote " << result.parameters.rows() << " parameter row(s) to " << path << std::endl;
}

void
write_spectrum_csv(std::ostream &out, const Eigen::VectorXd &frequency_hz, const Eigen::VectorXcd &spectrum) {
    if (frequency_hz.size() != spectrum.size()) {
        throw ShapeError("Spectrum has " + std::to_string(spectrum.size()) + " points but the grid has " +
                         std::to_string(frequency_hz.size()) + ".");
    }

    std::ostringstream buffer;
    buffer.precision(std::numeric_limits<double>::max_digits10);
    buffer << "frequency_hz,z_real,z_imag\n";
    for (Eigen::Index i = 0; i < spectrum.size(); ++i) {
        buffer << frequency_hz(i) << ',' << spectrum(i).real() << ',' << spectrum(i).imag() << '\n';
    }

    out << buffer.str();
    if (!out) { throw std::runtime_error("[CsvIo] Failed while writing the spectrum."); }
}

NumericTable
read_numeric_csv(std::istream &in) {
    std::string line;
    if (!std::getline(in, line)) { throw ShapeError("The CSV file is empty."); }
    const std::vector<std::string> header = split_line(line);

    std::vector<std::vector<std::optional<double>>> rows;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) { continue; }
        std::vector<std::string> cells = split_line(line);
        if (cells.size() > header.size()) {
            throw ShapeError("CSV row " + std::to_string(rows.size() + 1) + " has " + std::to_string(cells.size()) +
                             " cells but the header has " + std::to_string(header.size()) + ".");
        }
        cells.resize(header.size());

        std::vector<std::optional<double>> parsed;
        parsed.reserve(cells.size());
        for (const auto &cell : cells) { parsed.push_back(parse_number(cell)); }
        rows.push_back(std::move(parsed));
    }
    if (rows.empty()) { throw ShapeError("The CSV file is empty."); }

    std::vector<std::size_t> numeric_columns;
    for (std::size_t c = 0; c < header.size(); ++c) {
        bool numeric = true;
        for (const auto &row : rows) {
            if (!row[c]) {
                numeric = false;
                break;
            }
        }
        if (numeric) { numeric_columns.push_back(c); }
    }
    if (numeric_columns.empty()) {
        throw ShapeError("The CSV file does not contain any numeric columns.");
    }

    NumericTable table;
    table.values.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(numeric_columns.size()));
    for (std::size_t k = 0; k < numeric_columns.size(); ++k) {
        const std::size_t c = numeric_columns[k];
        table.columns.push_back(header[c]);
        for (std::size_t r = 0; r < rows.size(); ++r) {
            table.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(k)) = *rows[r][c];
        }
    }
    return table;
}

NumericTable
read_numeric_csv_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) { throw std::runtime_error("[CsvIo] Cannot open '" + path + "' for reading."); }
    return read_numeric_csv(in);
}

} // namespace eis_sim
