#include "mat_file.hpp"
#include "eis_errors.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace eis_sim {

namespace {

// Level-5 data types and array classes used here
constexpr std::uint32_t MI_INT8 = 1;
constexpr std::uint32_t MI_UINT8 = 2;
constexpr std::uint32_t MI_INT16 = 3;
constexpr std::uint32_t MI_UINT16 = 4;
constexpr std::uint32_t MI_INT32 = 5;
constexpr std::uint32_t MI_UINT32 = 6;
constexpr std::uint32_t MI_SINGLE = 7;
constexpr std::uint32_t MI_DOUBLE = 9;
constexpr std::uint32_t MI_INT64 = 12;
constexpr std::uint32_t MI_UINT64 = 13;
constexpr std::uint32_t MI_MATRIX = 14;
constexpr std::uint32_t MI_COMPRESSED = 15;

constexpr std::uint32_t MX_DOUBLE_CLASS = 6;
constexpr std::uint32_t MX_FIRST_NUMERIC_CLASS = 6; // double
constexpr std::uint32_t MX_LAST_NUMERIC_CLASS = 15; // uint64
constexpr std::uint32_t MX_COMPLEX_FLAG = 0x0800;

constexpr std::size_t HEADER_BYTES = 128;
constexpr std::size_t HEADER_TEXT_BYTES = 116;
constexpr std::uint16_t MAT_VERSION = 0x0100;
constexpr std::uint16_t ENDIAN_INDICATOR = ('M' << 8) | 'I';

std::size_t
padded_to_8(std::size_t bytes) {
    return (bytes + 7) / 8 * 8;
}

// --- Row-major <-> column-major ---

std::vector<double>
reorder(const std::vector<double> &src, const std::vector<Eigen::Index> &dims, bool row_to_column) {
    std::vector<double> dst(src.size());
    if (src.empty()) { return dst; }

    const std::size_t rank = dims.size();
    std::vector<Eigen::Index> column_stride(rank, 1);
    for (std::size_t k = 1; k < rank; ++k) { column_stride[k] = column_stride[k - 1] * dims[k - 1]; }

    std::vector<Eigen::Index> index(rank, 0);
    for (std::size_t r = 0; r < src.size(); ++r) {
        Eigen::Index c = 0;
        for (std::size_t k = 0; k < rank; ++k) { c += index[k] * column_stride[k]; }
        if (row_to_column) {
            dst[static_cast<std::size_t>(c)] = src[r];
        } else {
            dst[r] = src[static_cast<std::size_t>(c)];
        }
        // Advance the row-major multi-index, last axis fastest
        for (std::size_t k = rank; k-- > 0;) {
            if (++index[k] < dims[k]) { break; }
            index[k] = 0;
        }
    }
    return dst;
}

// --- Writing ---

template<typename T>
void
append_pod(std::vector<char> &buffer, const T &value) {
    const char *bytes = reinterpret_cast<const char *>(&value);
    buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
}

void
append_element(std::vector<char> &buffer, std::uint32_t type, const char *data, std::size_t bytes) {
    append_pod(buffer, type);
    append_pod(buffer, static_cast<std::uint32_t>(bytes));
    buffer.insert(buffer.end(), data, data + bytes);
    buffer.resize(buffer.size() + (padded_to_8(bytes) - bytes), '\0');
}

std::vector<char>
encode_matrix(const std::string &name, const MatArray &array) {
    if (name.empty()) { throw std::invalid_argument("MAT variable names cannot be empty."); }
    if (array.dims.empty()) { throw std::invalid_argument("MAT variable '" + name + "' has no dimensions."); }
    if (static_cast<std::size_t>(array.element_count()) != array.values.size()) {
        throw std::invalid_argument("MAT variable '" + name + "' holds " + std::to_string(array.values.size()) +
                                    " values but its dimensions describe " + std::to_string(array.element_count()) +
                                    ".");
    }

    std::vector<char> body;

    const std::array<std::uint32_t, 2> flags{ { MX_DOUBLE_CLASS, 0 } };
    append_element(body, MI_UINT32, reinterpret_cast<const char *>(flags.data()), sizeof(flags));

    // MATLAB arrays have at least two dimensions
    std::vector<std::int32_t> dims;
    for (Eigen::Index d : array.dims) { dims.push_back(static_cast<std::int32_t>(d)); }
    if (dims.size() == 1) { dims.insert(dims.begin(), 1); }
    append_element(body, MI_INT32, reinterpret_cast<const char *>(dims.data()), dims.size() * sizeof(std::int32_t));

    append_element(body, MI_INT8, name.data(), name.size());

    const std::vector<double> column_major = reorder(array.values, array.dims, true);
    append_element(
      body, MI_DOUBLE, reinterpret_cast<const char *>(column_major.data()), column_major.size() * sizeof(double));

    std::vector<char> element;
    append_pod(element, MI_MATRIX);
    append_pod(element, static_cast<std::uint32_t>(body.size()));
    element.insert(element.end(), body.begin(), body.end());
    return element;
}

std::string
header_text() {
    std::time_t now = std::time(nullptr);
    char date[64] = { 0 };
    std::strftime(date, sizeof(date), "%a %b %d %H:%M:%S %Y", std::localtime(&now));
    std::string text = std::string("MATLAB 5.0 MAT-file Platform: eis_sim, Created on: ") + date;
    text.resize(HEADER_TEXT_BYTES, ' ');
    return text;
}

// --- Reading ---

struct Element {
    std::uint32_t type = 0;
    const char *data = nullptr;
    std::size_t bytes = 0;
};

template<typename T>
T
read_pod(const char *data) {
    T value;
    std::memcpy(&value, data, sizeof(T));
    return value;
}

/// Reads one sub-element at cursor, honouring the small data element format.
Element
next_element(const std::vector<char> &buffer, std::size_t &cursor) {
    if (cursor + 8 > buffer.size()) { throw std::runtime_error("[MatFile] Truncated matrix sub-element tag."); }
    const auto first = read_pod<std::uint32_t>(buffer.data() + cursor);
    Element element;
    if ((first >> 16) != 0) {
        element.type = first & 0xFFFF;
        element.bytes = first >> 16;
        element.data = buffer.data() + cursor + 4;
        cursor += 8;
        return element;
    }
    element.type = first;
    element.bytes = read_pod<std::uint32_t>(buffer.data() + cursor + 4);
    element.data = buffer.data() + cursor + 8;
    if (cursor + 8 + element.bytes > buffer.size()) {
        throw std::runtime_error("[MatFile] Matrix sub-element overruns its parent.");
    }
    cursor += 8 + padded_to_8(element.bytes);
    return element;
}

template<typename T>
void
widen_into(const Element &element, std::vector<double> &out) {
    const std::size_t count = element.bytes / sizeof(T);
    out.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = static_cast<double>(read_pod<T>(element.data + i * sizeof(T)));
    }
}

bool
widen_numeric(const Element &element, std::vector<double> &out) {
    switch (element.type) {
        case MI_INT8:
            widen_into<std::int8_t>(element, out);
            return true;
        case MI_UINT8:
            widen_into<std::uint8_t>(element, out);
            return true;
        case MI_INT16:
            widen_into<std::int16_t>(element, out);
            return true;
        case MI_UINT16:
            widen_into<std::uint16_t>(element, out);
            return true;
        case MI_INT32:
            widen_into<std::int32_t>(element, out);
            return true;
        case MI_UINT32:
            widen_into<std::uint32_t>(element, out);
            return true;
        case MI_SINGLE:
            widen_into<float>(element, out);
            return true;
        case MI_DOUBLE:
            widen_into<double>(element, out);
            return true;
        case MI_INT64:
            widen_into<std::int64_t>(element, out);
            return true;
        case MI_UINT64:
            widen_into<std::uint64_t>(element, out);
            return true;
        default:
            return false;
    }
}

/// Decodes one miMATRIX payload. Returns false (after logging) for unsupported variables.
bool
decode_matrix(const std::vector<char> &payload, std::string &name, MatArray &array) {
    std::size_t cursor = 0;

    const Element flags = next_element(payload, cursor);
    if (flags.bytes < 4) { throw std::runtime_error("[MatFile] Array flags sub-element too short."); }
    const auto flag_word = read_pod<std::uint32_t>(flags.data);
    const std::uint32_t array_class = flag_word & 0xFF;

    const Element dims = next_element(payload, cursor);
    const Element name_element = next_element(payload, cursor);
    name.assign(name_element.data, name_element.bytes);

    if (array_class < MX_FIRST_NUMERIC_CLASS || array_class > MX_LAST_NUMERIC_CLASS) {
        std::cerr << "[MatFile] Warning: skipping non-numeric variable '" << name << "' (class " << array_class << ")."
                  << std::endl;
        return false;
    }
    if ((flag_word & MX_COMPLEX_FLAG) != 0) {
        std::cerr << "[MatFile] Warning: skipping complex variable '" << name << "'." << std::endl;
        return false;
    }

    array.dims.clear();
    for (std::size_t k = 0; k < dims.bytes / sizeof(std::int32_t); ++k) {
        array.dims.push_back(read_pod<std::int32_t>(dims.data + k * sizeof(std::int32_t)));
    }

    const Element real = next_element(payload, cursor);
    std::vector<double> column_major;
    if (!widen_numeric(real, column_major)) {
        throw std::runtime_error("[MatFile] Variable '" + name + "' uses unsupported storage type " +
                                 std::to_string(real.type) + ".");
    }
    if (static_cast<Eigen::Index>(column_major.size()) != array.element_count()) {
        throw std::runtime_error("[MatFile] Variable '" + name + "' has " + std::to_string(column_major.size()) +
                                 " values for " + std::to_string(array.element_count()) + " elements.");
    }
    array.values = reorder(column_major, array.dims, false);
    return true;
}

} // namespace

Eigen::Index
MatArray::element_count() const {
    if (dims.empty()) { return 0; }
    return std::accumulate(dims.begin(), dims.end(), Eigen::Index{ 1 }, std::multiplies<Eigen::Index>());
}

MatArray
to_mat_array(const FeatureTensor &tensor) {
    MatArray array;
    array.dims = { tensor.dimension(0), tensor.dimension(1), tensor.dimension(2) };
    array.values.assign(tensor.data(), tensor.data() + tensor.size());
    return array;
}

MatArray
to_mat_array(const Eigen::MatrixXd &matrix) {
    MatArray array;
    array.dims = { matrix.rows(), matrix.cols() };
    array.values.resize(static_cast<std::size_t>(matrix.size()));
    Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(
      array.values.data(), matrix.rows(), matrix.cols()) = matrix;
    return array;
}

MatArray
to_mat_array(const Eigen::VectorXd &vector) {
    MatArray array;
    array.dims = { 1, vector.size() };
    array.values.assign(vector.data(), vector.data() + vector.size());
    return array;
}

FeatureTensor
to_feature_tensor(const MatArray &array) {
    if (array.dims.size() != 3) {
        throw ShapeError("Expected a 3-D array, got " + std::to_string(array.dims.size()) + " dimensions.");
    }
    FeatureTensor tensor(array.dims[0], array.dims[1], array.dims[2]);
    std::copy(array.values.begin(), array.values.end(), tensor.data());
    return tensor;
}

Eigen::MatrixXd
to_matrix(const MatArray &array) {
    if (array.dims.empty() || array.dims.size() > 2) {
        throw ShapeError("Expected a 1-D or 2-D array, got " + std::to_string(array.dims.size()) + " dimensions.");
    }
    const Eigen::Index rows = array.dims.size() == 1 ? 1 : array.dims[0];
    const Eigen::Index cols = array.dims.back();
    return Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(
      array.values.data(), rows, cols);
}

void
write_mat(std::ostream &out, const MatVariables &variables) {
    std::vector<char> header;
    const std::string text = header_text();
    header.insert(header.end(), text.begin(), text.end());
    header.resize(HEADER_BYTES - 4, '\0'); // subsystem data offset: unused
    append_pod(header, MAT_VERSION);
    append_pod(header, ENDIAN_INDICATOR);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    for (const auto &pair : variables) {
        const std::vector<char> element = encode_matrix(pair.first, pair.second);
        out.write(element.data(), static_cast<std::streamsize>(element.size()));
    }
    if (!out) { throw std::runtime_error("[MatFile] Failed while writing MAT data."); }
}

void
write_mat_file(const std::string &path, const MatVariables &variables) {
    std::ofstream out(path, std::ios::binary);
    if (!out) { throw std::runtime_error("[MatFile] Cannot open '" + path + "' for writing."); }
    write_mat(out, variables);
    std::cout << "[MatFile] Wrote " << variables.size() << " variable(s) to " << path << std::endl;
}

MatVariables
read_mat(std::istream &in) {
    std::vector<char> header(HEADER_BYTES);
    if (!in.read(header.data(), static_cast<std::streamsize>(header.size()))) {
        throw std::runtime_error("[MatFile] File is shorter than a Level-5 header.");
    }
    const auto endian = read_pod<std::uint16_t>(header.data() + HEADER_BYTES - 2);
    if (endian != ENDIAN_INDICATOR) {
        throw std::runtime_error("[MatFile] Not a little-endian Level-5 MAT-file (byte-swapped or v4/v7.3 format).");
    }

    MatVariables variables;
    while (true) {
        std::array<char, 8> tag{};
        in.read(tag.data(), static_cast<std::streamsize>(tag.size()));
        if (in.gcount() == 0) { break; }
        if (in.gcount() != static_cast<std::streamsize>(tag.size())) {
            throw std::runtime_error("[MatFile] Truncated data element tag.");
        }
        const auto type = read_pod<std::uint32_t>(tag.data());
        const auto bytes = read_pod<std::uint32_t>(tag.data() + 4);

        std::vector<char> payload(bytes);
        if (!in.read(payload.data(), static_cast<std::streamsize>(bytes))) {
            throw std::runtime_error("[MatFile] Truncated data element payload.");
        }

        if (type == MI_COMPRESSED) {
            std::cerr << "[MatFile] Warning: skipping compressed variable (save without compression)." << std::endl;
            continue;
        }
        if (type != MI_MATRIX) {
            std::cerr << "[MatFile] Warning: skipping top-level element of type " << type << "." << std::endl;
            continue;
        }

        std::string name;
        MatArray array;
        if (decode_matrix(payload, name, array)) { variables[name] = std::move(array); }
    }
    return variables;
}

MatVariables
read_mat_file(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { throw std::runtime_error("[MatFile] Cannot open '" + path + "' for reading."); }
    return read_mat(in);
}

const MatArray &
require_variable(const MatVariables &variables, const std::string &name) {
    auto it = variables.find(name);
    if (it == variables.end()) {
        throw std::runtime_error("[MatFile] The file must contain an '" + name + "' variable.");
    }
    return it->second;
}

} // namespace eis_sim
