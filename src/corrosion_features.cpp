#include "corrosion_features.hpp"
#include "csv_io.hpp"
#include "eis_errors.hpp"
#include "feature_encoder.hpp"
#include "mat_file.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>

namespace eis_sim {

namespace {

Eigen::VectorXd
concatenate(const Eigen::VectorXd &a, const Eigen::VectorXd &b) {
    Eigen::VectorXd joined(a.size() + b.size());
    joined.head(a.size()) = a;
    joined.tail(b.size()) = b;
    return joined;
}

} // namespace

const std::array<std::string, 5> &
material_types() {
    static const std::array<std::string, 5> materials{
        { "Alloy Steel", "Carbon Steel", "Inconel", "SS304", "SS316" }
    };
    return materials;
}

const std::array<std::string, 6> &
environment_feature_names() {
    static const std::array<std::string, 6> names{
        { "temperature_c", "pressure_bar", "ph", "sulfur_ppm", "flow_velocity_ms", "service_years" }
    };
    return names;
}

Eigen::VectorXd
EnvironmentConditions::to_vector() const {
    Eigen::VectorXd v(6);
    v << temperature_c, pressure_bar, ph, sulfur_ppm, flow_velocity_ms, static_cast<double>(service_years);
    return v;
}

Eigen::VectorXd
encode_material(const std::string &material) {
    const auto &materials = material_types();
    Eigen::VectorXd one_hot = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(materials.size()));
    auto it = std::find(materials.begin(), materials.end(), material);
    if (it != materials.end()) { one_hot(std::distance(materials.begin(), it)) = 1.0; }
    return one_hot;
}

CorrosionFeatureSet
build_feature_vectors(const Eigen::VectorXd &spectrum_features,
                      const std::string &material,
                      const EnvironmentConditions &environment) {
    CorrosionFeatureSet set;
    set.spectrum = spectrum_features;
    set.env = concatenate(encode_material(material), environment.to_vector());
    set.full = concatenate(set.spectrum, set.env);
    return set;
}

const Eigen::VectorXd &
select_features(const CorrosionFeatureSet &candidates, Eigen::Index expected_count) {
    for (const Eigen::VectorXd *candidate : { &candidates.full, &candidates.spectrum, &candidates.env }) {
        if (candidate->size() == expected_count) { return *candidate; }
    }
    throw ShapeError("Model expects " + std::to_string(expected_count) + " features; candidates have " +
                     std::to_string(candidates.full.size()) + " (full), " +
                     std::to_string(candidates.spectrum.size()) + " (spectrum), " +
                     std::to_string(candidates.env.size()) + " (env).");
}

Eigen::VectorXd
spectrum_features_from_mat(const std::string &path) {
    const MatVariables variables = read_mat_file(path);
    const FeatureTensor x = to_feature_tensor(require_variable(variables, "x_data"));
    if (x.dimension(0) == 0) { throw ShapeError("x_data in '" + path + "' holds no samples."); }
    return flatten_sample(augment_with_negation(to_points_major(x)), 0);
}

std::string
to_string(CorrosionRisk risk) {
    switch (risk) {
        case CorrosionRisk::Low:
            return "Low";
        case CorrosionRisk::Moderate:
            return "Moderate";
        case CorrosionRisk::Severe:
            return "Severe";
    }
    return "Unknown";
}

CorrosionRisk
classify_risk(double rate_mm_per_year) {
    if (rate_mm_per_year < 0.1) { return CorrosionRisk::Low; }
    if (rate_mm_per_year < 0.5) { return CorrosionRisk::Moderate; }
    return CorrosionRisk::Severe;
}

EnvironmentRanges
environment_ranges_from_csv(const std::string &path) {
    EnvironmentRanges ranges;
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[CorrosionFeatures] Warning: cannot open '" << path << "', using default environment ranges."
                  << std::endl;
        return ranges;
    }

    const NumericTable table = read_numeric_csv(in);
    const std::map<std::string, std::pair<double, double> *> targets{
        { "temperature_c", &ranges.temperature_c },       { "pressure_bar", &ranges.pressure_bar },
        { "ph", &ranges.ph },                             { "sulfur_ppm", &ranges.sulfur_ppm },
        { "flow_velocity_ms", &ranges.flow_velocity_ms }, { "service_years", &ranges.service_years },
    };
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        auto it = targets.find(table.columns[c]);
        if (it == targets.end()) { continue; }
        // Empty cells arrive as NaN and are skipped
        const Eigen::ArrayXd column = table.values.col(static_cast<Eigen::Index>(c)).array();
        const auto present = column.isFinite();
        if (!present.any()) { continue; }
        const double inf = std::numeric_limits<double>::infinity();
        *it->second = { present.select(column, inf).minCoeff(), present.select(column, -inf).maxCoeff() };
    }
    return ranges;
}

} // namespace eis_sim
