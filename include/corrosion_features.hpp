#ifndef CORROSION_FEATURES_HPP
#define CORROSION_FEATURES_HPP

#include <Eigen/Core>
#include <array>
#include <string>
#include <utility>

namespace eis_sim {

/// Material names in one-hot order.
const std::array<std::string, 5> &
material_types();

/// Environment scalar names in feature order.
const std::array<std::string, 6> &
environment_feature_names();

/**
 * @brief Service environment of a pipeline section.
 */
struct EnvironmentConditions {
    double temperature_c = 210.0;
    double pressure_bar = 40.0;
    double ph = 5.5;
    double sulfur_ppm = 400.0;
    double flow_velocity_ms = 3.0;
    int service_years = 8;

    /// The six scalars in environment_feature_names() order.
    Eigen::VectorXd to_vector() const;
};

/// One-hot encoding over material_types(); an unknown material encodes as all zeros.
Eigen::VectorXd
encode_material(const std::string &material);

/**
 * @brief Candidate inputs for a corrosion-rate regressor, in preference order.
 */
struct CorrosionFeatureSet {
    Eigen::VectorXd full;     ///< spectrum, one-hot material, environment
    Eigen::VectorXd spectrum; ///< flattened spectrum features only
    Eigen::VectorXd env;      ///< one-hot material, environment
};

CorrosionFeatureSet
build_feature_vectors(const Eigen::VectorXd &spectrum_features,
                      const std::string &material,
                      const EnvironmentConditions &environment);

/**
 * @brief Picks the first candidate (full, spectrum, env) of the expected width.
 * @throws ShapeError naming all candidate widths if none matches.
 */
const Eigen::VectorXd &
select_features(const CorrosionFeatureSet &candidates, Eigen::Index expected_count);

/**
 * @brief Spectrum features of the first sample of a persisted x_data tensor.
 *
 * (samples, C, points) is swapped to points-major, augmented with negated channels
 * and sample 0 flattened to points*2C values, the layout the regressors were trained on.
 *
 * @throws std::runtime_error if the file cannot be read or has no x_data.
 * @throws ShapeError if x_data is not 3-D or holds no samples.
 */
Eigen::VectorXd
spectrum_features_from_mat(const std::string &path);

enum class CorrosionRisk {
    Low,
    Moderate,
    Severe,
};

std::string
to_string(CorrosionRisk risk);

/// Below 0.1 mm/year is Low, below 0.5 Moderate, anything else Severe.
CorrosionRisk
classify_risk(double rate_mm_per_year);

/**
 * @brief Selector bounds for each environment scalar.
 */
struct EnvironmentRanges {
    std::pair<double, double> temperature_c{ 140.0, 280.0 };
    std::pair<double, double> pressure_bar{ 25.0, 55.0 };
    std::pair<double, double> ph{ 4.0, 7.0 };
    std::pair<double, double> sulfur_ppm{ 100.0, 700.0 };
    std::pair<double, double> flow_velocity_ms{ 1.5, 4.5 };
    std::pair<double, double> service_years{ 1.0, 15.0 };
};

/**
 * @brief Min/max of each environment column of a pipeline dataset CSV.
 *
 * Falls back to the default EnvironmentRanges (with a warning) when the file cannot be
 * opened. Columns absent from the file keep their defaults.
 * @throws ShapeError if the file exists but holds no numeric data.
 */
EnvironmentRanges
environment_ranges_from_csv(const std::string &path);

} // namespace eis_sim

#endif // CORROSION_FEATURES_HPP
