#include "eis_sim.hpp"

#include <exception>
#include <iostream>

int
main(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <file.mat> <material>" << std::endl;
        return 2;
    }

    try {
        const Eigen::VectorXd spectrum = eis_sim::spectrum_features_from_mat(argv[1]);
        const eis_sim::EnvironmentConditions environment; // mid-range service conditions
        const eis_sim::CorrosionFeatureSet features =
          eis_sim::build_feature_vectors(spectrum, argv[2], environment);

        std::cout << "Material one-hot:";
        const Eigen::VectorXd one_hot = eis_sim::encode_material(argv[2]);
        for (std::size_t m = 0; m < eis_sim::material_types().size(); ++m) {
            std::cout << " " << eis_sim::material_types()[m] << "=" << one_hot(static_cast<Eigen::Index>(m));
        }
        std::cout << '\n';

        std::cout << "Feature widths: full=" << features.full.size() << ", spectrum=" << features.spectrum.size()
                  << ", env=" << features.env.size() << '\n';

        // A regressor trained on the spectrum alone expects exactly this many inputs
        const Eigen::VectorXd &selected = eis_sim::select_features(features, spectrum.size());
        std::cout << "Selected " << selected.size() << " features; first value " << selected(0) << '\n';

        for (double rate : { 0.05, 0.3, 0.8 }) {
            std::cout << rate << " mm/year -> " << eis_sim::to_string(eis_sim::classify_risk(rate)) << '\n';
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
