#include "circuit_model.hpp"
#include "eis_errors.hpp"
#include "impedance_elements.hpp"
#include "test_utils.hpp"
#include <boost/math/constants/constants.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace eis_sim;

namespace {

Eigen::VectorXd
test_omega() {
    Eigen::VectorXd omega(5);
    omega << 0.05, 3.0, 250.0, 4e4, 6e6;
    return omega;
}

// Textbook evaluation of one parameter row, used to cross-check the broadcast code.
Complex
reference_impedance(int circuit_id, const Eigen::VectorXd &p, double w, bool independent) {
    const double a2_or_a1 = [&] {
        if (circuit_id == 2 || circuit_id == 4 || circuit_id == 5) { return independent ? p(5) : p(3); }
        return 0.0;
    }();
    const auto zw = [&](double sigma) { return sigma * std::sqrt(2.0) / std::sqrt(Complex(0.0, w)); };

    switch (circuit_id) {
        case 1: // R1 R2 a1 Q1
            return p(0) + reference_parallel(p(1), reference_cpe(p(3), p(2), w));
        case 2: // R1 R2 R3 a1 Q1 a2 Q2
            return p(0) + reference_parallel(p(1), reference_cpe(p(4), p(3), w)) +
                   reference_parallel(p(2), reference_cpe(p(6), a2_or_a1, w));
        case 3: // R1 R2 a1 Q1 sigma
            return p(0) + reference_parallel(reference_cpe(p(3), p(2), w), p(1) + zw(p(4)));
        case 4: // R1 R2 R3 a1 Q1 a2 Q2 sigma
            return p(0) + reference_parallel(p(1), reference_cpe(p(4), p(3), w)) +
                   reference_parallel(reference_cpe(p(6), a2_or_a1, w), p(2) + zw(p(7)));
        case 5: {
            const Complex inner = p(1) + reference_parallel(p(2) + zw(p(7)), reference_cpe(p(6), a2_or_a1, w));
            return p(0) + reference_parallel(inner, reference_cpe(p(4), p(3), w));
        }
        default:
            throw std::logic_error("no reference for circuit " + std::to_string(circuit_id));
    }
}

} // namespace

TEST(CircuitModelTest, SingleRcReferencePoint) {
    const auto circuit = make_circuit(1);
    Eigen::VectorXd p(4);
    p << 100.0, 500.0, 0.9, 1e-4;
    Eigen::VectorXd omega(1);
    omega << boost::math::constants::two_pi<double>();

    const Complex expected = 100.0 + reference_parallel(500.0, reference_cpe(1e-4, 0.9, omega(0)));
    const Eigen::VectorXcd z = circuit->evaluate_row(p, omega);
    ASSERT_EQ(z.size(), 1);
    EXPECT_COMPLEX_REL_NEAR(z(0), expected, 1e-9);
}

TEST(CircuitModelTest, SingleRcFrequencyLimits) {
    const auto circuit = make_circuit(1);
    Eigen::VectorXd p(4);
    p << 10.0, 1000.0, 1.0, 1e-5;
    Eigen::VectorXd omega(2);
    omega << 1e-6, 1e12;
    const Eigen::VectorXcd z = circuit->evaluate_row(p, omega);
    // DC: R1 + R2; infinite frequency: R1
    EXPECT_NEAR(z(0).real(), 1010.0, 1e-3);
    EXPECT_NEAR(z(1).real(), 10.0, 1e-3);
}

TEST(CircuitModelTest, AllCircuitsMatchReferenceFormulas) {
    const Eigen::VectorXd omega = test_omega();
    for (bool independent : { false, true }) {
        const CpeAlphaCoupling coupling =
          independent ? CpeAlphaCoupling::Independent : CpeAlphaCoupling::SharedFirstAlpha;
        for (int id : supported_circuit_ids()) {
            const auto circuit = make_circuit(id, coupling);
            ParameterSampler sampler(static_cast<std::uint32_t>(100 + id));
            const Eigen::MatrixXd params = circuit->sample_parameters(sampler, ElementRanges{}, 4);
            const Eigen::MatrixXcd z = circuit->evaluate(params, omega);
            ASSERT_EQ(z.rows(), 4);
            ASSERT_EQ(z.cols(), omega.size());
            for (Eigen::Index i = 0; i < params.rows(); ++i) {
                for (Eigen::Index j = 0; j < omega.size(); ++j) {
                    SCOPED_TRACE("circuit " + std::to_string(id) + " row " + std::to_string(i) + " point " +
                                 std::to_string(j));
                    EXPECT_COMPLEX_REL_NEAR(
                      z(i, j), reference_impedance(id, params.row(i).transpose(), omega(j), independent), 1e-9);
                }
            }
        }
    }
}

TEST(CircuitModelTest, ParameterNamesAndCounts) {
    const std::vector<std::vector<std::string>> expected = {
        { "R1", "R2", "α₁", "Q1" },
        { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2" },
        { "R1", "R2", "α₁", "Q1", "σ" },
        { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2", "σ" },
        { "R1", "R2", "R3", "α₁", "Q1", "α₂", "Q2", "σ" },
    };
    for (int id : supported_circuit_ids()) {
        const auto circuit = make_circuit(id);
        EXPECT_EQ(circuit->id(), id);
        EXPECT_EQ(circuit->parameter_names(), expected[static_cast<std::size_t>(id - 1)]);
        EXPECT_EQ(circuit->parameter_count(), static_cast<Eigen::Index>(expected[id - 1].size()));
        EXPECT_FALSE(circuit->name().empty());
    }
    EXPECT_FALSE(make_circuit(1)->uses_warburg());
    EXPECT_TRUE(make_circuit(3)->uses_warburg());
    EXPECT_TRUE(make_circuit(2)->has_second_cpe());
    EXPECT_FALSE(make_circuit(3)->has_second_cpe());
}

TEST(CircuitModelTest, UnsupportedIdsAreRejected) {
    EXPECT_THROW(make_circuit(0), UnsupportedCircuitError);
    EXPECT_THROW(make_circuit(6), UnsupportedCircuitError);
    EXPECT_THROW(make_circuit(-3), UnsupportedCircuitError);
    try {
        make_circuit(6);
        FAIL() << "expected UnsupportedCircuitError";
    } catch (const UnsupportedCircuitError &e) {
        EXPECT_EQ(e.circuit_id(), 6);
        EXPECT_NE(std::string(e.what()).find("6"), std::string::npos);
    }
}

TEST(CircuitModelTest, SampledColumnsRespectTheirRanges) {
    ElementRanges ranges;
    ranges.resistance = { 5.0, 50.0 };
    ranges.alpha = { 0.7, 0.75 };
    ranges.q = { 1e-6, 1e-5 };
    ranges.sigma = { 2.0, 3.0 };

    const auto circuit = make_circuit(4);
    ParameterSampler sampler(8);
    const Eigen::MatrixXd p = circuit->sample_parameters(sampler, ranges, 200);
    ASSERT_EQ(p.rows(), 200);
    ASSERT_EQ(p.cols(), 8);

    const std::vector<ParameterKind> kinds = circuit->parameter_kinds();
    for (Eigen::Index c = 0; c < p.cols(); ++c) {
        const ParameterRange &range = ranges.for_kind(kinds[static_cast<std::size_t>(c)]);
        EXPECT_GE(p.col(c).minCoeff(), range.lo) << "column " << c;
        EXPECT_LE(p.col(c).maxCoeff(), range.hi) << "column " << c;
    }
}

TEST(CircuitModelTest, AlphaCouplingOnlyAffectsSecondCpe) {
    const Eigen::VectorXd omega = test_omega();
    for (int id : supported_circuit_ids()) {
        const auto shared = make_circuit(id, CpeAlphaCoupling::SharedFirstAlpha);
        const auto independent = make_circuit(id, CpeAlphaCoupling::Independent);
        ParameterSampler sampler(77);
        Eigen::MatrixXd params = shared->sample_parameters(sampler, ElementRanges{}, 3);
        if (shared->has_second_cpe()) {
            // Force alpha2 != alpha1 (column 5 is alpha2 in every two-CPE layout)
            params.col(3).setConstant(0.95);
            params.col(5).setConstant(0.82);
        }
        const Eigen::MatrixXcd a = shared->evaluate(params, omega);
        const Eigen::MatrixXcd b = independent->evaluate(params, omega);
        if (shared->has_second_cpe()) {
            EXPECT_GT((a - b).cwiseAbs().maxCoeff(), 0.0) << "circuit " << id;
        } else {
            EXPECT_EQ(a, b) << "circuit " << id;
        }
    }
}

TEST(CircuitModelTest, SharedAlphaIgnoresStoredAlpha2) {
    const auto circuit = make_circuit(5, CpeAlphaCoupling::SharedFirstAlpha);
    ParameterSampler sampler(3);
    Eigen::MatrixXd params = circuit->sample_parameters(sampler, ElementRanges{}, 2);
    const Eigen::MatrixXcd before = circuit->evaluate(params, test_omega());
    params.col(5).setConstant(0.5);
    EXPECT_EQ(circuit->evaluate(params, test_omega()), before);
}

TEST(CircuitModelTest, EvaluateChecksColumnCount) {
    const auto circuit = make_circuit(3);
    EXPECT_THROW(circuit->evaluate(Eigen::MatrixXd::Ones(2, 4), test_omega()), ShapeError);
}

TEST(CircuitModelTest, RangeValidation) {
    ElementRanges bad_alpha;
    bad_alpha.alpha = { 0.8, 1.2 };
    EXPECT_THROW(make_circuit(1)->validate_ranges(bad_alpha), InvalidRangeError);

    ElementRanges zero_alpha;
    zero_alpha.alpha = { 0.0, 0.5 };
    EXPECT_THROW(make_circuit(1)->validate_ranges(zero_alpha), InvalidRangeError);

    ElementRanges tiny_alpha;
    tiny_alpha.alpha = { 0.0001, 0.0004 };
    EXPECT_THROW(make_circuit(1)->validate_ranges(tiny_alpha), InvalidRangeError);
    tiny_alpha.alpha = { 0.0006, 0.5 };
    EXPECT_NO_THROW(make_circuit(1)->validate_ranges(tiny_alpha));

    ElementRanges bad_q;
    bad_q.q = { 1e-3, 1e-5 };
    EXPECT_THROW(make_circuit(2)->validate_ranges(bad_q), InvalidRangeError);

    // sigma only matters for circuits with a Warburg element
    ElementRanges bad_sigma;
    bad_sigma.sigma = { 0.0, 10.0 };
    EXPECT_NO_THROW(make_circuit(1)->validate_ranges(bad_sigma));
    EXPECT_NO_THROW(make_circuit(2)->validate_ranges(bad_sigma));
    EXPECT_THROW(make_circuit(3)->validate_ranges(bad_sigma), InvalidRangeError);

    ParameterSampler sampler(1);
    EXPECT_THROW(make_circuit(4)->sample_parameters(sampler, bad_sigma, 3), InvalidRangeError);
}
