// File: tests/optimization/cmaes/initializer_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "optimization/cmaes/initializer.hpp"

using namespace optimization::cmaes;

namespace {

    Parameters<> makeParameters(const int mu, const int lambda, std::vector<double> weights = {}) {
        Options<> options;
        options.mu = mu;
        options.lambda = lambda;
        options.weights = std::move(weights);
        return Parameters<>(options);
    }

    Individual<> columnOf(const Eigen::Index n, const double value = 0.0) {
        return Individual<>::Constant(n, 1, value);
    }

} // namespace

TEST(InitializerTest, DerivesDefaultRatesForTwoDimensions) {
    const auto state = initialize(makeParameters(3, 6), columnOf(2));

    EXPECT_NEAR(state.mu_eff, 2.028611, 1e-6);
    EXPECT_NEAR(state.c_1, 0.154815, 1e-6);
    EXPECT_NEAR(state.c_c, 0.624555, 1e-6);
    EXPECT_NEAR(state.c_mu, 0.057859, 1e-6);
    EXPECT_NEAR(state.c_sigma, 0.446205, 1e-6);
    EXPECT_NEAR(state.d_sigma, 1.0 + state.c_sigma, 1e-12);
}

TEST(InitializerTest, DefaultWeightsArePositiveForParentsAndNegativeForTheRest) {
    const auto state = initialize(makeParameters(3, 6), columnOf(2));

    ASSERT_EQ(state.weights.size(), 6);
    EXPECT_NEAR(state.weights.head(3).sum(), 1.0, 1e-12);
    for (Eigen::Index i = 0; i + 1 < state.weights.size(); ++i) {
        EXPECT_GT(state.weights(i), state.weights(i + 1)) << "weights must decrease with rank, i = " << i;
    }
    EXPECT_TRUE((state.weights.tail(3).array() < 0.0).all());
    EXPECT_NEAR(state.weights(0), 0.63704, 1e-5);
    EXPECT_NEAR(state.weights(5), -0.53900, 1e-5);
}

TEST(InitializerTest, ResolvedRatesSatisfyInvariantsAcrossConfigurations) {
    const std::vector<std::tuple<Eigen::Index, int, int>> configurations = {
            {2, 3, 6}, {5, 5, 10}, {10, 1, 4}, {20, 15, 30}, {3, 2, 4}, {1, 1, 2}, {1, 3, 6}, {50, 10, 25}};

    for (const auto &[n, mu, lambda]: configurations) {
        SCOPED_TRACE(testing::Message() << "N = " << n << ", mu = " << mu << ", lambda = " << lambda);
        const auto state = initialize(makeParameters(mu, lambda), columnOf(n));

        EXPECT_GE(state.mu_eff, 1.0 - 1e-12);
        EXPECT_LE(state.mu_eff, mu + 1e-12);
        EXPECT_LE(state.c_1 + state.c_mu, 1.0);
        EXPECT_GT(state.c_sigma, 0.0);
        EXPECT_LT(state.c_sigma, 1.0);
        EXPECT_GT(state.c_c, 0.0);
        EXPECT_LE(state.c_c, 1.0);
        EXPECT_GT(state.d_sigma, 0.0);
        EXPECT_TRUE(state.weights.allFinite());
    }
}

TEST(InitializerTest, BuildsInitialState) {
    Individual<> sample(2, 3);
    sample << 1, 2, 3, 4, 5, 6;
    Options<> options;
    options.mu = 2;
    options.lambda = 5;
    options.sigma0 = 0.25;
    const auto state = initialize(Parameters<>(options), sample);

    EXPECT_EQ(state.dimension, 6);
    EXPECT_EQ(state.shape.rows, 2);
    EXPECT_EQ(state.shape.cols, 3);
    EXPECT_TRUE(state.covariance.isIdentity());
    EXPECT_TRUE(state.path_c.isZero());
    EXPECT_TRUE(state.path_sigma.isZero());
    EXPECT_DOUBLE_EQ(state.sigma, 0.25);
    ASSERT_EQ(state.fitpop.size(), 2u);
    EXPECT_TRUE(std::isinf(state.fitpop[0]) && state.fitpop[0] > 0);
    EXPECT_TRUE(std::isinf(state.fitpop[1]) && state.fitpop[1] > 0);
    EXPECT_EQ(state.mean(), sample);
    EXPECT_EQ(state.minimizer(), sample);
}

TEST(InitializerTest, KeepsSuppliedWeightsAndDerivesRemainingRates) {
    const auto state = initialize(makeParameters(2, 4, {0.5, 0.5, 0.0, 0.0}), columnOf(4));

    EXPECT_DOUBLE_EQ(state.mu_eff, 2.0);
    EXPECT_DOUBLE_EQ(state.c_c, 0.5);
    EXPECT_DOUBLE_EQ(state.c_sigma, 0.5);
    EXPECT_DOUBLE_EQ(state.c_1, 0.125);
    EXPECT_DOUBLE_EQ(state.c_mu, 0.125);
    EXPECT_DOUBLE_EQ(state.weights(0), 0.5);
    EXPECT_DOUBLE_EQ(state.weights(1), 0.5);
    EXPECT_DOUBLE_EQ(state.weights(2), 0.0);
    EXPECT_DOUBLE_EQ(state.weights(3), 0.0);
}

TEST(InitializerTest, AcceptsSelectionMassExactlyOne) {
    const auto state = initialize(makeParameters(2, 4, {1.0, 0.0, 0.0, 0.0}), columnOf(4));

    EXPECT_DOUBLE_EQ(state.mu_eff, 1.0);
    EXPECT_DOUBLE_EQ(state.weights(0), 1.0);
    EXPECT_DOUBLE_EQ(state.c_1, 0.125);
    EXPECT_DOUBLE_EQ(state.c_mu, 0.0625);
}

TEST(InitializerTest, AcceptsSelectionMassExactlyMu) {
    const auto quarter = initialize(makeParameters(4, 8, {0.25, 0.25, 0.25, 0.25, 0, 0, 0, 0}), columnOf(3));
    EXPECT_DOUBLE_EQ(quarter.mu_eff, 4.0);
    EXPECT_DOUBLE_EQ(quarter.weights(0), 0.25);

    const double third = 1.0 / 3.0;
    const auto thirds = initialize(makeParameters(3, 6, {third, third, third, 0, 0, 0}), columnOf(3));
    EXPECT_NEAR(thirds.mu_eff, 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(thirds.weights(0), third);
}

TEST(InitializerTest, KeepsExplicitLearningRates) {
    Options<> options;
    options.mu = 3;
    options.lambda = 6;
    options.c_1 = 0.05;
    options.c_sigma = 0.3;
    const auto state = initialize(Parameters<>(options), columnOf(2));

    EXPECT_DOUBLE_EQ(state.c_1, 0.05);
    EXPECT_DOUBLE_EQ(state.c_sigma, 0.3);
    EXPECT_NEAR(state.c_c, 0.624555, 1e-6);
}

TEST(InitializerTest, RejectsRatesSummingAboveOne) {
    Options<> options;
    options.mu = 3;
    options.lambda = 6;
    options.c_1 = 0.9;
    options.c_mu = 0.5;
    EXPECT_THROW(initialize(Parameters<>(options), columnOf(2)), ConfigurationError);
}

TEST(InitializerTest, RejectsStepSizePathRateOfOne) {
    Options<> options;
    options.mu = 3;
    options.lambda = 6;
    options.c_sigma = 1.0;
    EXPECT_THROW(initialize(Parameters<>(options), columnOf(2)), ConfigurationError);
}

TEST(InitializerTest, RejectsCovariancePathRateAboveOne) {
    Options<> options;
    options.mu = 3;
    options.lambda = 6;
    options.c_c = 1.5;
    EXPECT_THROW(initialize(Parameters<>(options), columnOf(2)), ConfigurationError);
}

TEST(InitializerTest, RejectsOneDimensionalProblemWithSuppliedWeights) {
    // c_sigma defaults to 1/sqrt(N), which reaches 1 for N = 1
    EXPECT_THROW(initialize(makeParameters(2, 4, {0.5, 0.5, 0.0, 0.0}), columnOf(1)), ConfigurationError);
}

TEST(InitializerTest, RejectsEmptySample) {
    EXPECT_THROW(initialize(makeParameters(3, 6), Individual<>(0, 0)), ConfigurationError);
}

TEST(InitializerTest, SupportsSinglePrecision) {
    Options<float> options;
    options.mu = 3;
    options.lambda = 6;
    const Individual<float> sample = Individual<float>::Zero(2, 1);
    const auto state = initialize(Parameters<float>(options), sample);

    EXPECT_NEAR(state.mu_eff, 2.028611f, 1e-4f);
    EXPECT_LE(state.c_1 + state.c_mu, 1.0f);
}
