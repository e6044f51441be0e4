// File: tests/optimization/cmaes/parameters_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <limits>

#include "optimization/cmaes/parameters.hpp"

using namespace optimization::cmaes;
using ::testing::Each;

TEST(ParametersTest, DefaultsMatchReferenceStrategy) {
    const Parameters<> parameters;

    EXPECT_EQ(parameters.mu(), 15);
    EXPECT_EQ(parameters.lambda(), 30);
    EXPECT_DOUBLE_EQ(parameters.sigma0(), 1.0);
    EXPECT_DOUBLE_EQ(parameters.cm(), 1.0);
    EXPECT_TRUE(std::isnan(parameters.c1()));
    EXPECT_TRUE(std::isnan(parameters.cc()));
    EXPECT_TRUE(std::isnan(parameters.cmu()));
    EXPECT_TRUE(std::isnan(parameters.csigma()));
    EXPECT_EQ(parameters.weights().size(), 30u);
    EXPECT_THAT(parameters.weights(), Each(0.0));
}

TEST(ParametersTest, LambdaDefaultsToTwiceMu) {
    Options<> options;
    options.mu = 4;
    const Parameters<> parameters(options);

    EXPECT_EQ(parameters.lambda(), 8);
    EXPECT_EQ(parameters.weights().size(), 8u);
}

TEST(ParametersTest, KeepsSuppliedValues) {
    Options<> options;
    options.mu = 2;
    options.lambda = 4;
    options.c_1 = 0.1;
    options.sigma0 = 0.3;
    options.c_m = 0.5;
    options.weights = {0.5, 0.5, -0.1, -0.2};
    const Parameters<> parameters(options);

    EXPECT_DOUBLE_EQ(parameters.c1(), 0.1);
    EXPECT_DOUBLE_EQ(parameters.sigma0(), 0.3);
    EXPECT_DOUBLE_EQ(parameters.cm(), 0.5);
    EXPECT_EQ(parameters.weights(), options.weights);
}

TEST(ParametersTest, RejectsMuNotBelowLambda) {
    Options<> options;
    options.mu = 6;
    options.lambda = 6;
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);

    options.lambda = 5;
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);
}

TEST(ParametersTest, RejectsNonPositiveMu) {
    Options<> options;
    options.mu = 0;
    options.lambda = 4;
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);
}

TEST(ParametersTest, RejectsWeightCountMismatch) {
    Options<> options;
    options.mu = 2;
    options.lambda = 4;
    options.weights = {0.5, 0.5, 0.0};
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);
}

TEST(ParametersTest, RejectsMeanLearningRateAboveOne) {
    Options<> options;
    options.c_m = 1.0 + 1e-12;
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);

    options.c_m = 1.0;
    EXPECT_NO_THROW(Parameters<>{options});
}

TEST(ParametersTest, RejectsNonPositiveStepSize) {
    Options<> options;
    options.sigma0 = 0.0;
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);

    options.sigma0 = std::numeric_limits<double>::infinity();
    EXPECT_THROW(Parameters<>{options}, ConfigurationError);
}

TEST(ParametersTest, ConfigurationErrorIsInvalidArgument) {
    Options<> options;
    options.mu = 10;
    options.lambda = 3;
    EXPECT_THROW(Parameters<>{options}, std::invalid_argument);
}
