// File: tests/optimization/cmaes/decomposition_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "optimization/cmaes/decomposition.hpp"

using namespace optimization::cmaes;

namespace {

    void expectReconstructs(const MatrixType<> &covariance, const Decomposition<> &decomposition) {
        const MatrixType<> transform = decomposition.transform();
        const MatrixType<> reconstructed = transform * transform.transpose();
        EXPECT_TRUE(reconstructed.isApprox(covariance, 1e-10)) << "reconstructed:\n" << reconstructed;
        EXPECT_TRUE((decomposition.B.transpose() * decomposition.B).isIdentity(1e-10));
    }

} // namespace

TEST(DecompositionTest, DecomposesIdentity) {
    const MatrixType<> identity = MatrixType<>::Identity(3, 3);
    const auto result = decompose(identity);

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.decomposition().D.isOnes(1e-12));
    expectReconstructs(identity, result.decomposition());
}

TEST(DecompositionTest, DecomposesDiagonalMatrix) {
    MatrixType<> covariance = MatrixType<>::Zero(3, 3);
    covariance.diagonal() << 4.0, 1.0, 9.0;
    const auto result = decompose(covariance);

    ASSERT_TRUE(result);
    // eigenvalues come back in increasing order
    EXPECT_NEAR(result.decomposition().D(0), 1.0, 1e-12);
    EXPECT_NEAR(result.decomposition().D(1), 2.0, 1e-12);
    EXPECT_NEAR(result.decomposition().D(2), 3.0, 1e-12);
    expectReconstructs(covariance, result.decomposition());
}

TEST(DecompositionTest, DecomposesCorrelatedMatrix) {
    MatrixType<> covariance(2, 2);
    covariance << 2.0, 0.8, 0.8, 1.0;
    const auto result = decompose(covariance);

    ASSERT_TRUE(result.ok());
    expectReconstructs(covariance, result.decomposition());
}

TEST(DecompositionTest, ClampsRoundingDriftBelowZero) {
    MatrixType<> covariance = MatrixType<>::Zero(2, 2);
    covariance(0, 0) = 1.0;
    covariance(1, 1) = -1e-12;
    const auto result = decompose(covariance);

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.decomposition().D(0), 0.0);
    EXPECT_DOUBLE_EQ(result.decomposition().D(1), 1.0);
}

TEST(DecompositionTest, FailsOnIndefiniteMatrix) {
    MatrixType<> covariance(2, 2);
    covariance << 1.0, 0.0, 0.0, -1.0;
    const auto result = decompose(covariance);

    ASSERT_FALSE(result.ok());
    EXPECT_FALSE(result.error().message.empty());
    EXPECT_EQ(result.error().covariance, covariance);
    EXPECT_THROW(static_cast<void>(result.decomposition()), std::logic_error);
}

TEST(DecompositionTest, FailsOnNonFiniteEntries) {
    MatrixType<> covariance = MatrixType<>::Identity(2, 2);
    covariance(0, 1) = std::numeric_limits<double>::quiet_NaN();
    covariance(1, 0) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(decompose(covariance).ok());

    covariance = MatrixType<>::Identity(2, 2);
    covariance(1, 1) = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(decompose(covariance).ok());
}

TEST(DecompositionTest, FailsOnAsymmetricMatrix) {
    MatrixType<> covariance(2, 2);
    covariance << 1.0, 0.5, 0.0, 1.0;
    EXPECT_FALSE(decompose(covariance).ok());
}

TEST(DecompositionTest, FailsOnEmptyOrNonSquareMatrix) {
    EXPECT_FALSE(decompose(MatrixType<>(0, 0)).ok());
    EXPECT_FALSE(decompose<double>(MatrixType<>::Ones(2, 3)).ok());
}

TEST(DecompositionTest, SuccessfulResultHasNoError) {
    const auto result = decompose(MatrixType<>::Identity(2, 2).eval());
    EXPECT_THROW(static_cast<void>(result.error()), std::logic_error);
}
