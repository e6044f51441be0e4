// File: optimization/cmaes/decomposition.hpp

#ifndef OPTIMIZATION_CMAES_DECOMPOSITION_HPP
#define OPTIMIZATION_CMAES_DECOMPOSITION_HPP

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "optimization/cmaes/errors.hpp"
#include "optimization/cmaes/state.hpp"

namespace optimization::cmaes {

    /**
     * @brief C = B * diag(D)^2 * B^T with orthonormal eigenvectors B (columns) and D = sqrt(max(0, eigenvalues)).
     */
    template<FloatingPoint T = double>
    struct Decomposition {
        MatrixType<T> B;
        VectorType<T> D;

        // B * diag(D), maps a standard normal draw onto a sample of N(0, C)
        [[nodiscard]] MatrixType<T> transform() const { return B * D.asDiagonal(); }
    };

    template<FloatingPoint T = double>
    class DecompositionResult {
    public:
        static DecompositionResult success(Decomposition<T> decomposition) {
            DecompositionResult result;
            result.decomposition_ = std::move(decomposition);
            return result;
        }

        static DecompositionResult failure(NumericDegeneracyError<T> error) {
            DecompositionResult result;
            result.error_ = std::move(error);
            return result;
        }

        [[nodiscard]] bool ok() const noexcept { return decomposition_.has_value(); }

        explicit operator bool() const noexcept { return ok(); }

        [[nodiscard]] const Decomposition<T> &decomposition() const {
            if (!decomposition_) {
                throw std::logic_error("Decomposition requested from a failed result: " + error_->message);
            }
            return *decomposition_;
        }

        [[nodiscard]] const NumericDegeneracyError<T> &error() const {
            if (!error_) {
                throw std::logic_error("Error requested from a successful decomposition.");
            }
            return *error_;
        }

    private:
        std::optional<Decomposition<T>> decomposition_;
        std::optional<NumericDegeneracyError<T>> error_;

        DecompositionResult() = default;
    };

    /**
     * @brief Symmetric eigendecomposition of a covariance matrix.
     *
     * Fails, without throwing, when the matrix is empty or not square, holds non-finite entries, is not
     * symmetric up to sqrt(eps) relative to its largest entry, the eigen solver does not converge, or the
     * smallest eigenvalue is below -sqrt(eps) times the largest magnitude. Smaller negative eigenvalues are
     * rounding drift and clamp to zero.
     */
    template<FloatingPoint T>
    [[nodiscard]] DecompositionResult<T> decompose(const MatrixType<T> &covariance) {
        const auto fail = [&covariance](std::string message) {
            return DecompositionResult<T>::failure(NumericDegeneracyError<T>{std::move(message), covariance});
        };

        if (covariance.rows() == 0 || covariance.rows() != covariance.cols()) {
            return fail("covariance matrix is empty or not square");
        }
        if (!covariance.allFinite()) {
            return fail("covariance matrix contains non-finite entries");
        }

        const T tolerance = std::sqrt(std::numeric_limits<T>::epsilon());
        const T scale = covariance.cwiseAbs().maxCoeff();
        const T asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
        if (asymmetry > tolerance * scale) {
            return fail("covariance matrix is not symmetric (max |C - C^T| = " + std::to_string(asymmetry) + ")");
        }

        const Eigen::SelfAdjointEigenSolver<MatrixType<T>> solver(covariance);
        if (solver.info() != Eigen::Success) {
            return fail("eigen decomposition did not converge");
        }

        const VectorType<T> &eigenvalues = solver.eigenvalues();
        const T largest = eigenvalues.cwiseAbs().maxCoeff();
        if (eigenvalues.minCoeff() < -tolerance * largest) {
            return fail("covariance matrix is not positive semi-definite (smallest eigenvalue " +
                        std::to_string(eigenvalues.minCoeff()) + ")");
        }

        return DecompositionResult<T>::success(
                Decomposition<T>{solver.eigenvectors(), eigenvalues.cwiseMax(T(0)).cwiseSqrt()});
    }

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_DECOMPOSITION_HPP
