// File: optimization/cmaes/state.hpp

#ifndef OPTIMIZATION_CMAES_STATE_HPP
#define OPTIMIZATION_CMAES_STATE_HPP

#include <Eigen/Dense>
#include <vector>

#include "types/concepts.hpp"

namespace optimization::cmaes {

    template<FloatingPoint T = double>
    using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;

    template<FloatingPoint T = double>
    using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

    // An individual may have any 2-D shape; the algorithm only ever sees it flattened column-major.
    template<FloatingPoint T = double>
    using Individual = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

    struct Shape {
        Eigen::Index rows = 0;
        Eigen::Index cols = 0;

        [[nodiscard]] Eigen::Index size() const noexcept { return rows * cols; }

        template<typename Derived>
        [[nodiscard]] bool matches(const Eigen::MatrixBase<Derived> &individual) const noexcept {
            return individual.rows() == rows && individual.cols() == cols;
        }
    };

    template<FloatingPoint T>
    [[nodiscard]] VectorType<T> flatten(const Individual<T> &individual) {
        return Eigen::Map<const VectorType<T>>(individual.data(), individual.size());
    }

    template<FloatingPoint T>
    [[nodiscard]] Individual<T> reshape(const VectorType<T> &flat, const Shape &shape) {
        return Eigen::Map<const Individual<T>>(flat.data(), shape.rows, shape.cols);
    }

    /**
     * @brief Mutable per-run data of one CMA-ES optimization.
     *
     * Created by initialize(), mutated in place once per generation by update() and by nothing else.
     * Learning rates, weights and damping are resolved once and stay fixed for the run.
     */
    template<FloatingPoint T = double>
    struct State {
        Eigen::Index dimension = 0;
        Shape shape;

        T mu_eff{};
        T c_1{};
        T c_c{};
        T c_mu{};
        T c_sigma{};
        T d_sigma{};
        VectorType<T> weights;

        MatrixType<T> covariance;
        VectorType<T> path_c;     // covariance evolution path
        VectorType<T> path_sigma; // step-size evolution path
        T sigma{};

        VectorType<T> parent;
        VectorType<T> fittest;
        std::vector<T> fitpop; // survivor fitness, best first

        [[nodiscard]] T value() const { return fitpop.front(); }

        [[nodiscard]] Individual<T> minimizer() const { return reshape<T>(fittest, shape); }

        [[nodiscard]] Individual<T> mean() const { return reshape<T>(parent, shape); }
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_STATE_HPP
