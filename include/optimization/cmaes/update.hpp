// File: optimization/cmaes/update.hpp

#ifndef OPTIMIZATION_CMAES_UPDATE_HPP
#define OPTIMIZATION_CMAES_UPDATE_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"
#include "optimization/cmaes/constraints.hpp"
#include "optimization/cmaes/decomposition.hpp"
#include "optimization/cmaes/errors.hpp"
#include "optimization/cmaes/objective.hpp"
#include "optimization/cmaes/parameters.hpp"
#include "optimization/cmaes/random_source.hpp"
#include "optimization/cmaes/state.hpp"

namespace optimization::cmaes {

    enum class StepOutcome { Continue, Stop };

    template<FloatingPoint T = double>
    struct StepResult {
        StepOutcome outcome = StepOutcome::Continue;
        std::optional<NumericDegeneracyError<T>> error;

        [[nodiscard]] bool stop() const noexcept { return outcome == StepOutcome::Stop; }

        static StepResult proceed() { return {}; }

        static StepResult halt(NumericDegeneracyError<T> error) { return {StepOutcome::Stop, std::move(error)}; }
    };

    /**
     * @brief Indices of `fitness` sorted best (lowest) first.
     * Equal values keep their original order; NaN ranks behind every number.
     */
    template<FloatingPoint T>
    [[nodiscard]] std::vector<Eigen::Index> rankByFitness(const std::vector<T> &fitness) {
        std::vector<Eigen::Index> order(fitness.size());
        std::iota(order.begin(), order.end(), Eigen::Index{0});
        std::stable_sort(order.begin(), order.end(), [&fitness](const Eigen::Index a, const Eigen::Index b) {
            const T fa = fitness[static_cast<size_t>(a)];
            const T fb = fitness[static_cast<size_t>(b)];
            if (std::isnan(fa)) {
                return false;
            }
            return std::isnan(fb) || fa < fb;
        });
        return order;
    }

    /**
     * @brief One generation of (mu/mu_W, lambda)-CMA-ES with active covariance update.
     *
     * Samples lambda offspring around the current mean, evaluates them through `constraints`, writes the mu
     * best into `population` (best first) and adapts mean, step size, evolution paths and covariance.
     * Exactly N * lambda normal draws are taken from `random`, offspring-major.
     *
     * Returns Stop, with the covariance snapshot attached, when the covariance cannot be decomposed; the state
     * and the population are untouched in that case. All other updates are committed together after every
     * offspring has been evaluated, so an exception from the objective leaves the state as it was.
     *
     * @param iteration 0-based generation counter, used by the h_sigma stall test.
     */
    template<FloatingPoint T>
    StepResult<T> update(const Objective<T> &objective, const Constraints<T> &constraints, State<T> &state,
                         std::vector<Individual<T>> &population, const Parameters<T> &parameters, const int iteration,
                         RandomSource<T> &random) {
        const int mu = parameters.mu();
        const int lambda = parameters.lambda();
        const Eigen::Index N = state.dimension;
        const T n = static_cast<T>(N);

        if (population.size() != static_cast<size_t>(mu)) {
            throw std::invalid_argument("Population buffer must hold exactly " + std::to_string(mu) +
                                        " individuals, got " + std::to_string(population.size()) + ".");
        }

        const DecompositionResult<T> decomposition = decompose<T>(state.covariance);
        if (!decomposition) {
            const auto &error = decomposition.error();
            LOG_ERROR("Break on eigen decomposition at generation {}: {}. Covariance:{:e}", iteration, error.message,
                      error.covariance);
            return StepResult<T>::halt(error);
        }
        const MatrixType<T> &B = decomposition.decomposition().B;
        const MatrixType<T> BD = decomposition.decomposition().transform();

        const T sigma = state.sigma;
        const T mu_eff = state.mu_eff;
        const T c_1 = state.c_1;
        const T c_c = state.c_c;
        const T c_mu = state.c_mu;
        const T c_sigma = state.c_sigma;
        const VectorType<T> &w = state.weights;
        const T expected_norm = std::sqrt(n) * (T(1) - T(1) / (T(4) * n) + T(1) / (T(21) * n * n));

        // Sample and evaluate
        MatrixType<T> z(N, lambda);
        MatrixType<T> y(N, lambda);
        MatrixType<T> offspring(N, lambda);
        std::vector<T> fitness(static_cast<size_t>(lambda));
        for (int i = 0; i < lambda; ++i) {
            for (Eigen::Index j = 0; j < N; ++j) {
                z(j, i) = random.normal();
            }
            y.col(i).noalias() = BD * z.col(i);
            const VectorType<T> candidate = state.parent + sigma * y.col(i);
            const Individual<T> repaired = constraints.repair(reshape<T>(candidate, state.shape));
            if (!state.shape.matches(repaired)) {
                throw std::invalid_argument("Constraint repair changed the shape of an individual.");
            }
            offspring.col(i) = flatten<T>(repaired);
            fitness[static_cast<size_t>(i)] = constraints.evaluate(objective, repaired);
        }

        const std::vector<Eigen::Index> order = rankByFitness(fitness);

        // Select and recombine
        std::vector<T> fitpop(static_cast<size_t>(mu));
        VectorType<T> y_mean = VectorType<T>::Zero(N);
        VectorType<T> z_mean = VectorType<T>::Zero(N);
        for (int i = 0; i < mu; ++i) {
            const Eigen::Index k = order[static_cast<size_t>(i)];
            y_mean += (w(i) / sigma) * (offspring.col(k) - state.parent);
            z_mean += w(i) * z.col(k);
            fitpop[static_cast<size_t>(i)] = fitness[static_cast<size_t>(k)];
        }

        const VectorType<T> parent = state.parent + (parameters.cm() * sigma) * y_mean;

        // Step-size adaptation
        const VectorType<T> path_sigma = (T(1) - c_sigma) * state.path_sigma +
                                         std::sqrt(mu_eff * c_sigma * (T(2) - c_sigma)) * (B * z_mean);
        const T path_sigma_norm = path_sigma.norm();
        const T new_sigma = sigma * std::exp((c_sigma / state.d_sigma) * (path_sigma_norm / expected_norm - T(1)));

        const bool h_sigma = path_sigma_norm / std::sqrt(T(1) - std::pow(T(1) - c_sigma, T(2) * (iteration + 1))) <
                             (T(1.4) + T(2) / (n + T(1))) * expected_norm;

        // Covariance adaptation
        const VectorType<T> path_c =
                (T(1) - c_c) * state.path_c + (h_sigma ? std::sqrt(mu_eff * c_c * (T(2) - c_c)) : T(0)) * y_mean;

        MatrixType<T> rank_one = c_1 * path_c * path_c.transpose();
        if (!h_sigma) {
            rank_one += (c_1 * c_c * (T(2) - c_c)) * state.covariance;
        }

        MatrixType<T> rank_mu = MatrixType<T>::Zero(N, N);
        for (int i = 0; i < lambda; ++i) {
            const Eigen::Index k = order[static_cast<size_t>(i)];
            const auto y_i = y.col(k);
            // negative weights are rescaled by the Mahalanobis norm ||C^-1/2 y_i|| = ||B z_i|| of their step
            const T scale = w(i) >= T(0) ? T(1) : n / (B * z.col(k)).squaredNorm();
            rank_mu.noalias() += (scale * w(i)) * y_i * y_i.transpose();
        }
        rank_mu *= c_mu;

        const MatrixType<T> covariance = (T(1) - c_1 - c_mu * w.sum()) * state.covariance + rank_one + rank_mu;

        // Commit
        for (int i = 0; i < mu; ++i) {
            population[static_cast<size_t>(i)] = reshape<T>(offspring.col(order[static_cast<size_t>(i)]), state.shape);
        }
        state.covariance = (covariance + covariance.transpose()) / T(2);
        state.path_c = path_c;
        state.path_sigma = path_sigma;
        state.sigma = new_sigma;
        state.parent = parent;
        state.fittest = offspring.col(order.front());
        state.fitpop = std::move(fitpop);

        LOG_DEBUG("Generation {}: best = {:.6e}, sigma = {:.6e}, |p_sigma| = {:.4f}, h_sigma = {}", iteration,
                  state.fitpop.front(), state.sigma, path_sigma_norm, h_sigma);
        return StepResult<T>::proceed();
    }

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_UPDATE_HPP
