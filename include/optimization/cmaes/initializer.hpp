// File: optimization/cmaes/initializer.hpp

#ifndef OPTIMIZATION_CMAES_INITIALIZER_HPP
#define OPTIMIZATION_CMAES_INITIALIZER_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"
#include "optimization/cmaes/errors.hpp"
#include "optimization/cmaes/parameters.hpp"
#include "optimization/cmaes/state.hpp"

namespace optimization::cmaes {

    namespace detail {

        // Closed-interval test that tolerates a few ulps of rounding at both ends
        template<FloatingPoint T>
        [[nodiscard]] bool withinSelectionMass(const T mu_eff, const int mu) noexcept {
            constexpr T slack = T(16) * std::numeric_limits<T>::epsilon();
            return mu_eff >= T(1) - slack && mu_eff <= static_cast<T>(mu) * (T(1) + slack);
        }

        [[noreturn]] inline void configurationError(const std::string &message) {
            LOG_ERROR("CMA-ES initialization failed: {}", message);
            throw ConfigurationError(message);
        }

        // Learning rates and weights the initializer resolves before building the state
        template<FloatingPoint T>
        struct Resolved {
            T mu_eff;
            T c_1;
            T c_c;
            T c_mu;
            T c_sigma;
            VectorType<T> weights;
        };

        /*
         * Default recombination weights (Hansen, "The CMA Evolution Strategy: A Tutorial", 2016):
         * positive weights normalised to sum one, negative weights scaled by min(alpha-, alpha-_eff, alpha-_pd).
         */
        template<FloatingPoint T>
        [[nodiscard]] Resolved<T> resolveDefaultWeights(const Parameters<T> &parameters, const T n) {
            const int mu = parameters.mu();
            const int lambda = parameters.lambda();
            constexpr T alpha_cov = T(2);

            VectorType<T> raw(lambda);
            for (int i = 0; i < lambda; ++i) {
                raw(i) = std::log((static_cast<T>(lambda) + T(1)) / T(2)) - std::log(static_cast<T>(i + 1));
            }

            const T positive_sum = (raw.array() >= T(0)).select(raw.array(), T(0)).sum();
            const T alpha_minus = -(raw.array() < T(0)).select(raw.array(), T(0)).sum();

            const auto head = raw.head(mu);
            const auto tail = raw.tail(lambda - mu);
            const T mu_eff = head.sum() * head.sum() / head.squaredNorm();
            const T mu_eff_minus = tail.sum() * tail.sum() / tail.squaredNorm();
            const T alpha_eff_minus = T(1) + T(2) * mu_eff_minus / (mu_eff + T(2));

            Resolved<T> resolved{mu_eff, parameters.c1(), parameters.cc(), parameters.cmu(), parameters.csigma(), {}};
            if (std::isnan(resolved.c_1)) {
                resolved.c_1 = alpha_cov / ((n + T(1.3)) * (n + T(1.3)) + mu_eff);
            }
            if (std::isnan(resolved.c_mu)) {
                resolved.c_mu = std::min(T(1) - resolved.c_1, alpha_cov * (mu_eff - T(2) + T(1) / mu_eff) /
                                                                      ((n + T(2)) * (n + T(2)) + alpha_cov * mu_eff / T(2)));
            }
            if (std::isnan(resolved.c_c)) {
                resolved.c_c = (T(4) + mu_eff / n) / (n + T(4) + T(2) * mu_eff / n);
            }
            if (std::isnan(resolved.c_sigma)) {
                resolved.c_sigma = (mu_eff + T(2)) / (n + mu_eff + T(5));
            }

            const T alpha_pd_minus = (T(1) - resolved.c_1 - resolved.c_mu) / (n * resolved.c_mu);
            const T negative_scale = std::min({alpha_minus, alpha_eff_minus, alpha_pd_minus});

            resolved.weights.resize(lambda);
            for (int i = 0; i < lambda; ++i) {
                resolved.weights(i) = raw(i) >= T(0) ? raw(i) / positive_sum : negative_scale * raw(i) / alpha_minus;
            }
            return resolved;
        }

        // Supplied weights already give mu_eff in [1, mu]: keep them, derive only the unset rates
        template<FloatingPoint T>
        [[nodiscard]] Resolved<T> resolveSuppliedWeights(const Parameters<T> &parameters, const T n,
                                                         const VectorType<T> &weights, const T mu_eff) {
            Resolved<T> resolved{mu_eff, parameters.c1(), parameters.cc(), parameters.cmu(), parameters.csigma(),
                                 weights};
            if (std::isnan(resolved.c_c)) {
                resolved.c_c = T(1) / std::sqrt(n);
            }
            if (std::isnan(resolved.c_sigma)) {
                resolved.c_sigma = T(1) / std::sqrt(n);
            }
            // c_1 first: an unset c_mu counts as zero here, c_mu then takes what is left
            if (std::isnan(resolved.c_1)) {
                const T c_mu = std::isnan(resolved.c_mu) ? T(0) : resolved.c_mu;
                resolved.c_1 = std::min(T(2) / (n * n), T(1) - c_mu);
            }
            if (std::isnan(resolved.c_mu)) {
                resolved.c_mu = std::min(mu_eff / (n * n), T(1) - resolved.c_1);
            }
            return resolved;
        }

    } // namespace detail

    /**
     * @brief Builds the initial state of a run from validated parameters and one sample individual.
     *
     * The sample fixes the dimension N (its element count) and the shape survivors are reported in.
     * Throws ConfigurationError when the resolved rates violate 1 <= mu_eff <= mu, c_1 + c_mu <= 1,
     * c_sigma < 1 or c_c <= 1.
     */
    template<FloatingPoint T>
    [[nodiscard]] State<T> initialize(const Parameters<T> &parameters, const Individual<T> &sample) {
        if (sample.size() == 0) {
            detail::configurationError("Sample individual must have at least one element");
        }

        const int mu = parameters.mu();
        const Eigen::Index dimension = sample.size();
        const T n = static_cast<T>(dimension);

        const VectorType<T> supplied = Eigen::Map<const VectorType<T>>(parameters.weights().data(),
                                                                         static_cast<Eigen::Index>(parameters.weights().size()));
        const T supplied_mu_eff = T(1) / supplied.head(mu).squaredNorm();

        const detail::Resolved<T> resolved = detail::withinSelectionMass(supplied_mu_eff, mu)
                                                     ? detail::resolveSuppliedWeights(parameters, n, supplied, supplied_mu_eff)
                                                     : detail::resolveDefaultWeights(parameters, n);

        if (!detail::withinSelectionMass(resolved.mu_eff, mu)) {
            detail::configurationError(fmt::format("mu_eff = {} is outside [1, {}]", resolved.mu_eff, mu));
        }
        if (!(resolved.c_1 + resolved.c_mu <= T(1))) {
            detail::configurationError(fmt::format("c_1 + c_mu > 1 (c_1 = {}, c_mu = {})", resolved.c_1, resolved.c_mu));
        }
        if (!(resolved.c_sigma < T(1))) {
            detail::configurationError(fmt::format("c_sigma >= 1 (c_sigma = {})", resolved.c_sigma));
        }
        if (!(resolved.c_c <= T(1))) {
            detail::configurationError(fmt::format("c_c > 1 (c_c = {})", resolved.c_c));
        }

        State<T> state;
        state.dimension = dimension;
        state.shape = Shape{sample.rows(), sample.cols()};
        state.mu_eff = resolved.mu_eff;
        state.c_1 = resolved.c_1;
        state.c_c = resolved.c_c;
        state.c_mu = resolved.c_mu;
        state.c_sigma = resolved.c_sigma;
        state.d_sigma = T(1) + T(2) * std::max(T(0), std::sqrt((resolved.mu_eff - T(1)) / (n + T(1))) - T(1)) +
                        resolved.c_sigma;
        state.weights = resolved.weights;
        state.covariance = MatrixType<T>::Identity(dimension, dimension);
        state.path_c = VectorType<T>::Zero(dimension);
        state.path_sigma = VectorType<T>::Zero(dimension);
        state.sigma = parameters.sigma0();
        state.parent = flatten<T>(sample);
        state.fittest = state.parent;
        state.fitpop.assign(static_cast<size_t>(mu), std::numeric_limits<T>::infinity());

        LOG_INFO("CMA-ES initialized: N = {}, mu = {}, lambda = {}, mu_eff = {:.4f}, sigma0 = {}", dimension, mu,
                 parameters.lambda(), state.mu_eff, state.sigma);
        LOG_DEBUG("Learning rates: c_1 = {:.6f}, c_c = {:.6f}, c_mu = {:.6f}, c_sigma = {:.6f}, d_sigma = {:.6f}",
                  state.c_1, state.c_c, state.c_mu, state.c_sigma, state.d_sigma);
        LOG_DEBUG("Recombination weights: {}", state.weights);
        return state;
    }

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_INITIALIZER_HPP
