// File: optimization/cmaes/parameters.hpp

#ifndef OPTIMIZATION_CMAES_PARAMETERS_HPP
#define OPTIMIZATION_CMAES_PARAMETERS_HPP

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "optimization/cmaes/errors.hpp"
#include "types/concepts.hpp"

namespace optimization::cmaes {

    /**
     * @brief Raw strategy settings as a user or a configuration file provides them.
     *
     * Learning rates left at NaN are derived by the initializer. An empty weight vector stands for
     * lambda zeros, which selects the default log-rank recombination weights.
     */
    template<FloatingPoint T = double>
    struct Options {
        int mu = 15;
        std::optional<int> lambda; // defaults to 2 * mu
        T c_1 = std::numeric_limits<T>::quiet_NaN();
        T c_c = std::numeric_limits<T>::quiet_NaN();
        T c_mu = std::numeric_limits<T>::quiet_NaN();
        T c_sigma = std::numeric_limits<T>::quiet_NaN();
        T sigma0 = T(1);
        T c_m = T(1);
        std::vector<T> weights;

        // Driver hints, the strategy itself never reads them
        static constexpr int default_iterations = 1500;
        static constexpr T default_abstol = T(1e-15);

        static Options fromConfiguration(const config::Configuration &configuration,
                                         const std::string &prefix = "optimization.cmaes") {
            Options options;
            options.mu = configuration.get<int>(prefix + ".mu", options.mu);
            options.lambda = configuration.get<int>(prefix + ".lambda");
            options.c_1 = configuration.get<T>(prefix + ".c_1", options.c_1);
            options.c_c = configuration.get<T>(prefix + ".c_c", options.c_c);
            options.c_mu = configuration.get<T>(prefix + ".c_mu", options.c_mu);
            options.c_sigma = configuration.get<T>(prefix + ".c_sigma", options.c_sigma);
            options.sigma0 = configuration.get<T>(prefix + ".sigma0", options.sigma0);
            options.c_m = configuration.get<T>(prefix + ".c_m", options.c_m);
            options.weights = configuration.get<std::vector<T>>(prefix + ".weights", options.weights);
            return options;
        }

        static Options fromConfiguration() { return fromConfiguration(config::Configuration::getInstance()); }
    };

    /**
     * @brief Validated, immutable strategy configuration of a (mu/mu_W, lambda)-CMA-ES.
     *
     * Construction throws ConfigurationError when mu < 1, mu >= lambda, the number of weights differs
     * from lambda, c_m > 1 or sigma0 is not a positive finite number.
     */
    template<FloatingPoint T = double>
    class Parameters {
    public:
        explicit Parameters(const Options<T> &options = Options<T>{}) :
            mu_(options.mu), lambda_(options.lambda.value_or(2 * options.mu)), c_1_(options.c_1),
            c_c_(options.c_c), c_mu_(options.c_mu), c_sigma_(options.c_sigma), sigma0_(options.sigma0),
            c_m_(options.c_m), weights_(options.weights) {
            if (weights_.empty()) {
                weights_.assign(lambda_ > 0 ? static_cast<size_t>(lambda_) : 0, T(0));
            }
            validate();
        }

        [[nodiscard]] int mu() const noexcept { return mu_; }
        [[nodiscard]] int lambda() const noexcept { return lambda_; }
        [[nodiscard]] T c1() const noexcept { return c_1_; }
        [[nodiscard]] T cc() const noexcept { return c_c_; }
        [[nodiscard]] T cmu() const noexcept { return c_mu_; }
        [[nodiscard]] T csigma() const noexcept { return c_sigma_; }
        [[nodiscard]] T sigma0() const noexcept { return sigma0_; }
        [[nodiscard]] T cm() const noexcept { return c_m_; }
        [[nodiscard]] const std::vector<T> &weights() const noexcept { return weights_; }

    private:
        int mu_;
        int lambda_;
        T c_1_;
        T c_c_;
        T c_mu_;
        T c_sigma_;
        T sigma0_;
        T c_m_;
        std::vector<T> weights_;

        void validate() const {
            if (mu_ < 1) {
                fail(fmt::format("Parent population size must be at least 1 (mu = {})", mu_));
            }
            if (mu_ >= lambda_) {
                fail(fmt::format("Offspring population must be larger than parent population (mu = {}, lambda = {})",
                                 mu_, lambda_));
            }
            if (weights_.size() != static_cast<size_t>(lambda_)) {
                fail(fmt::format("Number of weights must be {} (got {})", lambda_, weights_.size()));
            }
            if (!std::isfinite(c_m_) || c_m_ > T(1)) {
                fail(fmt::format("Mean learning rate must satisfy c_m <= 1 (c_m = {})", c_m_));
            }
            if (!std::isfinite(sigma0_) || sigma0_ <= T(0)) {
                fail(fmt::format("Initial step size must be positive (sigma0 = {})", sigma0_));
            }
        }

        [[noreturn]] static void fail(const std::string &message) {
            LOG_ERROR("Invalid CMA-ES parameters: {}", message);
            throw ConfigurationError(message);
        }
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_PARAMETERS_HPP
