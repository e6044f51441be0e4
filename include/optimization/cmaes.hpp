// File: optimization/cmaes.hpp

#ifndef CMAES_HPP
#define CMAES_HPP

#include <utility>
#include <vector>

#include "optimization/cmaes/constraints.hpp"
#include "optimization/cmaes/initializer.hpp"
#include "optimization/cmaes/objective.hpp"
#include "optimization/cmaes/parameters.hpp"
#include "optimization/cmaes/random_source.hpp"
#include "optimization/cmaes/state.hpp"
#include "optimization/cmaes/update.hpp"

namespace optimization {

    /**
     * @brief Covariance Matrix Adaptation Evolution Strategy, (mu/mu_W, lambda)-CMA-ES.
     *
     * A strategy object for an external driver: the driver creates the state once with initialState(),
     * allocates the survivor buffer with allocatePopulation() and calls updateState() once per generation
     * until its own stopping policy triggers or a Stop outcome is returned.
     *
     * Example:
     *   CMAES<> strategy(cmaes::Options<>{.mu = 3, .lambda = 6});
     *   auto state = strategy.initialState(x0);
     *   auto population = strategy.allocatePopulation(x0);
     *   for (int itr = 0; itr < 200 && !strategy.updateState(f, box, state, population, itr, rng).stop(); ++itr) {}
     */
    template<FloatingPoint T = double>
    class CMAES {
    public:
        using Options = cmaes::Options<T>;
        using Parameters = cmaes::Parameters<T>;
        using State = cmaes::State<T>;
        using Individual = cmaes::Individual<T>;
        using Population = std::vector<Individual>;
        using StepResult = cmaes::StepResult<T>;

        explicit CMAES(const Options &options = Options{}) : parameters_(options) {}

        explicit CMAES(Parameters parameters) : parameters_(std::move(parameters)) {}

        [[nodiscard]] const Parameters &parameters() const noexcept { return parameters_; }

        // Number of survivors the driver has to hold per generation
        [[nodiscard]] int populationSize() const noexcept { return parameters_.mu(); }

        [[nodiscard]] State initialState(const Individual &sample) const {
            return cmaes::initialize<T>(parameters_, sample);
        }

        [[nodiscard]] Population allocatePopulation(const Individual &sample) const {
            return Population(static_cast<size_t>(parameters_.mu()), sample);
        }

        StepResult updateState(const cmaes::Objective<T> &objective, const cmaes::Constraints<T> &constraints,
                               State &state, Population &population, const int iteration,
                               cmaes::RandomSource<T> &random) const {
            return cmaes::update<T>(objective, constraints, state, population, parameters_, iteration, random);
        }

        StepResult updateState(const cmaes::Objective<T> &objective, State &state, Population &population,
                               const int iteration, cmaes::RandomSource<T> &random) const {
            static const cmaes::NoConstraints<T> unconstrained{};
            return updateState(objective, unconstrained, state, population, iteration, random);
        }

        [[nodiscard]] static T value(const State &state) { return state.value(); }

        [[nodiscard]] static Individual minimizer(const State &state) { return state.minimizer(); }

    private:
        Parameters parameters_;
    };

} // namespace optimization

#endif // CMAES_HPP
