// File: optimization/cmaes/objective.hpp

#ifndef OPTIMIZATION_CMAES_OBJECTIVE_HPP
#define OPTIMIZATION_CMAES_OBJECTIVE_HPP

#include <functional>
#include <stdexcept>
#include <utility>

#include "optimization/cmaes/state.hpp"
#include "types/concepts.hpp"

namespace optimization::cmaes {

    /**
     * @brief Black-box function to minimize. Lower values are better.
     */
    template<FloatingPoint T = double>
    class Objective {
    public:
        virtual ~Objective() = default;

        [[nodiscard]] virtual T evaluate(const Individual<T> &individual) const = 0;
    };

    template<FloatingPoint T = double>
    class FunctionObjective final : public Objective<T> {
    public:
        using Function = std::function<T(const Individual<T> &)>;

        explicit FunctionObjective(Function function) : function_(std::move(function)) {
            if (!function_) {
                throw std::invalid_argument("Objective function must be callable.");
            }
        }

        [[nodiscard]] T evaluate(const Individual<T> &individual) const override { return function_(individual); }

    private:
        Function function_;
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_OBJECTIVE_HPP
