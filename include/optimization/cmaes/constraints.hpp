// File: optimization/cmaes/constraints.hpp

#ifndef OPTIMIZATION_CMAES_CONSTRAINTS_HPP
#define OPTIMIZATION_CMAES_CONSTRAINTS_HPP

#include <stdexcept>
#include <string>
#include <utility>

#include "common/logging/logger.hpp"
#include "optimization/cmaes/objective.hpp"
#include "optimization/cmaes/state.hpp"

namespace optimization::cmaes {

    /**
     * @brief Constraint handling composed around an objective.
     *
     * repair() maps a sampled candidate onto a feasible one, evaluate() scores an individual through the
     * objective (optionally adding penalties). Both must preserve the individual's shape.
     */
    template<FloatingPoint T = double>
    class Constraints {
    public:
        virtual ~Constraints() = default;

        [[nodiscard]] virtual Individual<T> repair(const Individual<T> &candidate) const = 0;

        [[nodiscard]] virtual T evaluate(const Objective<T> &objective, const Individual<T> &individual) const = 0;
    };

    template<FloatingPoint T = double>
    class NoConstraints final : public Constraints<T> {
    public:
        [[nodiscard]] Individual<T> repair(const Individual<T> &candidate) const override { return candidate; }

        [[nodiscard]] T evaluate(const Objective<T> &objective, const Individual<T> &individual) const override {
            return objective.evaluate(individual);
        }
    };

    /**
     * @brief Element-wise box [lower, upper]; bounds are indexed like the flattened individual.
     */
    template<FloatingPoint T = double>
    class BoxConstraints final : public Constraints<T> {
    public:
        BoxConstraints(VectorType<T> lower, VectorType<T> upper) : lower_(std::move(lower)), upper_(std::move(upper)) {
            if (lower_.size() != upper_.size() || lower_.size() == 0) {
                LOG_ERROR("Box bounds have mismatched sizes: {} and {}", lower_.size(), upper_.size());
                throw std::invalid_argument("Lower and upper bounds must be non-empty and have the same size.");
            }
            if ((lower_.array() > upper_.array()).any()) {
                LOG_ERROR("Box lower bound exceeds upper bound: lower = {}, upper = {}", lower_, upper_);
                throw std::invalid_argument("Lower bounds must not exceed upper bounds.");
            }
        }

        [[nodiscard]] Individual<T> repair(const Individual<T> &candidate) const override {
            checkSize(candidate);
            Individual<T> repaired = candidate;
            auto flat = Eigen::Map<VectorType<T>>(repaired.data(), repaired.size());
            flat = flat.cwiseMax(lower_).cwiseMin(upper_);
            return repaired;
        }

        [[nodiscard]] T evaluate(const Objective<T> &objective, const Individual<T> &individual) const override {
            return objective.evaluate(individual);
        }

        [[nodiscard]] bool isFeasible(const Individual<T> &individual) const {
            checkSize(individual);
            const auto flat = Eigen::Map<const VectorType<T>>(individual.data(), individual.size());
            return (flat.array() >= lower_.array()).all() && (flat.array() <= upper_.array()).all();
        }

        [[nodiscard]] const VectorType<T> &lower() const noexcept { return lower_; }
        [[nodiscard]] const VectorType<T> &upper() const noexcept { return upper_; }

    private:
        VectorType<T> lower_;
        VectorType<T> upper_;

        void checkSize(const Individual<T> &individual) const {
            if (individual.size() != lower_.size()) {
                throw std::invalid_argument("Individual has " + std::to_string(individual.size()) +
                                            " elements but the box has " + std::to_string(lower_.size()) + ".");
            }
        }
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_CONSTRAINTS_HPP
