// File: optimization/cmaes/random_source.hpp

#ifndef OPTIMIZATION_CMAES_RANDOM_SOURCE_HPP
#define OPTIMIZATION_CMAES_RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>

#include "types/concepts.hpp"

namespace optimization::cmaes {

    /**
     * @brief Seedable source of standard normal draws, passed explicitly into every update step.
     * Counts the draws it hands out so callers can audit consumption per generation.
     */
    template<FloatingPoint T = double>
    class RandomSource {
    public:
        using Engine = std::mt19937;
        using Seed = Engine::result_type;

        RandomSource() : RandomSource(std::random_device{}()) {}

        explicit RandomSource(const Seed seed) : engine_(seed), seed_(seed) {}

        T normal() {
            ++draws_;
            return distribution_(engine_);
        }

        void seed(const Seed seed) {
            engine_.seed(seed);
            distribution_.reset();
            seed_ = seed;
            draws_ = 0;
        }

        [[nodiscard]] Seed initialSeed() const noexcept { return seed_; }

        [[nodiscard]] std::uint64_t draws() const noexcept { return draws_; }

    private:
        Engine engine_;
        std::normal_distribution<T> distribution_{T(0), T(1)};
        Seed seed_;
        std::uint64_t draws_ = 0;
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_RANDOM_SOURCE_HPP
