// File: optimization/cmaes/errors.hpp

#ifndef OPTIMIZATION_CMAES_ERRORS_HPP
#define OPTIMIZATION_CMAES_ERRORS_HPP

#include <Eigen/Dense>
#include <stdexcept>
#include <string>

#include "types/concepts.hpp"

namespace optimization::cmaes {

    /**
     * @brief Invalid strategy parameters, raised while building Parameters or the initial State.
     * Nothing is constructed when it is thrown.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief The covariance matrix could no longer be decomposed.
     * Returned by value (never thrown) together with a snapshot of the offending matrix.
     */
    template<FloatingPoint T = double>
    struct NumericDegeneracyError {
        std::string message;
        Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic> covariance;
    };

} // namespace optimization::cmaes

#endif // OPTIMIZATION_CMAES_ERRORS_HPP
