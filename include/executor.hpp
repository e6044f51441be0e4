// File: executor.hpp

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <memory>
#include <optional>
#include <string>

#include "optimization/cmaes.hpp"

/*
 * Demo driver: runs the CMA-ES strategy on a built-in benchmark function under a fixed iteration budget and
 * an absolute fitness tolerance, everything read from the YAML configuration.
 */
class Executor {
public:
    using Strategy = optimization::CMAES<double>;

    // Returns the process exit code
    static int execute(const std::string &configuration_file);

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;
    Executor(Executor &&) = delete;
    Executor &operator=(Executor &&) = delete;
    ~Executor() = default;

    Executor() = delete;

private:
    struct Settings {
        std::string objective = "sphere";
        int dimension = 10;
        double initial_value = 1.0;
        std::optional<unsigned int> seed;
        std::optional<double> lower;
        std::optional<double> upper;
        int max_iterations = Strategy::Options::default_iterations;
        double abstol = Strategy::Options::default_abstol;
        int report_interval = 50;
    };

    static void configureLogging();

    static Settings loadSettings();

    static std::unique_ptr<optimization::cmaes::Objective<double>> makeObjective(const std::string &name);

    static std::unique_ptr<optimization::cmaes::Constraints<double>> makeConstraints(const Settings &settings);
};

#endif // EXECUTOR_HPP
