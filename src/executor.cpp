// File: executor.cpp

#include "executor.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

using optimization::cmaes::BoxConstraints;
using optimization::cmaes::FunctionObjective;
using optimization::cmaes::Individual;
using optimization::cmaes::NoConstraints;
using optimization::cmaes::RandomSource;
using optimization::cmaes::VectorType;

int Executor::execute(const std::string &configuration_file) {
    config::initialize(configuration_file);
    configureLogging();
    config::show();

    const Strategy strategy(Strategy::Options::fromConfiguration());
    const Settings settings = loadSettings();
    if (settings.dimension < 1) {
        throw std::invalid_argument("demo.dimension must be positive.");
    }

    const auto objective = makeObjective(settings.objective);
    const auto constraints = makeConstraints(settings);
    RandomSource<double> random = settings.seed ? RandomSource<double>(*settings.seed) : RandomSource<double>();

    const Individual<double> initial = Individual<double>::Constant(settings.dimension, 1, settings.initial_value);
    auto state = strategy.initialState(initial);
    auto population = strategy.allocatePopulation(initial);

    LOG_INFO("Minimizing '{}' in {} dimensions (seed {}, at most {} generations)", settings.objective,
             settings.dimension, random.initialSeed(), settings.max_iterations);

    int iteration = 0;
    bool converged = false;
    for (; iteration < settings.max_iterations; ++iteration) {
        const auto result = strategy.updateState(*objective, *constraints, state, population, iteration, random);
        if (result.stop()) {
            LOG_ERROR("Strategy stopped after {} generations: {}", iteration, result.error->message);
            return EXIT_FAILURE;
        }

        if (settings.report_interval > 0 && iteration % settings.report_interval == 0) {
            LOG_INFO("Generation {:>5}: best = {:.6e}, sigma = {:.4e}", iteration, Strategy::value(state), state.sigma);
        }

        if (Strategy::value(state) <= settings.abstol) {
            converged = true;
            ++iteration;
            break;
        }
    }

    LOG_INFO("{} after {} generations ({} evaluations): f = {:.6e}", converged ? "Converged" : "Budget exhausted",
             iteration, random.draws() / static_cast<std::uint64_t>(settings.dimension), Strategy::value(state));
    LOG_INFO("Minimizer: {}", optimization::cmaes::flatten<double>(Strategy::minimizer(state)));
    return EXIT_SUCCESS;
}

void Executor::configureLogging() {
    common::logging::LogSettings settings;
    settings.directory = config::get<std::string>("logging.directory", settings.directory);
    settings.filename = config::get<std::string>("logging.file", settings.filename);
    settings.level = config::get<std::string>("logging.level", settings.level);
    common::logging::Logger::configure(settings);
}

Executor::Settings Executor::loadSettings() {
    Settings settings;
    settings.objective = config::get<std::string>("demo.objective", settings.objective);
    settings.dimension = config::get<int>("demo.dimension", settings.dimension);
    settings.initial_value = config::get<double>("demo.initial_value", settings.initial_value);
    settings.seed = config::get<unsigned int>("demo.seed");
    settings.lower = config::get<double>("demo.lower");
    settings.upper = config::get<double>("demo.upper");
    settings.max_iterations = config::get<int>("demo.max_iterations", settings.max_iterations);
    settings.abstol = config::get<double>("demo.abstol", settings.abstol);
    settings.report_interval = config::get<int>("demo.report_interval", settings.report_interval);
    return settings;
}

std::unique_ptr<optimization::cmaes::Objective<double>> Executor::makeObjective(const std::string &name) {
    using Objective = FunctionObjective<double>;

    if (name == "sphere") {
        return std::make_unique<Objective>([](const Individual<double> &x) { return x.squaredNorm(); });
    }
    if (name == "rosenbrock") {
        return std::make_unique<Objective>([](const Individual<double> &x) {
            const VectorType<double> v = optimization::cmaes::flatten<double>(x);
            double sum = 0.0;
            for (Eigen::Index i = 0; i + 1 < v.size(); ++i) {
                sum += 100.0 * std::pow(v(i + 1) - v(i) * v(i), 2) + std::pow(1.0 - v(i), 2);
            }
            return sum;
        });
    }
    if (name == "ellipsoid") {
        return std::make_unique<Objective>([](const Individual<double> &x) {
            const VectorType<double> v = optimization::cmaes::flatten<double>(x);
            const double denominator = v.size() > 1 ? static_cast<double>(v.size() - 1) : 1.0;
            double sum = 0.0;
            for (Eigen::Index i = 0; i < v.size(); ++i) {
                sum += std::pow(1e6, static_cast<double>(i) / denominator) * v(i) * v(i);
            }
            return sum;
        });
    }

    LOG_ERROR("Unknown demo objective '{}'", name);
    throw std::invalid_argument("Unknown objective '" + name + "', expected sphere, rosenbrock or ellipsoid.");
}

std::unique_ptr<optimization::cmaes::Constraints<double>> Executor::makeConstraints(const Settings &settings) {
    if (!settings.lower && !settings.upper) {
        return std::make_unique<NoConstraints<double>>();
    }

    const double lower = settings.lower.value_or(-std::numeric_limits<double>::infinity());
    const double upper = settings.upper.value_or(std::numeric_limits<double>::infinity());
    LOG_INFO("Using box constraints [{}, {}]", lower, upper);
    return std::make_unique<BoxConstraints<double>>(VectorType<double>::Constant(settings.dimension, lower),
                                                    VectorType<double>::Constant(settings.dimension, upper));
}
