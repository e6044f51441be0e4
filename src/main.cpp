// File: main.cpp

#include <cstdlib>
#include <exception>
#include <string>

#include "common/logging/logger.hpp"
#include "executor.hpp"

int main(const int argc, char *argv[]) {
    const std::string configuration_file = argc > 1 ? argv[1] : "configuration.yaml";
    try {
        return Executor::execute(configuration_file);
    } catch (const std::exception &e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
}
