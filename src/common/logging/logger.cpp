// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_;
    std::mutex Logger::mutex_;

    void Logger::configure(const LogSettings &settings) {
        std::lock_guard lock(mutex_);
        install(settings);
    }

    spdlog::level::level_enum Logger::parseLevel(const std::string &name) {
        const auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            std::cerr << "Unknown log level '" << name << "', using info" << std::endl;
            return spdlog::level::info;
        }
        return level;
    }

    spdlog::level::level_enum Logger::level() {
        const auto logger = instance();
        return logger ? logger->level() : spdlog::level::off;
    }

    void Logger::flush() {
        if (const auto logger = instance()) {
            logger->flush();
        }
    }

    std::shared_ptr<spdlog::logger> Logger::instance() {
        std::lock_guard lock(mutex_);
        if (!logger_) {
            install(LogSettings{});
        }
        return logger_;
    }

    // Caller holds mutex_. On failure the previous logger, if any, stays active.
    void Logger::install(const LogSettings &settings) {
        try {
            std::filesystem::create_directories(settings.directory);
            const auto file = std::filesystem::path(settings.directory) / settings.filename;

            std::vector<spdlog::sink_ptr> sinks{
                    std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                    std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), true)};
            auto logger = std::make_shared<spdlog::logger>(name_, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(settings.level));
            logger->set_pattern(settings.pattern);

            // replaces the registry entry of the previous default logger with the same name
            spdlog::set_default_logger(logger);
            logger_ = std::move(logger);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }
    }

} // namespace common::logging
