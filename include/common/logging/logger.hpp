// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include "common/formatting/fmt_eigen.hpp"
#include "common/formatting/fmt_vector.hpp"

// NOTE: Logger MUST NOT depend on config::Configuration, the configuration itself logs while loading
namespace common::logging {

    struct LogSettings {
        std::string directory = "./logs";
        std::string filename = "cmaes.log";
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%n] [%s:%# %!] %v";
    };

    /*
     * Process-wide spdlog logger writing to the console and to <directory>/<filename>.
     * The first log call installs it with default settings; configure() replaces it at any time.
     */
    class Logger {
    public:
        Logger() = delete;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const spdlog::source_loc &source, const char *format,
                        Args &&...args);

        static void configure(const LogSettings &settings);

        // Unknown names fall back to info
        [[nodiscard]] static spdlog::level::level_enum parseLevel(const std::string &name);

        [[nodiscard]] static spdlog::level::level_enum level();

        static void flush();

    private:
        static constexpr const char *name_ = "cmaes";
        static std::shared_ptr<spdlog::logger> logger_;
        static std::mutex mutex_;

        static std::shared_ptr<spdlog::logger> instance();

        static void install(const LogSettings &settings);
    };

    template<typename... Args>
    void Logger::log(const spdlog::level::level_enum level, const spdlog::source_loc &source, const char *format,
                     Args &&...args) {
        const auto logger = instance();
        if (logger && !logger->should_log(level)) {
            return;
        }

        std::string message;
        if constexpr (sizeof...(args) > 0) {
            message = fmt::vformat(format, fmt::make_format_args(args...));
        } else {
            message = format;
        }

        if (logger) {
            logger->log(source, level, message);
        } else {
            std::cerr << message << std::endl;
        }
    }

} // namespace common::logging

#define CMAES_LOG(level, fmt, ...)                                                                                     \
    common::logging::Logger::log(level, spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) CMAES_LOG(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) CMAES_LOG(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) CMAES_LOG(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) CMAES_LOG(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) CMAES_LOG(spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) CMAES_LOG(spdlog::level::critical, fmt, ##__VA_ARGS__)

#endif // LOGGER_HPP
