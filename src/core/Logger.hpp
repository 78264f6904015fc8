#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the download service.
 * Uses spdlog as the underlying logging library.
 */

#include "../utils/StringUtils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace trackdl::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Two sinks:
 * - Console output with colors
 * - Rotating file output (optional, needs a log directory)
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory; empty disables the file sink
     */
    void initialize(LogLevel level = LogLevel::Info,
                    const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "trackdl.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>("trackdl", sinks.begin(), sinks.end());
            logger->set_level(toSpdlogLevel(level));
            logger->flush_on(spdlog::level::warn);

            std::atomic_store(&m_logger, logger);
            spdlog::set_default_logger(logger);

        } catch (const spdlog::spdlog_ex& ex) {
            auto fallback = fallbackLogger(level);
            fallback->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            auto fallback = fallbackLogger(level);
            fallback->error("Cannot create log directory {}: {}", logDir, ex.what());
        }
    }

    /**
     * Set log level
     */
    void setLevel(LogLevel level) {
        if (auto logger = get()) {
            logger->set_level(toSpdlogLevel(level));
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (auto logger = get()) {
            logger->flush();
        }
    }

    /**
     * Parse a config string ("debug", "warn", ...) into a level.
     * Unknown strings map to Info.
     */
    static LogLevel parseLevel(const std::string& value) {
        const std::string name = utils::StringUtils::toLower(utils::StringUtils::trim(value));
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = get()) {
            logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (auto logger = get()) {
            logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Console-only logger, registered once and reused by later
     * initialize() failures
     */
    std::shared_ptr<spdlog::logger> fallbackLogger(LogLevel level) {
        auto fallback = spdlog::get("trackdl_fallback");
        if (!fallback) {
            fallback = spdlog::stdout_color_mt("trackdl_fallback");
        }
        fallback->set_level(toSpdlogLevel(level));
        std::atomic_store(&m_logger, fallback);
        return fallback;
    }

    // Workers log while the main thread may re-initialize
    std::shared_ptr<spdlog::logger> get() const {
        return std::atomic_load(&m_logger);
    }

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace trackdl::core

// Convenience macros
#define LOG_TRACE(...)    trackdl::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    trackdl::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     trackdl::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     trackdl::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    trackdl::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) trackdl::core::Logger::instance().critical(__VA_ARGS__)
