#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the download engine, backed by spdlog.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tapedeck::core {

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
 * Sink layout for Logger::initialize
 */
struct LogOptions {
    LogLevel consoleLevel = LogLevel::Info;
    LogLevel fileLevel = LogLevel::Debug;
    std::filesystem::path directory;            // empty = console only
    std::size_t maxFileBytes = 5 * 1024 * 1024;
    std::size_t maxFiles = 3;
};

/**
 * Logger - singleton wrapper around one spdlog logger.
 *
 * The console sink writes to stderr so command output on stdout stays
 * parseable. The optional file sink rotates downloads.log in the log
 * directory. Messages logged before initialize() are dropped.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * (Re)build the sinks. Safe to call again once the config is loaded.
     */
    void initialize(const LogOptions& options) {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(toSpdlog(options.consoleLevel));
        console->set_pattern("%^%L%$ %H:%M:%S %v");
        sinks.push_back(console);

        std::string fileProblem;
        if (!options.directory.empty()) {
            try {
                std::filesystem::create_directories(options.directory);
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (options.directory / "downloads.log").string(),
                    options.maxFileBytes, options.maxFiles);
                file->set_level(toSpdlog(options.fileLevel));
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& ex) {
                fileProblem = ex.what();
            } catch (const std::filesystem::filesystem_error& ex) {
                fileProblem = ex.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("tapedeck", sinks.begin(), sinks.end());
        // The logger passes everything its sinks might want; each sink filters
        logger->set_level(std::min(toSpdlog(options.consoleLevel),
                                   sinks.size() > 1 ? toSpdlog(options.fileLevel) : spdlog::level::off));
        logger->flush_on(spdlog::level::warn);
        m_logger = logger;

        if (!fileProblem.empty()) {
            m_logger->error("File logging disabled for {}: {}", options.directory.string(), fileProblem);
        }
    }

    /**
     * Change the console threshold without touching the file sink
     */
    void setConsoleLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_logger || m_logger->sinks().empty()) {
            return;
        }
        m_logger->sinks().front()->set_level(toSpdlog(level));
        m_logger->set_level(std::min(m_logger->level(), toSpdlog(level)));
    }

    void flush() {
        auto logger = current();
        if (logger) {
            logger->flush();
        }
    }

    /**
     * Parse a config level name; accepts spdlog's names plus "warning"
     * and "critical". Unknown names map to Info.
     */
    static LogLevel parseLevel(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return LogLevel::Info;
        }
        return fromSpdlog(level);
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(spdlog::level::critical, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() {
        flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> current() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_logger;
    }

    template<typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        auto logger = current();
        if (logger) {
            logger->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    static spdlog::level::level_enum toSpdlog(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    static LogLevel fromSpdlog(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace:    return LogLevel::Trace;
            case spdlog::level::debug:    return LogLevel::Debug;
            case spdlog::level::warn:     return LogLevel::Warn;
            case spdlog::level::err:      return LogLevel::Error;
            case spdlog::level::critical: return LogLevel::Critical;
            case spdlog::level::off:      return LogLevel::Off;
            default:                      return LogLevel::Info;
        }
    }

    std::mutex m_mutex;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace tapedeck::core

#define TAPEDECK_LOG_DEBUG(...) tapedeck::core::Logger::instance().debug(__VA_ARGS__)
#define TAPEDECK_LOG_INFO(...)  tapedeck::core::Logger::instance().info(__VA_ARGS__)
#define TAPEDECK_LOG_WARN(...)  tapedeck::core::Logger::instance().warn(__VA_ARGS__)
#define TAPEDECK_LOG_ERROR(...) tapedeck::core::Logger::instance().error(__VA_ARGS__)
