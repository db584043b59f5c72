#pragma once

/**
 * Logger.hpp
 * 
 * Process-wide logging for the engine and the CLI.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace lockerfetch::core {

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
 * Logger setup
 */
struct LoggerOptions {
    LogLevel level{LogLevel::Info};
    std::string logDir;             // empty = ./logs
    bool fileSink{true};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};
};

/**
 * Logger class - Thread-safe singleton logger
 * 
 * Console output is coloured and follows the selected level; the rotating
 * file sink always records everything down to trace. Until initialize()
 * is called every log call is a no-op, which keeps unit tests quiet.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }
    
    /**
     * Initialize the logger
     * @param options Level, log directory and file sink settings
     */
    void initialize(const LoggerOptions& options = {}) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(options.level));
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(consoleSink);
            
            if (options.fileSink) {
                std::filesystem::path logPath = options.logDir.empty()
                    ? std::filesystem::current_path() / "logs" / "lockerfetch.log"
                    : std::filesystem::path(options.logDir) / "lockerfetch.log";
                
                std::filesystem::create_directories(logPath.parent_path());
                
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(), options.maxFileSize, options.maxFiles);
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }
            
            m_logger = std::make_shared<spdlog::logger>("lockerfetch", sinks.begin(), sinks.end());
            m_logger->set_level(options.fileSink ? spdlog::level::trace : toSpdlogLevel(options.level));
            m_logger->flush_on(spdlog::level::warn);
            
            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));
            
        } catch (const std::exception& ex) {
            // spdlog_ex or filesystem_error: keep console logging alive
            m_logger = spdlog::stdout_color_mt("lockerfetch_fallback");
            m_logger->set_level(toSpdlogLevel(options.level));
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }
    
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->trace(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->debug(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->info(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->warn(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->error(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) m_logger->critical(fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
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

} // namespace lockerfetch::core

// Convenience macros
#define LOG_TRACE(...)    lockerfetch::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    lockerfetch::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     lockerfetch::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     lockerfetch::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    lockerfetch::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) lockerfetch::core::Logger::instance().critical(__VA_ARGS__)
