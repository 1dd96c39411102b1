#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace fedtrust::core {

class Config;

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

struct LogOptions {
    LogLevel level = LogLevel::Info;
    std::string file;                   // empty: console only
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    
    // Reads log.level, log.file, log.max_size_kb and log.max_files
    static LogOptions from_config(const Config& config);
};

// Command output goes to stdout, so the console sink writes to stderr.
class Logger {
public:
    static void initialize(const LogOptions& options);
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();
    
    // Falls back to spdlog's default logger until initialize() has run.
    static std::shared_ptr<spdlog::logger> get();
    
    static LogLevel parse_level(std::string_view name, LogLevel fallback = LogLevel::Info);
    static std::string_view level_name(LogLevel level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::fedtrust::core::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::fedtrust::core::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::fedtrust::core::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::fedtrust::core::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::fedtrust::core::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::fedtrust::core::Logger::get(), __VA_ARGS__)
