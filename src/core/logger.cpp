#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/utils.hpp"
#include <algorithm>
#include <vector>

namespace fedtrust::core {

namespace {

constexpr const char* CONSOLE_PATTERN = "%^%l%$: %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}

std::shared_ptr<spdlog::logger> Logger::logger_;

LogOptions LogOptions::from_config(const Config& config) {
    LogOptions options;
    options.level = Logger::parse_level(config.get_string("log.level", "info"));
    options.file = config.get_string("log.file");
    
    auto size_kb = config.get_int("log.max_size_kb", static_cast<int>(options.max_file_size / 1024));
    if (size_kb > 0) {
        options.max_file_size = static_cast<std::size_t>(size_kb) * 1024;
    }
    auto files = config.get_int("log.max_files", static_cast<int>(options.max_files));
    if (files > 0) {
        options.max_files = static_cast<std::size_t>(files);
    }
    return options;
}

void Logger::initialize(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(to_spdlog(options.level));
    console_sink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console_sink);
    
    // The file keeps debug detail whatever the console level
    if (!options.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_size, options.max_files);
        file_sink->set_level(std::min(to_spdlog(options.level), spdlog::level::debug));
        file_sink->set_pattern(FILE_PATTERN);
        sinks.push_back(file_sink);
    }
    
    auto level = options.file.empty() ? to_spdlog(options.level)
                                      : std::min(to_spdlog(options.level), spdlog::level::debug);
    logger_ = std::make_shared<spdlog::logger>("fedtrust", sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);
    
    LOG_DEBUG("Logging at {} to {}", level_name(options.level),
              options.file.empty() ? std::string("console") : options.file);
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    LogOptions options;
    options.file = log_file;
    options.level = level;
    initialize(options);
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    
    if (auto fallback = spdlog::default_logger()) {
        return fallback;
    }
    
    // spdlog::shutdown() drops the default logger as well
    static auto sinkless = std::make_shared<spdlog::logger>("fedtrust-null");
    return sinkless;
}

LogLevel Logger::parse_level(std::string_view name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(name);
    
    // spdlog maps unknown names to "off", so check the round trip
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return fallback;
    }
    return static_cast<LogLevel>(level);
}

std::string_view Logger::level_name(LogLevel level) {
    auto name = spdlog::level::to_string_view(to_spdlog(level));
    return std::string_view(name.data(), name.size());
}

}
