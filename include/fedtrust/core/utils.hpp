#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fedtrust::core::utils {

class StringUtils {
public:
    static std::string trim(std::string_view str);
    
    // ASCII only; server names and config values are compared case-insensitively
    static std::string to_lower(std::string_view str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::string> read_file(const std::filesystem::path& path);
    static bool write_file(const std::filesystem::path& path, const std::string& content);
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    
    // Matrix timestamps are milliseconds since the unix epoch
    static std::int64_t to_unix_millis(std::chrono::system_clock::time_point time);
    // Saturates at the ends of system_clock's range
    static std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
    
    // Human-readable form for log lines, e.g. "2m 5s"
    static std::string format_duration(std::chrono::milliseconds duration);
};

}
