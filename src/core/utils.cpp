#include "fedtrust/core/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace fedtrust::core::utils {

std::string StringUtils::trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(whitespace);
    return std::string(str.substr(first, last - first + 1));
}

std::string StringUtils::to_lower(std::string_view str) {
    std::string result(str);
    for (auto& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    return std::filesystem::exists(path);
}

std::optional<std::string> FileUtils::read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    
    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return content;
}

bool FileUtils::write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    
    file << content;
    return file.good();
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
    auto rest = path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1);
    return rest.empty() ? base : base / rest;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

std::int64_t TimeUtils::to_unix_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_millis(std::int64_t millis) {
    // system_clock may count in nanoseconds, so saturate rather than overflow
    constexpr auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::duration::max()).count();
    millis = std::clamp<std::int64_t>(millis, -limit, limit);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

std::string TimeUtils::format_duration(std::chrono::milliseconds duration) {
    struct Unit {
        std::int64_t millis;
        const char* suffix;
    };
    // Key validity periods run to days
    static constexpr Unit units[] = {
        {86400000, "d"}, {3600000, "h"}, {60000, "m"}, {1000, "s"}
    };
    
    auto ms = static_cast<std::int64_t>(duration.count());
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    
    // Largest unit plus the next one down, e.g. "2m 5s"
    for (std::size_t i = 0; i + 1 < std::size(units); ++i) {
        if (ms >= units[i].millis) {
            return std::to_string(ms / units[i].millis) + units[i].suffix + " " +
                   std::to_string(ms % units[i].millis / units[i + 1].millis) + units[i + 1].suffix;
        }
    }
    return std::to_string(ms / 1000) + "s";
}

}
