#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fedtrust::core {

// Flat "section.key=value" settings shared by the resolver, key store and HTTP client
class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    // Built-in values for every setting fedtrust reads
    static const std::vector<std::pair<std::string_view, std::string_view>>& default_values();
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    // Reads a whole number of Duration units, e.g. "resolver.timeout_ms" as milliseconds.
    // Negative or malformed values give the default.
    template<typename Duration>
    Duration get_duration(const std::string& key, Duration default_value) const {
        auto count = get_as<long long>(key);
        if (!count || *count < 0) {
            return default_value;
        }
        return Duration(static_cast<typename Duration::rep>(*count));
    }
    
    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;
};

}
