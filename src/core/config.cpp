#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include <fstream>

namespace fedtrust::core {

namespace {

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

const std::vector<std::pair<std::string_view, std::string_view>>& Config::default_values() {
    static const std::vector<std::pair<std::string_view, std::string_view>> defaults = {
        {"server.name", "localhost"},
        {"server.key_id", "ed25519:auto"},
        {"keys.database", "fedtrust.db"},
        {"keys.max_validity_days", "7"},
        {"keys.local_validity_days", "7"},
        {"keys.negative_cache_minutes", "10"},
        {"resolver.timeout_ms", "10000"},
        {"resolver.well_known_ttl_hours", "24"},
        {"resolver.error_ttl_minutes", "60"},
        {"resolver.backoff_base_ms", "1000"},
        {"resolver.backoff_max_exponent", "10"},
        {"resolver.backoff_prune_hours", "24"},
        {"http.user_agent", "fedtrust/1.0"},
        {"http.max_redirects", "5"},
        {"http.verify_tls", "true"},
        {"log.level", "info"},
        {"log.file", "fedtrust.log"},
        {"log.max_size_kb", "5120"},
        {"log.max_files", "3"}
    };
    return defaults;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring line without a key=value pair", filename, line_number);
            continue;
        }
        
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# fedtrust configuration\n";
    
    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (first || section != current_section) {
            file << "\n";
            if (!section.empty()) {
                file << "# " << section << "\n";
            }
            current_section = section;
            first = false;
        }
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    for (const auto& [key, value] : default_values()) {
        values_[std::string(key)] = std::string(value);
    }
}

}
