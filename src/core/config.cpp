#include "pairlink/core/config.hpp"
#include "pairlink/core/logger.hpp"
#include "pairlink/core/utils.hpp"

namespace pairlink::core {

using utils::StringUtils;

namespace {

// "key = value  # note" -> "key = value"; a '#' glued to text is kept
std::string strip_comment(const std::string& line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_DEBUG("Config file {} not readable", filename);
        return false;
    }
    
    std::string section;
    std::string raw;
    std::size_t line_number = 0;
    std::size_t loaded = 0;
    
    while (std::getline(file, raw)) {
        ++line_number;
        auto line = StringUtils::trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }
        
        // [transfer] prefixes the keys below it with "transfer."
        if (line.front() == '[' && line.back() == ']') {
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }
        
        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? "" : StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, skipping", filename, line_number);
            continue;
        }
        
        values_[section.empty() ? key : section + "." + key] = StringUtils::trim(line.substr(eq_pos + 1));
        ++loaded;
    }
    
    LOG_DEBUG("Loaded {} setting(s) from {}", loaded, filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Cannot write config file {}", filename);
        return false;
    }
    
    file << "# pairlink configuration\n";
    
    // Keys are sorted, so each dotted prefix forms one contiguous block
    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        auto section = dot == std::string::npos ? "" : key.substr(0, dot);
        
        if (first || section != current_section) {
            file << "\n";
            first = false;
        }
        current_section = section;
        file << key << " = " << value << "\n";
    }
    
    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    
    LOG_WARN("Config {}='{}' is not a boolean, using {}", key, *value, default_value);
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

double Config::get_double(const std::string& key, double default_value) const {
    return get_as<double>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["transfer.auto_show"] = "true";
    values_["transfer.dismiss_delay_ms"] = "10000";
    values_["transfer.estimator_interval_ms"] = "1000";
    values_["transfer.smoothing_alpha"] = "0.4";
    values_["log.level"] = "info";
    values_["log.file"] = "pairlink.log";
}

}
