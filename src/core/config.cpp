#include "uplift/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace uplift::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# uplift configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return true;
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
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

int64_t Config::get_int64(const std::string& key, int64_t default_value) const {
    auto value = get_as<int64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["upload.chunk_size"] = "5242880";
    values_["upload.max_concurrent_parts"] = "3";
    values_["upload.max_retries"] = "3";
    values_["upload.retry_delay_ms"] = "1000";
    values_["upload.exponential_backoff"] = "true";
    values_["upload.part_timeout_ms"] = "120000";
    values_["upload.stale_threshold_ms"] = "300000";
    values_["constraints.network"] = "CONNECTED";
    values_["constraints.auto_resume"] = "true";
    values_["constraints.auto_resume_delay_ms"] = "2000";
    values_["recovery.retention_days"] = "7";
    values_["store.database"] = "~/.uplift/uplift.db";
    values_["backend.base_url"] = "";
    values_["backend.timeout_ms"] = "30000";
    values_["backend.verify_tls"] = "true";
    values_["log.level"] = "info";
    values_["log.file"] = "uplift.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(*start)) {
        start++;
    }
    if (start == str.end()) {
        return "";
    }
    
    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(*end));
    
    return std::string(start, end + 1);
}

}
