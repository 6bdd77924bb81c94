#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>

namespace warden {
namespace common {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

} // namespace

bool ConfigManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: {}", filename);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_filename_ = filename;
    }
    parse_document(file);

    LOG_INFO("Loaded configuration from: {}", filename);
    return true;
}

void ConfigManager::load_from_string(const std::string& content) {
    std::istringstream input(content);
    parse_document(input);
}

bool ConfigManager::has_key(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_map_.find(key) != config_map_.end();
}

std::vector<std::string> ConfigManager::get_section_keys(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    std::string section_prefix = section + ".";

    for (const auto& [key, value] : config_map_) {
        if (key.compare(0, section_prefix.length(), section_prefix) == 0) {
            keys.push_back(key.substr(section_prefix.length()));
        }
    }

    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::watch_changes(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callbacks_.push_back(std::move(callback));
}

bool ConfigManager::reload() {
    std::string filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filename = config_filename_;
    }
    if (filename.empty()) {
        return false;
    }
    return load_from_file(filename);
}

size_t ConfigManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_map_.size();
}

void ConfigManager::parse_document(std::istream& input) {
    std::unordered_map<std::string, std::string> parsed;
    std::string line;
    std::string current_section;

    while (std::getline(input, line)) {
        parse_config_line(line, current_section, parsed);
    }

    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_map_ = parsed;
        callbacks = change_callbacks_;
    }

    for (const auto& [key, value] : parsed) {
        for (const auto& callback : callbacks) {
            callback(key, value);
        }
    }
}

void ConfigManager::parse_config_line(const std::string& line, std::string& current_section,
                                      std::unordered_map<std::string, std::string>& out) {
    std::string trimmed = trim(line);

    // Skip empty lines and comments
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return;
    }

    if (trimmed.front() == '[' && trimmed.back() == ']') {
        current_section = trim(trimmed.substr(1, trimmed.length() - 2));
        return;
    }

    size_t eq_pos = trimmed.find('=');
    if (eq_pos == std::string::npos) {
        LOG_WARNING("Ignoring malformed config line: {}", trimmed);
        return;
    }

    std::string key = trim(trimmed.substr(0, eq_pos));
    std::string value = trim(trimmed.substr(eq_pos + 1));
    if (key.empty()) {
        return;
    }

    if (!current_section.empty()) {
        key = current_section + "." + key;
    }

    out[key] = value;
}

} // namespace common
} // namespace warden
