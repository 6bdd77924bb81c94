#pragma once

#include <algorithm>
#include <cctype>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden {
namespace common {

/**
 * INI-style configuration store.
 *
 * Lines are "key = value" grouped under "[section]" headers; keys are
 * addressed as "section.key". '#' and ';' start comment lines.
 * Instances are owned by whoever composes the runtime.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // Load configuration from file, replacing the current contents
    bool load_from_file(const std::string& filename);

    // Load configuration from an in-memory document
    void load_from_string(const std::string& content);

    template<typename T>
    T get(const std::string& key, const T& default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            return default_value;
        }

        T value;
        if (!parse_value<T>(it->second, value)) {
            return default_value;
        }
        return value;
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::vector<ChangeCallback> callbacks;
        std::string text = to_string(value);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config_map_[key] = text;
            callbacks = change_callbacks_;
        }

        for (const auto& callback : callbacks) {
            callback(key, text);
        }
    }

    bool has_key(const std::string& key) const;

    // Keys under "section." with the prefix stripped
    std::vector<std::string> get_section_keys(const std::string& section) const;

    using ChangeCallback = std::function<void(const std::string& key, const std::string& value)>;
    void watch_changes(ChangeCallback callback);

    // Re-read the file last passed to load_from_file
    bool reload();

    size_t size() const;

private:
    template<typename T>
    bool parse_value(const std::string& str, T& out) const {
        std::istringstream iss(str);
        iss >> out;
        return !iss.fail();
    }

    template<typename T>
    std::string to_string(const T& value) const {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    void parse_document(std::istream& input);
    static void parse_config_line(const std::string& line, std::string& current_section,
                                  std::unordered_map<std::string, std::string>& out);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> config_map_;
    std::string config_filename_;
    std::vector<ChangeCallback> change_callbacks_;
};

template<>
inline bool ConfigManager::parse_value<std::string>(const std::string& str, std::string& out) const {
    out = str;
    return true;
}

template<>
inline bool ConfigManager::parse_value<bool>(const std::string& str, bool& out) const {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower_str == "true" || lower_str == "1" || lower_str == "yes" || lower_str == "on") {
        out = true;
        return true;
    }
    if (lower_str == "false" || lower_str == "0" || lower_str == "no" || lower_str == "off") {
        out = false;
        return true;
    }
    return false;
}

template<>
inline std::string ConfigManager::to_string<bool>(const bool& value) const {
    return value ? "true" : "false";
}

template<>
inline std::string ConfigManager::to_string<std::string>(const std::string& value) const {
    return value;
}

} // namespace common
} // namespace warden
