#pragma once

#include <hyper-cri/core/error.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace hyper_cri {

using ConfigValue = std::variant<std::string, int, double, bool>;

/**
 * Layered key/value configuration.
 *
 * Lookup order is: values set directly on this manager, then added layers from
 * the most recently added to the first one. Files use one `key = value` pair
 * per line; `#` starts a comment line.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = default;
    ConfigManager& operator=(const ConfigManager&) = default;
    ConfigManager(ConfigManager&&) = default;
    ConfigManager& operator=(ConfigManager&&) = default;

    template <typename T>
    void set(const std::string& key, const T& value);
    void set(const std::string& key, const char* value);

    template <typename T>
    T get(const std::string& key) const;

    template <typename T>
    T get(const std::string& key, const T& default_value) const;

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    void clear();
    std::vector<std::string> getKeys() const;

    // Configuration layers
    void addLayer(const std::string& layer_name, const ConfigManager& other);
    size_t getLayerCount() const { return layers_.size(); }
    ConfigManager getEffectiveConfig() const;

    // Environment variable expansion (${NAME} in string values)
    ConfigManager expandEnvironmentVariables() const;
    std::string expandValue(const std::string& value) const;

    void loadFromFile(const std::string& filename);
    void loadFromString(const std::string& content);

private:
    std::unordered_map<std::string, ConfigValue> config_data_;
    std::vector<std::pair<std::string, ConfigManager>> layers_;

    ConfigValue getValue(const std::string& key) const;
    static ConfigValue parseScalar(const std::string& text);
};

// Template implementations
template <typename T>
void ConfigManager::set(const std::string& key, const T& value) {
    config_data_[key] = value;
}

template <typename T>
T ConfigManager::get(const std::string& key) const {
    auto value = getValue(key);
    try {
        return std::get<T>(value);
    } catch (const std::bad_variant_access&) {
        throw SandboxError(ErrorCode::INVALID_TYPE, "Invalid type for configuration key: " + key);
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, const T& default_value) const {
    if (!has(key)) {
        return default_value;
    }
    return get<T>(key);
}

} // namespace hyper_cri
