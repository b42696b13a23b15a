#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <hyper-cri/core/config.hpp>
#include <sstream>

namespace hyper_cri {

namespace {

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

} // namespace

ConfigValue ConfigManager::getValue(const std::string& key) const
{
    auto it = config_data_.find(key);
    if (it != config_data_.end()) {
        return it->second;
    }

    // Later layers override earlier ones
    for (auto layer_it = layers_.rbegin(); layer_it != layers_.rend(); ++layer_it) {
        if (layer_it->second.has(key)) {
            return layer_it->second.getValue(key);
        }
    }

    throw SandboxError(ErrorCode::CONFIG_MISSING, "Configuration key not found: " + key);
}

void ConfigManager::set(const std::string& key, const char* value)
{
    config_data_[key] = std::string(value);
}

bool ConfigManager::has(const std::string& key) const
{
    if (config_data_.find(key) != config_data_.end()) {
        return true;
    }

    return std::any_of(layers_.begin(), layers_.end(),
                       [&key](const auto& layer) { return layer.second.has(key); });
}

void ConfigManager::remove(const std::string& key)
{
    config_data_.erase(key);
}

void ConfigManager::clear()
{
    config_data_.clear();
    layers_.clear();
}

std::vector<std::string> ConfigManager::getKeys() const
{
    auto effective = getEffectiveConfig();
    std::vector<std::string> keys;
    keys.reserve(effective.config_data_.size());
    for (const auto& [key, value] : effective.config_data_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::addLayer(const std::string& layer_name, const ConfigManager& other)
{
    layers_.emplace_back(layer_name, other);
}

ConfigManager ConfigManager::getEffectiveConfig() const
{
    ConfigManager result;

    for (const auto& [layer_name, layer_config] : layers_) {
        auto flattened = layer_config.getEffectiveConfig();
        for (const auto& [key, value] : flattened.config_data_) {
            result.config_data_[key] = value;
        }
    }

    // Direct values win over every layer
    for (const auto& [key, value] : config_data_) {
        result.config_data_[key] = value;
    }

    return result;
}

ConfigManager ConfigManager::expandEnvironmentVariables() const
{
    ConfigManager result = getEffectiveConfig();

    for (auto& [key, value] : result.config_data_) {
        if (std::holds_alternative<std::string>(value)) {
            value = expandValue(std::get<std::string>(value));
        }
    }

    return result;
}

std::string ConfigManager::expandValue(const std::string& value) const
{
    std::string result = value;
    size_t start = 0;

    while ((start = result.find("${", start)) != std::string::npos) {
        size_t end = result.find('}', start);
        if (end == std::string::npos) {
            break; // Malformed input
        }

        std::string var_name = result.substr(start + 2, end - start - 2);
        const char* env_value = std::getenv(var_name.c_str());

        if (env_value) {
            std::string replacement = env_value;
            result.replace(start, end - start + 1, replacement);
            start += replacement.length();
        }
        else {
            // Unset variables are left in place
            start = end + 1;
        }
    }

    return result;
}

void ConfigManager::loadFromFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw SandboxError(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
}

void ConfigManager::loadFromString(const std::string& content)
{
    std::istringstream stream(content);
    std::string line;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw SandboxError(ErrorCode::CONFIG_INVALID,
                               "Expected 'key = value' at line " + std::to_string(line_number));
        }

        std::string key = trim(line.substr(0, eq_pos));
        if (key.empty()) {
            throw SandboxError(ErrorCode::CONFIG_INVALID,
                               "Empty key at line " + std::to_string(line_number));
        }

        config_data_[key] = parseScalar(trim(line.substr(eq_pos + 1)));
    }
}

ConfigValue ConfigManager::parseScalar(const std::string& text)
{
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }

    // Quoted values are always strings
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }

    if (!text.empty()) {
        char* end = nullptr;
        errno = 0;
        long as_long = std::strtol(text.c_str(), &end, 10);
        if (*end == '\0' && errno == 0 && as_long >= std::numeric_limits<int>::min()
            && as_long <= std::numeric_limits<int>::max()) {
            return static_cast<int>(as_long);
        }

        if (text.find('.') != std::string::npos) {
            errno = 0;
            double as_double = std::strtod(text.c_str(), &end);
            if (*end == '\0' && errno == 0) {
                return as_double;
            }
        }
    }

    return text;
}

} // namespace hyper_cri
