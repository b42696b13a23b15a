#include <algorithm>
#include <cctype>
#include <hyper-cri/runtime/runtime_options.hpp>

namespace hyper_cri {

namespace {

int requirePositive(const ConfigManager& config, const char* key)
{
    int value = config.get<int>(key);
    if (value <= 0) {
        throw SandboxError(ErrorCode::CONFIG_INVALID,
                           std::string(key) + " must be positive, got " + std::to_string(value));
    }
    return value;
}

LogLevel requireLogLevel(const ConfigManager& config)
{
    const std::string name = config.get<std::string>(kLogLevelKey);
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper != "INFO" && fromString(upper) == LogLevel::INFO) {
        throw SandboxError(ErrorCode::CONFIG_INVALID,
                           std::string(kLogLevelKey) + " has unknown level '" + name + "'");
    }
    return fromString(upper);
}

} // namespace

ConfigManager RuntimeOptions::defaults()
{
    RuntimeOptions builtin;

    ConfigManager config;
    config.set(kEngineEndpointKey, builtin.engine_endpoint);
    config.set(kEngineTimeoutKey, static_cast<int>(builtin.connection_timeout.count()));
    config.set(kDefaultCpuKey, builtin.default_resource.vcpu);
    config.set(kDefaultMemoryKey, builtin.default_resource.memory_mb);
    config.set(kLogLevelKey, toString(builtin.log_level));
    return config;
}

RuntimeOptions RuntimeOptions::fromConfig(const ConfigManager& config)
{
    ConfigManager layered;
    layered.addLayer("defaults", defaults());
    layered.addLayer("runtime", config.expandEnvironmentVariables());

    RuntimeOptions options;
    options.engine_endpoint = layered.get<std::string>(kEngineEndpointKey);
    if (options.engine_endpoint.empty()) {
        throw SandboxError(ErrorCode::CONFIG_INVALID, std::string(kEngineEndpointKey) + " must not be empty");
    }
    options.connection_timeout = std::chrono::seconds(requirePositive(layered, kEngineTimeoutKey));
    options.default_resource.vcpu = requirePositive(layered, kDefaultCpuKey);
    options.default_resource.memory_mb = requirePositive(layered, kDefaultMemoryKey);
    options.log_level = requireLogLevel(layered);
    options.log_file = layered.get<std::string>(kLogFileKey, "");
    options.log_pattern = layered.get<std::string>(kLogPatternKey, "");
    return options;
}

void RuntimeOptions::applyTo(Logger& logger) const
{
    logger.setLevel(log_level);
    if (!log_pattern.empty()) {
        logger.setPattern(log_pattern);
    }
    if (!log_file.empty()) {
        logger.addFileSink(log_file, log_level);
    }
}

} // namespace hyper_cri
