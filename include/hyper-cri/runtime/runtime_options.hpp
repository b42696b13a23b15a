#pragma once

#include <chrono>
#include <hyper-cri/core/config.hpp>
#include <hyper-cri/core/logger.hpp>
#include <hyper-cri/engine/engine_client.hpp>
#include <string>

namespace hyper_cri {

// Configuration keys
constexpr const char* kEngineEndpointKey = "engine.endpoint";
constexpr const char* kEngineTimeoutKey = "engine.connection_timeout";
constexpr const char* kDefaultCpuKey = "sandbox.default_cpu";
constexpr const char* kDefaultMemoryKey = "sandbox.default_memory_mb";
constexpr const char* kLogLevelKey = "log.level";
constexpr const char* kLogFileKey = "log.file";
constexpr const char* kLogPatternKey = "log.pattern";

// Typed runtime settings
struct RuntimeOptions {
    std::string engine_endpoint = "127.0.0.1:22318";
    std::chrono::seconds connection_timeout{300}; // per engine call
    PodResource default_resource;                 // used when a sandbox asks for none
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                         // empty = console only
    std::string log_pattern;                      // empty = logger default

    // The built-in values as a config layer
    static ConfigManager defaults();

    /**
     * @brief Read options from configuration, falling back to defaults()
     * @throws SandboxError CONFIG_INVALID for non-positive timeout or
     *         resources or an unknown log level, INVALID_TYPE for a value
     *         of the wrong type
     */
    static RuntimeOptions fromConfig(const ConfigManager& config);

    // Apply level, pattern and file sink to a logger
    void applyTo(Logger& logger) const;
};

} // namespace hyper_cri
