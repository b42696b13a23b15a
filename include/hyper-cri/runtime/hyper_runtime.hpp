#pragma once

#include <hyper-cri/core/config.hpp>
#include <hyper-cri/engine/engine_client.hpp>
#include <hyper-cri/runtime/runtime_options.hpp>
#include <hyper-cri/sandbox/sandbox_lifecycle_manager.hpp>
#include <hyper-cri/sandbox/sandbox_types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hyper_cri {

class Logger;

constexpr const char* kRuntimeName = "hyper";
constexpr const char* kMinimumEngineVersion = "0.6.0";

// Runtime condition types
constexpr const char* kRuntimeReady = "RuntimeReady";
constexpr const char* kNetworkReady = "NetworkReady";

// Operations a runtime can offer to the agent
enum class RuntimeOperation {
    VERSION,
    STATUS,
    UPDATE_RUNTIME_CONFIG,
    RUN_POD_SANDBOX,
    STOP_POD_SANDBOX,
    REMOVE_POD_SANDBOX,
    POD_SANDBOX_STATUS,
    LIST_POD_SANDBOX,
    EXEC_SYNC,
    EXEC,
    ATTACH,
    PORT_FORWARD
};

std::string runtimeOperationToString(RuntimeOperation operation);

struct VersionInfo {
    std::string runtime_name;
    std::string runtime_version;
    std::string runtime_api_version;
};

struct RuntimeCondition {
    std::string type;
    bool status = false;
    std::string reason;
    std::string message;
};

struct RuntimeStatus {
    std::vector<RuntimeCondition> conditions;

    // nullptr if no condition of that type is present
    const RuntimeCondition* getCondition(const std::string& type) const;
};

struct RuntimeConfig {
    std::string pod_cidr;
};

/**
 * @brief Agent-facing runtime backed by the hyper container engine
 *
 * Sandbox operations go to SandboxLifecycleManager. The streaming operations
 * are not provided: they are missing from capabilities() and throw
 * NotSupportedError when called.
 */
class HyperRuntime {
public:
    HyperRuntime(std::shared_ptr<EngineClient> client, Logger* logger, RuntimeOptions options = RuntimeOptions{});

    HyperRuntime(const HyperRuntime&) = delete;
    HyperRuntime& operator=(const HyperRuntime&) = delete;

    VersionInfo version() const;

    // Never throws for engine failures; they are reported as conditions
    RuntimeStatus status() const;

    void updateRuntimeConfig(const RuntimeConfig& config);
    std::string getPodCidr() const;

    const std::set<RuntimeOperation>& capabilities() const;
    bool supports(RuntimeOperation operation) const;

    // Pod sandbox operations
    std::string runPodSandbox(const SandboxConfig& config);
    void stopPodSandbox(const std::string& sandbox_id);
    void removePodSandbox(const std::string& sandbox_id);
    SandboxStatus podSandboxStatus(const std::string& sandbox_id) const;
    std::vector<SandboxSummary> listPodSandbox(const std::optional<SandboxFilter>& filter = std::nullopt) const;

    // Streaming operations, always NotSupportedError
    void execSync(const std::string& container_id, const std::vector<std::string>& cmd);
    void exec(const std::string& container_id, const std::vector<std::string>& cmd, bool tty);
    void attach(const std::string& container_id);
    void portForward(const std::string& sandbox_id, const std::vector<int>& ports);

    const RuntimeOptions& getOptions() const;

private:
    std::shared_ptr<EngineClient> client_;
    Logger* logger_;
    RuntimeOptions options_;
    SandboxLifecycleManager sandboxes_;
    std::set<RuntimeOperation> capabilities_;

    mutable std::mutex config_mutex_;
    RuntimeConfig runtime_config_;
};

class HyperRuntimeFactory {
public:
    // Reads RuntimeOptions from config and configures the named logger with them
    static std::unique_ptr<HyperRuntime> createRuntime(std::shared_ptr<EngineClient> client,
                                                       const ConfigManager& config,
                                                       const std::string& logger_name = "hyper-cri");
};

namespace runtime_utils {
// Compares dotted numeric versions ("0.6.0"); trailing text in a component
// such as "1-rc" is ignored. Returns <0, 0 or >0. nullopt if either version
// has no leading number at all.
std::optional<int> compareVersions(const std::string& lhs, const std::string& rhs);
} // namespace runtime_utils

} // namespace hyper_cri
