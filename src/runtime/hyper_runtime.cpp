#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <hyper-cri/core/error.hpp>
#include <hyper-cri/core/logger.hpp>
#include <hyper-cri/runtime/hyper_runtime.hpp>
#include <sstream>

namespace hyper_cri {

namespace {

constexpr const char* kDaemonNotReadyReason = "HyperDaemonNotReady";
constexpr const char* kDaemonTooOldReason = "HyperDaemonVersionTooOld";

std::optional<std::vector<long>> parseVersion(const std::string& version)
{
    std::vector<long> parts;
    std::istringstream stream(version);
    std::string component;
    while (std::getline(stream, component, '.')) {
        if (component.empty() || !std::isdigit(static_cast<unsigned char>(component[0]))) {
            return std::nullopt;
        }
        parts.push_back(std::strtol(component.c_str(), nullptr, 10));
    }
    if (parts.empty()) {
        return std::nullopt;
    }
    return parts;
}

} // namespace

std::string runtimeOperationToString(RuntimeOperation operation)
{
    switch (operation) {
        case RuntimeOperation::VERSION:
            return "Version";
        case RuntimeOperation::STATUS:
            return "Status";
        case RuntimeOperation::UPDATE_RUNTIME_CONFIG:
            return "UpdateRuntimeConfig";
        case RuntimeOperation::RUN_POD_SANDBOX:
            return "RunPodSandbox";
        case RuntimeOperation::STOP_POD_SANDBOX:
            return "StopPodSandbox";
        case RuntimeOperation::REMOVE_POD_SANDBOX:
            return "RemovePodSandbox";
        case RuntimeOperation::POD_SANDBOX_STATUS:
            return "PodSandboxStatus";
        case RuntimeOperation::LIST_POD_SANDBOX:
            return "ListPodSandbox";
        case RuntimeOperation::EXEC_SYNC:
            return "ExecSync";
        case RuntimeOperation::EXEC:
            return "Exec";
        case RuntimeOperation::ATTACH:
            return "Attach";
        case RuntimeOperation::PORT_FORWARD:
            return "PortForward";
        default:
            return "Unknown";
    }
}

const RuntimeCondition* RuntimeStatus::getCondition(const std::string& type) const
{
    for (const auto& condition : conditions) {
        if (condition.type == type) {
            return &condition;
        }
    }
    return nullptr;
}

HyperRuntime::HyperRuntime(std::shared_ptr<EngineClient> client, Logger* logger, RuntimeOptions options)
    : client_(client), logger_(logger), options_(std::move(options)),
      sandboxes_(std::move(client), logger, options_.default_resource),
      capabilities_{RuntimeOperation::VERSION,
                    RuntimeOperation::STATUS,
                    RuntimeOperation::UPDATE_RUNTIME_CONFIG,
                    RuntimeOperation::RUN_POD_SANDBOX,
                    RuntimeOperation::STOP_POD_SANDBOX,
                    RuntimeOperation::REMOVE_POD_SANDBOX,
                    RuntimeOperation::POD_SANDBOX_STATUS,
                    RuntimeOperation::LIST_POD_SANDBOX}
{
    std::string supported;
    for (auto operation : capabilities_) {
        supported += (supported.empty() ? "" : ", ") + runtimeOperationToString(operation);
    }
    logger_->info("Runtime {} using engine at {}, supported operations: {}", kRuntimeName,
                  options_.engine_endpoint, supported);
}

VersionInfo HyperRuntime::version() const
{
    try {
        auto engine_version = client_->getVersion();
        return VersionInfo{kRuntimeName, engine_version.version, engine_version.api_version};
    }
    catch (SandboxError& e) {
        e.setContext(runtimeOperationToString(RuntimeOperation::VERSION), "");
        logger_->error("Get hyper version failed: {}", e.what());
        throw;
    }
}

RuntimeStatus HyperRuntime::status() const
{
    RuntimeCondition runtime_ready{kRuntimeReady, true, "", ""};
    // Network readiness is not probed; the engine sets up pod networking itself
    RuntimeCondition network_ready{kNetworkReady, true, "", ""};

    try {
        auto engine_version = client_->getVersion();
        auto order = runtime_utils::compareVersions(engine_version.version, kMinimumEngineVersion);
        if (order && *order < 0) {
            runtime_ready.status = false;
            runtime_ready.reason = kDaemonTooOldReason;
            runtime_ready.message = "hyper: engine version " + engine_version.version
                                    + " is older than required " + kMinimumEngineVersion;
        }
    }
    catch (const std::exception& e) {
        runtime_ready.status = false;
        runtime_ready.reason = kDaemonNotReadyReason;
        runtime_ready.message = std::string("hyper: failed to get hyper version: ") + e.what();
    }

    if (!runtime_ready.status) {
        logger_->warning("Runtime not ready: {}", runtime_ready.message);
    }

    return RuntimeStatus{{runtime_ready, network_ready}};
}

void HyperRuntime::updateRuntimeConfig(const RuntimeConfig& config)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    runtime_config_ = config;
    logger_->info("Runtime config updated, pod CIDR: {}", config.pod_cidr);
}

std::string HyperRuntime::getPodCidr() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return runtime_config_.pod_cidr;
}

const std::set<RuntimeOperation>& HyperRuntime::capabilities() const
{
    return capabilities_;
}

bool HyperRuntime::supports(RuntimeOperation operation) const
{
    return capabilities_.count(operation) > 0;
}

std::string HyperRuntime::runPodSandbox(const SandboxConfig& config)
{
    return sandboxes_.runSandbox(config);
}

void HyperRuntime::stopPodSandbox(const std::string& sandbox_id)
{
    sandboxes_.stopSandbox(sandbox_id);
}

void HyperRuntime::removePodSandbox(const std::string& sandbox_id)
{
    sandboxes_.deleteSandbox(sandbox_id);
}

SandboxStatus HyperRuntime::podSandboxStatus(const std::string& sandbox_id) const
{
    return sandboxes_.getSandboxStatus(sandbox_id);
}

std::vector<SandboxSummary> HyperRuntime::listPodSandbox(const std::optional<SandboxFilter>& filter) const
{
    return sandboxes_.listSandboxes(filter);
}

void HyperRuntime::execSync(const std::string& container_id, const std::vector<std::string>& /*cmd*/)
{
    throw NotSupportedError(runtimeOperationToString(RuntimeOperation::EXEC_SYNC) + " for container "
                            + container_id);
}

void HyperRuntime::exec(const std::string& container_id, const std::vector<std::string>& /*cmd*/, bool /*tty*/)
{
    throw NotSupportedError(runtimeOperationToString(RuntimeOperation::EXEC) + " for container " + container_id);
}

void HyperRuntime::attach(const std::string& container_id)
{
    throw NotSupportedError(runtimeOperationToString(RuntimeOperation::ATTACH) + " for container "
                            + container_id);
}

void HyperRuntime::portForward(const std::string& sandbox_id, const std::vector<int>& /*ports*/)
{
    throw NotSupportedError(runtimeOperationToString(RuntimeOperation::PORT_FORWARD) + " for sandbox "
                            + sandbox_id);
}

const RuntimeOptions& HyperRuntime::getOptions() const
{
    return options_;
}

std::unique_ptr<HyperRuntime> HyperRuntimeFactory::createRuntime(std::shared_ptr<EngineClient> client,
                                                                 const ConfigManager& config,
                                                                 const std::string& logger_name)
{
    auto options = RuntimeOptions::fromConfig(config);
    Logger* logger = Logger::getInstance(logger_name);
    options.applyTo(*logger);
    return std::make_unique<HyperRuntime>(std::move(client), logger, options);
}

namespace runtime_utils {

std::optional<int> compareVersions(const std::string& lhs, const std::string& rhs)
{
    auto left = parseVersion(lhs);
    auto right = parseVersion(rhs);
    if (!left || !right) {
        return std::nullopt;
    }

    size_t length = std::max(left->size(), right->size());
    for (size_t i = 0; i < length; ++i) {
        long a = i < left->size() ? (*left)[i] : 0;
        long b = i < right->size() ? (*right)[i] : 0;
        if (a != b) {
            return a < b ? -1 : 1;
        }
    }
    return 0;
}

} // namespace runtime_utils

} // namespace hyper_cri
