#pragma once

#include <cstdint>
#include <hyper-cri/engine/engine_client.hpp>
#include <hyper-cri/sandbox/sandbox_types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hyper_cri {

class Logger;

// Engine timestamps are whole seconds; sandbox timestamps are nanoseconds
constexpr int64_t kSecondToNano = 1000000000;

// @throws EngineError if seconds * kSecondToNano does not fit in int64_t
int64_t toNanos(int64_t seconds);

/**
 * @brief Runs sandbox lifecycle operations against the container engine
 *
 * Holds no sandbox state: every call reads what it needs from the engine and
 * translates it on the way back. The engine client and logger are fixed at
 * construction and shared by concurrent callers; nothing here takes a lock.
 *
 * Failures are thrown. Engine errors are rethrown as the same exception object
 * with the operation name and sandbox id attached; nothing is retried.
 */
class SandboxLifecycleManager {
public:
    SandboxLifecycleManager(std::shared_ptr<EngineClient> client,
                            Logger* logger,
                            PodResource default_resource = PodResource{});

    SandboxLifecycleManager(const SandboxLifecycleManager&) = delete;
    SandboxLifecycleManager& operator=(const SandboxLifecycleManager&) = delete;

    /**
     * @brief Create and start a pod for the sandbox
     * @return engine pod id
     *
     * If the pod is created but fails to start, it is removed once on a best
     * effort basis. A failed removal is logged as a warning and the start
     * failure is what the caller receives.
     */
    std::string runSandbox(const SandboxConfig& config);

    void stopSandbox(const std::string& sandbox_id);

    // Removal of an already absent pod is reported however the engine reports it
    void deleteSandbox(const std::string& sandbox_id);

    SandboxStatus getSandboxStatus(const std::string& sandbox_id) const;

    /**
     * @brief List sandboxes, newest first
     * @throws NameDecodeError if any engine pod name fails to decode, even one
     *         the filter would have excluded; no partial list is returned
     */
    std::vector<SandboxSummary> listSandboxes(const std::optional<SandboxFilter>& filter = std::nullopt) const;

    // @throws SpecBuildError
    PodSpec buildPodSpec(const SandboxConfig& config) const;

private:
    void removeAfterFailedStart(const std::string& pod_id);
    SandboxMetadata decodeName(const EngineRecord& record, const char* operation) const;
    int64_t createdAtNanos(const EngineRecord& record, const char* operation) const;

    std::shared_ptr<EngineClient> client_;
    Logger* logger_;
    PodResource default_resource_;
};

} // namespace hyper_cri
