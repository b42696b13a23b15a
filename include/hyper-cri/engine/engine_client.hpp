#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hyper_cri {

// Resources requested from the engine for a pod
struct PodResource {
    int vcpu = 1;
    int memory_mb = 64;
};

struct PodPortMapping {
    std::string protocol; // lower-case, as the engine expects
    int container_port = 0;
    int host_port = 0;
    std::string host_ip;
};

// Engine-facing pod specification
struct PodSpec {
    std::string id; // encoded sandbox name, used by the engine as pod name
    std::string hostname;
    std::map<std::string, std::string> labels; // labels merged with prefixed annotations
    PodResource resource;
    std::vector<PodPortMapping> port_mappings;
    std::vector<std::string> dns;
    std::vector<std::string> dns_search;
    std::vector<std::string> dns_options;
};

// Engine view of a pod. Owned by the engine, read-only here.
struct EngineRecord {
    std::string engine_id;
    std::string encoded_name;
    std::string phase;
    std::map<std::string, std::string> labels;
    int64_t created_at_seconds = 0;
    std::vector<std::string> ip_addresses;
};

struct EngineVersion {
    std::string version;
    std::string api_version;
};

struct StopPodResult {
    int code = 0;
    std::string cause;
};

/**
 * Client for the container engine daemon.
 *
 * Implementations own connection handling and per-call timeouts. Every method
 * reports failure by throwing EngineError (ENGINE_TIMEOUT for an expired
 * deadline), with the engine's code and cause attached when it supplied them.
 * A single instance is shared by concurrent callers and must tolerate that.
 */
class EngineClient {
public:
    virtual ~EngineClient() = default;

    virtual EngineVersion getVersion() = 0;
    virtual std::string createPod(const PodSpec& spec) = 0;
    virtual void startPod(const std::string& pod_id) = 0;
    virtual StopPodResult stopPod(const std::string& pod_id) = 0;
    virtual void removePod(const std::string& pod_id) = 0;
    virtual EngineRecord getPodInfo(const std::string& pod_id) = 0;
    virtual std::vector<EngineRecord> getPodList() = 0;
};

} // namespace hyper_cri
