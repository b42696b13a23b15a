#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hyper_cri {

// Agent-facing readiness of a sandbox
enum class SandboxState {
    READY,
    NOT_READY
};

std::string sandboxStateToString(SandboxState state);

// Identity of one sandbox instance across restarts
struct SandboxMetadata {
    std::string name;       // pod name
    std::string namespace_; // pod namespace
    std::string uid;        // pod UID
    uint32_t attempt = 0;   // recreation counter for the same name/namespace/uid

    bool operator==(const SandboxMetadata& other) const
    {
        return name == other.name && namespace_ == other.namespace_ && uid == other.uid
               && attempt == other.attempt;
    }
    bool operator!=(const SandboxMetadata& other) const
    {
        return !(*this == other);
    }
};

// Port mapping requested for the sandbox
struct PortMapping {
    std::string protocol = "TCP"; // "TCP" or "UDP", case-insensitive
    int container_port = 0;       // 0-65535
    int host_port = 0;            // 0-65535, 0 = unset
    std::string host_ip;          // optional
};

// DNS configuration requested for the sandbox
struct DnsConfig {
    std::vector<std::string> servers;
    std::vector<std::string> searches;
    std::vector<std::string> options;
};

// Agent request to create a sandbox
struct SandboxConfig {
    SandboxMetadata metadata;
    std::string hostname;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
    std::vector<PortMapping> port_mappings;
    std::optional<DnsConfig> dns_config;

    // Returns one message per problem; empty when the config is usable
    std::vector<std::string> validate() const;
    bool isValid() const;
};

// Translated view of one sandbox, built fresh on every status query
struct SandboxStatus {
    std::string id;                                 // engine pod id
    SandboxMetadata metadata;
    SandboxState state = SandboxState::NOT_READY;
    std::optional<std::string> ip;                  // first pod address, unset if none
    int64_t created_at = 0;                         // nanoseconds since epoch
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> annotations;
};

// List entry form of SandboxStatus
struct SandboxSummary {
    std::string id;
    SandboxMetadata metadata;
    SandboxState state = SandboxState::NOT_READY;
    int64_t created_at = 0; // nanoseconds since epoch
    std::map<std::string, std::string> labels;
};

// Listing predicate; an unset clause matches everything
struct SandboxFilter {
    std::optional<std::string> id;
    std::optional<SandboxState> state;
    std::optional<std::map<std::string, std::string>> label_selector;
};

} // namespace hyper_cri
