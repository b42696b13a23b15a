#include <algorithm>
#include <cctype>
#include <hyper-cri/sandbox/sandbox_types.hpp>

namespace hyper_cri {

namespace {

constexpr int kMaxPort = 65535;

bool isValidPort(int port)
{
    return port >= 0 && port <= kMaxPort;
}

} // namespace

std::string sandboxStateToString(SandboxState state)
{
    switch (state) {
        case SandboxState::READY:
            return "SANDBOX_READY";
        case SandboxState::NOT_READY:
            return "SANDBOX_NOTREADY";
        default:
            return "unknown";
    }
}

std::vector<std::string> SandboxConfig::validate() const
{
    std::vector<std::string> errors;

    if (metadata.name.empty()) {
        errors.push_back("metadata.name is required");
    }
    if (metadata.namespace_.empty()) {
        errors.push_back("metadata.namespace is required");
    }
    if (metadata.uid.empty()) {
        errors.push_back("metadata.uid is required");
    }

    for (const auto& mapping : port_mappings) {
        std::string protocol = mapping.protocol;
        std::transform(protocol.begin(), protocol.end(), protocol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (protocol != "TCP" && protocol != "UDP") {
            errors.push_back("unsupported port mapping protocol: " + mapping.protocol);
        }
        if (!isValidPort(mapping.container_port)) {
            errors.push_back("container port out of range: " + std::to_string(mapping.container_port));
        }
        if (!isValidPort(mapping.host_port)) {
            errors.push_back("host port out of range: " + std::to_string(mapping.host_port));
        }
    }

    return errors;
}

bool SandboxConfig::isValid() const
{
    return validate().empty();
}

} // namespace hyper_cri
