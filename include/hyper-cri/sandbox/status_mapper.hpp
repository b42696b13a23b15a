#pragma once

#include <hyper-cri/sandbox/sandbox_types.hpp>
#include <string>
#include <vector>

namespace hyper_cri {

// Maps engine pod phases onto sandbox readiness
class StatusMapper {
public:
    // Case-insensitive; only "running" is READY. Unknown phases are NOT_READY.
    static SandboxState mapPhase(const std::string& phase) noexcept;

    // Phases the engine documents for pods
    static const std::vector<std::string>& knownPhases();
};

} // namespace hyper_cri
