#include <hyper-cri/sandbox/status_mapper.hpp>
#include <cctype>

namespace hyper_cri {

namespace {

constexpr const char* kRunningPhase = "running";

bool equalsIgnoreCase(const std::string& lhs, const char* rhs) noexcept
{
    size_t i = 0;
    for (; i < lhs.size() && rhs[i] != '\0'; ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != rhs[i]) {
            return false;
        }
    }
    return i == lhs.size() && rhs[i] == '\0';
}

} // namespace

SandboxState StatusMapper::mapPhase(const std::string& phase) noexcept
{
    if (equalsIgnoreCase(phase, kRunningPhase)) {
        return SandboxState::READY;
    }
    return SandboxState::NOT_READY;
}

const std::vector<std::string>& StatusMapper::knownPhases()
{
    static const std::vector<std::string> phases = {
        "pending", "running", "failed", "succeeded", "stopped", "paused", "unknown"};
    return phases;
}

} // namespace hyper_cri
