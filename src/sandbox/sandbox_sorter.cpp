#include <algorithm>
#include <hyper-cri/sandbox/sandbox_sorter.hpp>

namespace hyper_cri {

void sortByCreatedAt(std::vector<SandboxSummary>& summaries)
{
    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const SandboxSummary& lhs, const SandboxSummary& rhs) {
                         return lhs.created_at > rhs.created_at;
                     });
}

} // namespace hyper_cri
