#pragma once

#include <hyper-cri/sandbox/sandbox_types.hpp>
#include <vector>

namespace hyper_cri {

// Newest first. Stable: equal timestamps keep their input order.
void sortByCreatedAt(std::vector<SandboxSummary>& summaries);

} // namespace hyper_cri
