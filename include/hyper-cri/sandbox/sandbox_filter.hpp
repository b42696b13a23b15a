#pragma once

#include <hyper-cri/engine/engine_client.hpp>
#include <hyper-cri/sandbox/label_annotation_splitter.hpp>
#include <hyper-cri/sandbox/sandbox_types.hpp>

namespace hyper_cri {

// True when every selector pair is present with an equal value in labels
bool labelsMatchSelector(const StringMap& labels, const StringMap& selector);

/**
 * @brief Evaluate a listing filter against one engine record
 *
 * Set clauses are AND-ed: engine id equality, readiness computed from the
 * record phase, and label selector subset over the record's labels with
 * annotations split off. Unset clauses match everything.
 */
bool matchesFilter(const EngineRecord& record, const SandboxFilter& filter);

} // namespace hyper_cri
