#include <algorithm>
#include <hyper-cri/sandbox/sandbox_filter.hpp>
#include <hyper-cri/sandbox/status_mapper.hpp>

namespace hyper_cri {

bool labelsMatchSelector(const StringMap& labels, const StringMap& selector)
{
    return std::all_of(selector.begin(), selector.end(), [&labels](const auto& entry) {
        auto it = labels.find(entry.first);
        return it != labels.end() && it->second == entry.second;
    });
}

bool matchesFilter(const EngineRecord& record, const SandboxFilter& filter)
{
    if (filter.id && record.engine_id != *filter.id) {
        return false;
    }

    if (filter.state && StatusMapper::mapPhase(record.phase) != *filter.state) {
        return false;
    }

    if (filter.label_selector) {
        auto split = LabelAnnotationSplitter::split(record.labels);
        if (!labelsMatchSelector(split.labels, *filter.label_selector)) {
            return false;
        }
    }

    return true;
}

} // namespace hyper_cri
