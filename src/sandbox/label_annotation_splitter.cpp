#include <hyper-cri/core/error.hpp>
#include <hyper-cri/sandbox/label_annotation_splitter.hpp>
#include <cstring>

namespace hyper_cri {

bool LabelAnnotationSplitter::isAnnotationKey(const std::string& key)
{
    return key.compare(0, std::strlen(kAnnotationPrefix), kAnnotationPrefix) == 0;
}

LabelsAndAnnotations LabelAnnotationSplitter::split(const StringMap& engine_labels)
{
    const size_t prefix_length = std::strlen(kAnnotationPrefix);

    LabelsAndAnnotations result;
    for (const auto& [key, value] : engine_labels) {
        if (isAnnotationKey(key)) {
            result.annotations.emplace(key.substr(prefix_length), value);
        }
        else {
            result.labels.emplace(key, value);
        }
    }
    return result;
}

StringMap LabelAnnotationSplitter::merge(const StringMap& labels, const StringMap& annotations)
{
    StringMap merged;
    for (const auto& [key, value] : labels) {
        if (isAnnotationKey(key)) {
            throw SpecBuildError("label key '" + key + "' uses the reserved prefix '"
                                 + kAnnotationPrefix + "'");
        }
        merged.emplace(key, value);
    }
    for (const auto& [key, value] : annotations) {
        merged.emplace(std::string(kAnnotationPrefix) + key, value);
    }
    return merged;
}

} // namespace hyper_cri
