#pragma once

#include <map>
#include <string>

namespace hyper_cri {

using StringMap = std::map<std::string, std::string>;

struct LabelsAndAnnotations {
    StringMap labels;
    StringMap annotations;
};

/**
 * @brief Stores sandbox annotations inside the engine's single label map
 *
 * The engine keeps one key/value map per pod. Annotations are written into it
 * under the reserved `annotation.` key prefix and recovered by stripping that
 * prefix again; every other key is a label.
 */
class LabelAnnotationSplitter {
public:
    static constexpr const char* kAnnotationPrefix = "annotation.";

    static LabelsAndAnnotations split(const StringMap& engine_labels);

    /**
     * @throws SpecBuildError if a label key already carries the annotation
     *         prefix, since it would come back as an annotation
     */
    static StringMap merge(const StringMap& labels, const StringMap& annotations);

    static bool isAnnotationKey(const std::string& key);
};

} // namespace hyper_cri
