#pragma once

#include <hyper-cri/sandbox/sandbox_types.hpp>
#include <string>

namespace hyper_cri {

/**
 * @brief Encodes sandbox identity into the engine pod name and back
 *
 * Wire format: `k8s_<name>_<namespace>_<uid>_<attempt>`. The pod name is the
 * only place sandbox identity is persisted, so the encoding must be lossless.
 * String fields are percent-escaped before joining: `%` becomes `%25` and `_`
 * becomes `%5F`. No other escape sequence is ever produced, and decode()
 * rejects any other sequence.
 */
class SandboxNameCodec {
public:
    static constexpr const char* kPrefix = "k8s";
    static constexpr char kDelimiter = '_';

    static std::string encode(const SandboxMetadata& metadata);

    /**
     * @throws NameDecodeError when the name has the wrong field count, the
     *         wrong prefix, a malformed escape, or an attempt that is not a
     *         decimal uint32
     */
    static SandboxMetadata decode(const std::string& encoded_name);

    static std::string escapeField(const std::string& field);
    static std::string unescapeField(const std::string& encoded_name, const std::string& field);
};

} // namespace hyper_cri
