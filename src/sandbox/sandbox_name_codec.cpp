#include <hyper-cri/core/error.hpp>
#include <hyper-cri/sandbox/sandbox_name_codec.hpp>
#include <cstdint>
#include <limits>
#include <vector>

namespace hyper_cri {

namespace {

constexpr size_t kFieldCount = 5;

std::vector<std::string> splitFields(const std::string& text, char delimiter)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

uint32_t parseAttempt(const std::string& encoded_name, const std::string& text)
{
    if (text.empty()) {
        throw NameDecodeError(encoded_name, "attempt is empty");
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw NameDecodeError(encoded_name, "attempt '" + text + "' is not a non-negative integer");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            throw NameDecodeError(encoded_name, "attempt '" + text + "' is out of range");
        }
    }
    return static_cast<uint32_t>(value);
}

} // namespace

std::string SandboxNameCodec::escapeField(const std::string& field)
{
    std::string escaped;
    escaped.reserve(field.size());
    for (char c : field) {
        if (c == '%') {
            escaped += "%25";
        }
        else if (c == kDelimiter) {
            escaped += "%5F";
        }
        else {
            escaped += c;
        }
    }
    return escaped;
}

std::string SandboxNameCodec::unescapeField(const std::string& encoded_name, const std::string& field)
{
    std::string plain;
    plain.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '%') {
            plain += field[i];
            continue;
        }

        const std::string sequence = field.substr(i, 3);
        if (sequence == "%25") {
            plain += '%';
        }
        else if (sequence == "%5F") {
            plain += kDelimiter;
        }
        else {
            throw NameDecodeError(encoded_name, "invalid escape sequence '" + sequence + "'");
        }
        i += 2;
    }
    return plain;
}

std::string SandboxNameCodec::encode(const SandboxMetadata& metadata)
{
    std::string encoded = kPrefix;
    encoded += kDelimiter;
    encoded += escapeField(metadata.name);
    encoded += kDelimiter;
    encoded += escapeField(metadata.namespace_);
    encoded += kDelimiter;
    encoded += escapeField(metadata.uid);
    encoded += kDelimiter;
    encoded += std::to_string(metadata.attempt);
    return encoded;
}

SandboxMetadata SandboxNameCodec::decode(const std::string& encoded_name)
{
    auto fields = splitFields(encoded_name, kDelimiter);
    if (fields.size() != kFieldCount) {
        throw NameDecodeError(encoded_name, "expected " + std::to_string(kFieldCount) + " fields, got "
                                                + std::to_string(fields.size()));
    }
    if (fields[0] != kPrefix) {
        throw NameDecodeError(encoded_name, "unexpected prefix '" + fields[0] + "'");
    }

    SandboxMetadata metadata;
    metadata.name = unescapeField(encoded_name, fields[1]);
    metadata.namespace_ = unescapeField(encoded_name, fields[2]);
    metadata.uid = unescapeField(encoded_name, fields[3]);
    metadata.attempt = parseAttempt(encoded_name, fields[4]);
    return metadata;
}

} // namespace hyper_cri
