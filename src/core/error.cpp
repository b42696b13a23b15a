#include <hyper-cri/core/error.hpp>
#include <sstream>

namespace hyper_cri {

const SandboxErrorCategory& getSandboxErrorCategory() {
    static SandboxErrorCategory category;
    return category;
}

SandboxError::SandboxError(ErrorCode code, std::string message)
    : error_code_(code), message_(std::move(message)) {
}

SandboxError::SandboxError(const SandboxError& other) noexcept
    : error_code_(other.error_code_), message_(other.message_), operation_(other.operation_),
      sandbox_id_(other.sandbox_id_), full_message_(other.full_message_) {
}

SandboxError::SandboxError(SandboxError&& other) noexcept
    : error_code_(other.error_code_), message_(std::move(other.message_)),
      operation_(std::move(other.operation_)), sandbox_id_(std::move(other.sandbox_id_)),
      full_message_(std::move(other.full_message_)) {
    other.error_code_ = ErrorCode::UNKNOWN_ERROR;
}

SandboxError& SandboxError::operator=(const SandboxError& other) noexcept {
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = other.message_;
        operation_ = other.operation_;
        sandbox_id_ = other.sandbox_id_;
        full_message_ = other.full_message_;
    }
    return *this;
}

SandboxError& SandboxError::operator=(SandboxError&& other) noexcept {
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = std::move(other.message_);
        operation_ = std::move(other.operation_);
        sandbox_id_ = std::move(other.sandbox_id_);
        full_message_ = std::move(other.full_message_);

        other.error_code_ = ErrorCode::UNKNOWN_ERROR;
    }
    return *this;
}

const char* SandboxError::what() const noexcept {
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << "[" << getSandboxErrorCategory().name() << " " << static_cast<int>(error_code_) << "] "
            << getSandboxErrorCategory().message(static_cast<int>(error_code_));

        if (!message_.empty()) {
            oss << ": " << message_;
        }
        if (!operation_.empty()) {
            oss << " (operation " << operation_;
            if (!sandbox_id_.empty()) {
                oss << ", sandbox " << sandbox_id_;
            }
            oss << ")";
        }

        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

ErrorCode SandboxError::getErrorCode() const noexcept {
    return error_code_;
}

std::error_code SandboxError::code() const noexcept {
    return std::error_code(static_cast<int>(error_code_), getSandboxErrorCategory());
}

const std::string& SandboxError::getMessage() const noexcept {
    return message_;
}

void SandboxError::setContext(const std::string& operation, const std::string& sandbox_id) {
    operation_ = operation;
    sandbox_id_ = sandbox_id;
    full_message_.clear();
}

const std::string& SandboxError::getOperation() const noexcept {
    return operation_;
}

const std::string& SandboxError::getSandboxId() const noexcept {
    return sandbox_id_;
}

EngineError::EngineError(const std::string& message, ErrorCode code)
    : SandboxError(code, message) {
}

EngineError::EngineError(const std::string& message, int engine_code, const std::string& cause,
                         ErrorCode code)
    : SandboxError(code, message + " (engine code " + std::to_string(engine_code) + ", cause: " + cause + ")"),
      engine_code_(engine_code), cause_(cause) {
}

} // namespace hyper_cri
