#pragma once

#include <exception>
#include <optional>
#include <string>
#include <system_error>

namespace hyper_cri {

/**
 * @brief Error codes for sandbox runtime operations
 */
enum class ErrorCode {
    // Sandbox translation errors
    SANDBOX_SPEC_INVALID = 1000,
    SANDBOX_NAME_INVALID = 1001,

    // Engine errors
    ENGINE_REQUEST_FAILED = 2000,
    ENGINE_TIMEOUT = 2001,
    ENGINE_UNAVAILABLE = 2002,

    // Runtime errors
    OPERATION_NOT_SUPPORTED = 3000,

    // Configuration errors
    CONFIG_INVALID = 9000,
    CONFIG_MISSING = 9001,
    INVALID_TYPE = 9002,
    FILE_NOT_FOUND = 9003,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Error category shared by every hyper-cri error code
 */
class SandboxErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "hyper-cri";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::SANDBOX_SPEC_INVALID:
                return "Invalid sandbox config";
            case ErrorCode::SANDBOX_NAME_INVALID:
                return "Invalid sandbox name format";

            case ErrorCode::ENGINE_REQUEST_FAILED:
                return "Engine request failed";
            case ErrorCode::ENGINE_TIMEOUT:
                return "Engine request timed out";
            case ErrorCode::ENGINE_UNAVAILABLE:
                return "Engine unavailable";

            case ErrorCode::OPERATION_NOT_SUPPORTED:
                return "Not implemented";

            case ErrorCode::CONFIG_INVALID:
                return "Invalid configuration";
            case ErrorCode::CONFIG_MISSING:
                return "Missing configuration: Configuration key not found";
            case ErrorCode::INVALID_TYPE:
                return "Invalid type for configuration value";
            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";

            case ErrorCode::UNKNOWN_ERROR:
            default:
                return "Unknown error";
        }
    }
};

/**
 * @brief Get the sandbox error category instance
 */
const SandboxErrorCategory& getSandboxErrorCategory();

/**
 * @brief Base exception for every failure raised by this library
 *
 * Carries an error code and a detail message. The lifecycle layer may attach
 * the operation name and target sandbox id to an exception it is about to
 * rethrow, so the caller can attribute the failure without a new exception
 * type replacing the original one.
 */
class SandboxError : public std::exception {
public:
    /**
     * @brief Construct a sandbox error
     * @param code The error code
     * @param message The error message
     */
    SandboxError(ErrorCode code, std::string message);

    SandboxError(const SandboxError& other) noexcept;
    SandboxError(SandboxError&& other) noexcept;
    SandboxError& operator=(const SandboxError& other) noexcept;
    SandboxError& operator=(SandboxError&& other) noexcept;
    ~SandboxError() noexcept override = default;

    const char* what() const noexcept override;

    ErrorCode getErrorCode() const noexcept;

    /**
     * @brief Get the error code as std::error_code
     */
    std::error_code code() const noexcept;

    const std::string& getMessage() const noexcept;

    /**
     * @brief Attach the failing operation and its target sandbox id
     */
    void setContext(const std::string& operation, const std::string& sandbox_id);

    const std::string& getOperation() const noexcept;
    const std::string& getSandboxId() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    std::string operation_;
    std::string sandbox_id_;
    mutable std::string full_message_; // Cache for what() result
};

/**
 * @brief The sandbox config cannot be translated into an engine pod spec
 */
class SpecBuildError : public SandboxError {
public:
    explicit SpecBuildError(const std::string& message)
        : SandboxError(ErrorCode::SANDBOX_SPEC_INVALID, message)
    {}
};

/**
 * @brief An engine pod name does not decode back into sandbox metadata
 */
class NameDecodeError : public SandboxError {
public:
    NameDecodeError(const std::string& name, const std::string& reason)
        : SandboxError(ErrorCode::SANDBOX_NAME_INVALID, "'" + name + "': " + reason), name_(name)
    {}

    const std::string& getName() const noexcept
    {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief The engine client could not complete a request
 *
 * When the engine reports a diagnostic code and cause they travel with the
 * exception and are appended to the message.
 */
class EngineError : public SandboxError {
public:
    explicit EngineError(const std::string& message,
                         ErrorCode code = ErrorCode::ENGINE_REQUEST_FAILED);
    EngineError(const std::string& message, int engine_code, const std::string& cause,
                ErrorCode code = ErrorCode::ENGINE_REQUEST_FAILED);

    std::optional<int> getEngineCode() const noexcept
    {
        return engine_code_;
    }

    const std::string& getCause() const noexcept
    {
        return cause_;
    }

private:
    std::optional<int> engine_code_;
    std::string cause_;
};

/**
 * @brief The operation is deliberately not provided by this runtime
 */
class NotSupportedError : public SandboxError {
public:
    explicit NotSupportedError(const std::string& operation)
        : SandboxError(ErrorCode::OPERATION_NOT_SUPPORTED, operation)
    {}
};

} // namespace hyper_cri
