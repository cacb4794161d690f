#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pgtenant {

/**
 * @brief Error codes surfaced by the routing, lifecycle and migration layers
 */
enum class ErrorCode {
    NONE,
    TENANT_NOT_FOUND,
    DUPLICATE_TENANT,
    INVALID_IDENTIFIER,
    INVALID_TRANSITION,
    SCHEMA_NOT_FOUND,
    NO_ACTIVE_SCHEMA,
    CONFIGURATION_ERROR,
    MIGRATION_CONFLICT,
    SCHEMA_PROVISIONING_ERROR,
    CONNECTION_LEAK_DETECTED,
    POOL_EXHAUSTED,
    DATABASE_ERROR,
    CANCELLED
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                      return "None";
        case ErrorCode::TENANT_NOT_FOUND:          return "TenantNotFound";
        case ErrorCode::DUPLICATE_TENANT:          return "DuplicateTenant";
        case ErrorCode::INVALID_IDENTIFIER:        return "InvalidIdentifier";
        case ErrorCode::INVALID_TRANSITION:        return "InvalidTransition";
        case ErrorCode::SCHEMA_NOT_FOUND:          return "SchemaNotFound";
        case ErrorCode::NO_ACTIVE_SCHEMA:          return "NoActiveSchema";
        case ErrorCode::CONFIGURATION_ERROR:       return "ConfigurationError";
        case ErrorCode::MIGRATION_CONFLICT:        return "MigrationConflict";
        case ErrorCode::SCHEMA_PROVISIONING_ERROR: return "SchemaProvisioningError";
        case ErrorCode::CONNECTION_LEAK_DETECTED:  return "ConnectionLeakDetected";
        case ErrorCode::POOL_EXHAUSTED:            return "PoolExhausted";
        case ErrorCode::DATABASE_ERROR:            return "DatabaseError";
        case ErrorCode::CANCELLED:                 return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Carry another result's error into this result type
     */
    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace pgtenant
