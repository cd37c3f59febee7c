#pragma once

#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief Error categories for sandbox execution and grading
 */
enum class ErrorCategory {
    NONE,
    SECURITY_REJECTED,          // Query never executes
    DATASET_LOAD_ERROR,         // Per-table detail lives in LoadReport
    EXECUTION_TIMEOUT,          // Sandbox connection was rebuilt
    RESOURCE_LIMIT_EXCEEDED,    // Memory ceiling or row cap
    ENGINE_ERROR,               // Engine rejected a syntactically valid query
    VALIDATION_ERROR,           // Internal comparison failure, not a wrong answer
    QUEUE_UNAVAILABLE,
    NOT_FOUND,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                    return "none";
        case ErrorCategory::SECURITY_REJECTED:       return "security_rejected";
        case ErrorCategory::DATASET_LOAD_ERROR:      return "dataset_load_error";
        case ErrorCategory::EXECUTION_TIMEOUT:       return "execution_timeout";
        case ErrorCategory::RESOURCE_LIMIT_EXCEEDED: return "resource_limit_exceeded";
        case ErrorCategory::ENGINE_ERROR:            return "engine_error";
        case ErrorCategory::VALIDATION_ERROR:        return "validation_error";
        case ErrorCategory::QUEUE_UNAVAILABLE:       return "queue_unavailable";
        case ErrorCategory::NOT_FOUND:               return "not_found";
        case ErrorCategory::INVALID_REQUEST:         return "invalid_request";
        case ErrorCategory::INTERNAL_ERROR:          return "internal_error";
    }
    return "unknown";
}

// Only engine errors may succeed on a second attempt; everything else is
// terminal for the submission.
[[nodiscard]] inline constexpr bool is_retryable(ErrorCategory c) {
    return c == ErrorCategory::ENGINE_ERROR;
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
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Marker for operations that only report success or failure
 */
struct Unit {};

} // namespace sqlsandbox
