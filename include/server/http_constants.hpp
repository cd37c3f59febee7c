#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace sqlsandbox::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr const char* kSubmitRoute = "/api/submit";
inline constexpr const char* kJobRoute = R"(/api/jobs/([A-Za-z0-9\-]+))";
inline constexpr const char* kTestRoute = "/api/test";
inline constexpr const char* kHealthRoute = "/health";

/**
 * @brief HTTP status for a failed operation
 *
 * Learner-caused failures (rejected text, engine errors, timeouts) are 422
 * so clients can tell them from service faults.
 */
[[nodiscard]] inline constexpr int status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_REQUEST:         return 400;
        case ErrorCategory::NOT_FOUND:               return 404;
        case ErrorCategory::SECURITY_REJECTED:
        case ErrorCategory::ENGINE_ERROR:
        case ErrorCategory::EXECUTION_TIMEOUT:
        case ErrorCategory::RESOURCE_LIMIT_EXCEEDED: return 422;
        case ErrorCategory::QUEUE_UNAVAILABLE:       return 503;
        case ErrorCategory::DATASET_LOAD_ERROR:
        case ErrorCategory::VALIDATION_ERROR:
        case ErrorCategory::INTERNAL_ERROR:
        case ErrorCategory::NONE:                    return 500;
    }
    return 500;
}

} // namespace sqlsandbox::http
