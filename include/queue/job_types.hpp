#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sqlsandbox {

enum class JobStatus {
    QUEUED,
    PROCESSING,
    COMPLETED,
    FAILED
};

[[nodiscard]] inline constexpr const char* job_status_to_string(JobStatus s) {
    switch (s) {
        case JobStatus::QUEUED:     return "queued";
        case JobStatus::PROCESSING: return "processing";
        case JobStatus::COMPLETED:  return "completed";
        case JobStatus::FAILED:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] std::optional<JobStatus> job_status_from_string(std::string_view s);

[[nodiscard]] inline constexpr bool is_terminal(JobStatus s) {
    return s == JobStatus::COMPLETED || s == JobStatus::FAILED;
}

[[nodiscard]] std::optional<ErrorCategory> error_category_from_string(std::string_view s);

/**
 * @brief A queued submission
 *
 * The serialized form doubles as the queue entry, so the processing-set
 * removal matches exactly the bytes that were claimed.
 */
struct Job {
    std::string job_id;
    std::string owner_id;
    std::string problem_id;
    std::string sql;
    int64_t created_at_ms = 0;

    [[nodiscard]] std::string to_entry() const;
    [[nodiscard]] static std::optional<Job> from_entry(std::string_view entry);
};

/**
 * @brief Per-job metadata kept beside the queue for status and ownership
 */
struct JobMeta {
    std::string owner_id;
    std::string problem_id;
    JobStatus status = JobStatus::QUEUED;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
};

/**
 * @brief Terminal outcome of a job; expires after the result TTL
 */
struct JobResult {
    bool success = false;
    nlohmann::json payload;             // Grade report on success
    std::string error;
    ErrorCategory error_category = ErrorCategory::NONE;
    int64_t completed_at_ms = 0;

    [[nodiscard]] std::string to_json() const;
    [[nodiscard]] static std::optional<JobResult> from_json(std::string_view text);
};

struct ClaimedJob {
    Job job;
    std::string entry;                  // Exact bytes in the processing set
};

struct JobStatusView {
    std::string job_id;
    JobStatus status = JobStatus::QUEUED;
    std::optional<JobResult> result;    // Absent while running or after TTL expiry
};

struct RecoveryReport {
    bool lock_acquired = false;
    size_t scanned = 0;
    size_t requeued = 0;
    size_t removed_completed = 0;
    size_t dropped_malformed = 0;
};

} // namespace sqlsandbox
