#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief Final outcome of one graded submission
 */
struct SubmissionRecord {
    std::string job_id;
    std::string user_id;
    std::string problem_id;
    std::string sql;
    bool synchronous = false;           // Graded by queue failover
    std::optional<GradeReport> report;  // Set when grading ran to completion
    std::string error;
    ErrorCategory error_category = ErrorCategory::NONE;
    int64_t submitted_at_ms = 0;
    int64_t completed_at_ms = 0;
};

/**
 * @brief Durable submission storage lives outside this service
 */
class ISubmissionSink {
public:
    virtual ~ISubmissionSink() = default;
    [[nodiscard]] virtual Result<Unit> record(const SubmissionRecord& submission) = 0;
};

/**
 * @brief Appends one JSON object per line
 */
class JsonlSubmissionSink : public ISubmissionSink {
public:
    explicit JsonlSubmissionSink(std::filesystem::path path);

    [[nodiscard]] Result<Unit> record(const SubmissionRecord& submission) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
};

} // namespace sqlsandbox
