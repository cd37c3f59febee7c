#include "orchestrator/submission_sink.hpp"
#include "grading/report_json.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace sqlsandbox {

JsonlSubmissionSink::JsonlSubmissionSink(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<Unit> JsonlSubmissionSink::record(const SubmissionRecord& submission) {
    nlohmann::json line = {
        {"job_id", submission.job_id},
        {"user_id", submission.user_id},
        {"problem_id", submission.problem_id},
        {"sql", submission.sql},
        {"synchronous", submission.synchronous},
        {"submitted_at_ms", submission.submitted_at_ms},
        {"completed_at_ms", submission.completed_at_ms},
    };
    if (submission.report) {
        line["status"] = "graded";
        line["report"] = grade_report_to_json(*submission.report);
    } else {
        line["status"] = "error";
        line["error"] = submission.error;
        line["error_category"] = error_category_to_string(submission.error_category);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        if (path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path_.parent_path(), ec);
        }
        out_.open(path_, std::ios::app);
        if (!out_.is_open()) {
            return Result<Unit>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Cannot open submission log {}", path_.string()));
        }
    }

    out_ << line.dump() << '\n';
    out_.flush();
    if (!out_) {
        out_.close();
        return Result<Unit>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Write to submission log {} failed", path_.string()));
    }
    return Result<Unit>::ok(Unit{});
}

} // namespace sqlsandbox
