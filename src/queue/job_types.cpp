#include "queue/job_types.hpp"

namespace sqlsandbox {

std::optional<JobStatus> job_status_from_string(std::string_view s) {
    if (s == "queued") return JobStatus::QUEUED;
    if (s == "processing") return JobStatus::PROCESSING;
    if (s == "completed") return JobStatus::COMPLETED;
    if (s == "failed") return JobStatus::FAILED;
    return std::nullopt;
}

std::optional<ErrorCategory> error_category_from_string(std::string_view s) {
    static constexpr ErrorCategory kAll[] = {
        ErrorCategory::NONE, ErrorCategory::SECURITY_REJECTED, ErrorCategory::DATASET_LOAD_ERROR,
        ErrorCategory::EXECUTION_TIMEOUT, ErrorCategory::RESOURCE_LIMIT_EXCEEDED,
        ErrorCategory::ENGINE_ERROR, ErrorCategory::VALIDATION_ERROR,
        ErrorCategory::QUEUE_UNAVAILABLE, ErrorCategory::NOT_FOUND,
        ErrorCategory::INVALID_REQUEST, ErrorCategory::INTERNAL_ERROR,
    };
    for (const auto c : kAll) {
        if (s == error_category_to_string(c)) return c;
    }
    return std::nullopt;
}

std::string Job::to_entry() const {
    nlohmann::json j = {
        {"job_id", job_id},
        {"owner_id", owner_id},
        {"problem_id", problem_id},
        {"sql", sql},
        {"created_at", created_at_ms},
    };
    return j.dump();
}

std::optional<Job> Job::from_entry(std::string_view entry) {
    const auto j = nlohmann::json::parse(entry, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    const auto id = j.find("job_id");
    const auto owner = j.find("owner_id");
    const auto problem = j.find("problem_id");
    const auto sql = j.find("sql");
    if (id == j.end() || !id->is_string() || id->get_ref<const std::string&>().empty() ||
        owner == j.end() || !owner->is_string() ||
        problem == j.end() || !problem->is_string() ||
        sql == j.end() || !sql->is_string()) {
        return std::nullopt;
    }

    Job job;
    job.job_id = id->get<std::string>();
    job.owner_id = owner->get<std::string>();
    job.problem_id = problem->get<std::string>();
    job.sql = sql->get<std::string>();
    if (auto it = j.find("created_at"); it != j.end() && it->is_number_integer()) {
        job.created_at_ms = it->get<int64_t>();
    }
    return job;
}

std::string JobResult::to_json() const {
    nlohmann::json j = {
        {"success", success},
        {"payload", payload},
        {"error", error},
        {"error_category", error_category_to_string(error_category)},
        {"completed_at", completed_at_ms},
    };
    return j.dump();
}

std::optional<JobResult> JobResult::from_json(std::string_view text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    JobResult r;
    try {
        r.success = j.value("success", false);
        if (auto it = j.find("payload"); it != j.end()) r.payload = *it;
        r.error = j.value("error", std::string{});
        r.error_category = error_category_from_string(j.value("error_category", std::string{"none"}))
                               .value_or(ErrorCategory::INTERNAL_ERROR);
        r.completed_at_ms = j.value("completed_at", int64_t{0});
    } catch (const nlohmann::json::type_error&) {
        return std::nullopt;
    }
    return r;
}

} // namespace sqlsandbox
