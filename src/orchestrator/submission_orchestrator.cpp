#include "orchestrator/submission_orchestrator.hpp"
#include "core/utils.hpp"
#include "grading/report_json.hpp"
#include "parser/fingerprinter.hpp"

#include <format>

namespace sqlsandbox {

SubmissionOrchestrator::SubmissionOrchestrator(const Config& config,
                                               std::shared_ptr<Grader> grader,
                                               std::shared_ptr<JobQueue> queue,
                                               std::shared_ptr<JobQueue> fallback_queue,
                                               std::shared_ptr<CircuitBreaker> breaker,
                                               std::shared_ptr<const QueryValidator> validator,
                                               std::shared_ptr<ResultCache> cache,
                                               std::shared_ptr<ISubmissionSink> sink)
    : config_(config),
      grader_(std::move(grader)),
      queue_(std::move(queue)),
      fallback_queue_(std::move(fallback_queue)),
      breaker_(std::move(breaker)),
      validator_(std::move(validator)),
      cache_(std::move(cache)),
      sink_(std::move(sink)) {}

Result<Unit> SubmissionOrchestrator::screen(const std::string& user_id,
                                            const std::string& problem_id,
                                            const std::string& sql) const {
    if (user_id.empty()) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST, "user_id is required");
    }
    if (problem_id.empty()) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST, "problem_id is required");
    }
    if (utils::trim(sql).empty()) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST, "SQL text is required");
    }
    if (sql.size() > config_.max_sql_length) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST,
            std::format("SQL text exceeds {} characters", config_.max_sql_length));
    }

    const auto verdict = validator_->validate_fast(sql);
    if (!verdict.is_valid) {
        std::string reason;
        for (const auto& err : verdict.errors) {
            if (!reason.empty()) reason += "; ";
            reason += err;
        }
        return Result<Unit>::error(ErrorCategory::SECURITY_REJECTED, reason);
    }
    return Result<Unit>::ok(Unit{});
}

void SubmissionOrchestrator::persist(const SubmissionRecord& record) {
    if (!sink_) return;
    auto stored = sink_->record(record);
    if (stored.is_error()) {
        utils::log::error(std::format("Submission {} not persisted: {}",
            record.job_id, stored.error_message()));
    }
}

// ============================================================================
// submit / poll
// ============================================================================

Result<SubmitReceipt> SubmissionOrchestrator::submit(const std::string& user_id,
                                                     const std::string& problem_id,
                                                     const std::string& sql) {
    using R = Result<SubmitReceipt>;

    auto screened = screen(user_id, problem_id, sql);
    if (screened.is_error()) {
        rejected_.fetch_add(1);
        return R::error(screened.error_category(), screened.error_message());
    }
    submitted_.fetch_add(1);

    if (breaker_->allow_request()) {
        auto enqueued = queue_->enqueue(user_id, problem_id, sql);
        if (enqueued.is_ok()) {
            breaker_->record_success();
            return R::ok(SubmitReceipt{std::move(enqueued.value()), JobStatus::QUEUED, false});
        }
        breaker_->record_failure();
        utils::log::warn(std::format("Enqueue failed ({}), grading synchronously",
            enqueued.error_message()));
    } else {
        utils::log::warn("Job queue circuit open, grading synchronously");
    }

    return grade_synchronously(user_id, problem_id, sql);
}

Result<SubmitReceipt> SubmissionOrchestrator::grade_synchronously(const std::string& user_id,
                                                                  const std::string& problem_id,
                                                                  const std::string& sql) {
    using R = Result<SubmitReceipt>;
    failovers_.fetch_add(1);

    Job job;
    job.job_id = utils::generate_uuid();
    job.owner_id = user_id;
    job.problem_id = problem_id;
    job.sql = sql;
    job.created_at_ms = utils::to_epoch_ms(utils::now());

    JobResult result;
    auto graded = grade_job(job, true);
    if (graded.is_ok()) {
        result.success = true;
        result.payload = std::move(graded.value());
    } else {
        result.error = graded.error_message();
        result.error_category = graded.error_category();
    }
    result.completed_at_ms = utils::to_epoch_ms(utils::now());

    auto recorded = fallback_queue_->record(job, result);
    if (recorded.is_error()) {
        return R::error(recorded.error_category(), recorded.error_message());
    }
    return R::ok(SubmitReceipt{job.job_id,
        result.success ? JobStatus::COMPLETED : JobStatus::FAILED, true});
}

Result<JobStatusView> SubmissionOrchestrator::poll(const std::string& job_id, const std::string& caller_id) {
    auto local = fallback_queue_->status(job_id, caller_id);
    if (local.is_ok() || local.error_category() != ErrorCategory::NOT_FOUND) return local;
    return queue_->status(job_id, caller_id);
}

// ============================================================================
// test / grading
// ============================================================================

Result<GradeReport> SubmissionOrchestrator::test(const std::string& user_id,
                                                 const std::string& problem_id,
                                                 const std::string& sql,
                                                 bool include_hidden) {
    using R = Result<GradeReport>;
    tests_.fetch_add(1);

    auto screened = screen(user_id, problem_id, sql);
    if (screened.is_error()) return R::error(screened.error_category(), screened.error_message());

    const uint64_t key = ResultCache::key_hash(user_id, problem_id,
        QueryFingerprinter::normalize(sql), include_hidden);
    if (cache_) {
        if (auto hit = cache_->get(key, problem_id)) {
            hit->cached = true;
            return R::ok(std::move(*hit));
        }
    }

    auto graded = grader_->grade(user_id, problem_id, sql, include_hidden);
    if (graded.is_ok() && cache_) {
        cache_->put(key, problem_id, graded.value());
    }
    return graded;
}

Result<nlohmann::json> SubmissionOrchestrator::process_job(const Job& job) {
    return grade_job(job, false);
}

Result<nlohmann::json> SubmissionOrchestrator::grade_job(const Job& job, bool synchronous) {
    SubmissionRecord record;
    record.job_id = job.job_id;
    record.user_id = job.owner_id;
    record.problem_id = job.problem_id;
    record.sql = job.sql;
    record.submitted_at_ms = job.created_at_ms;
    record.synchronous = synchronous;

    // Graded submissions always see hidden test cases
    auto graded = grader_->grade(job.owner_id, job.problem_id, job.sql, true);
    record.completed_at_ms = utils::to_epoch_ms(utils::now());

    if (graded.is_error()) {
        record.error = graded.error_message();
        record.error_category = graded.error_category();
        persist(record);
        return Result<nlohmann::json>::error(graded.error_category(), graded.error_message());
    }

    auto payload = grade_report_to_json(graded.value());
    record.report = std::move(graded.value());
    persist(record);
    return Result<nlohmann::json>::ok(std::move(payload));
}

SubmissionOrchestrator::Stats SubmissionOrchestrator::stats() const {
    Stats s;
    s.submitted = submitted_.load();
    s.rejected = rejected_.load();
    s.failovers = failovers_.load();
    s.tests = tests_.load();
    return s;
}

} // namespace sqlsandbox
