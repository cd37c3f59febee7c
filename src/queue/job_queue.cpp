#include "queue/job_queue.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlsandbox {

namespace {

template <typename T, typename U>
Result<T> forward_error(const Result<U>& r) {
    return Result<T>::error(r.error_category(), r.error_message());
}

} // anonymous namespace

JobQueue::JobQueue(const Config& config, std::shared_ptr<IJobStore> store)
    : config_(config), store_(std::move(store)) {}

Result<std::string> JobQueue::enqueue(const std::string& owner_id,
                                      const std::string& problem_id,
                                      const std::string& sql) {
    Job job;
    job.job_id = utils::generate_uuid();
    job.owner_id = owner_id;
    job.problem_id = problem_id;
    job.sql = sql;
    job.created_at_ms = utils::to_epoch_ms(utils::now());

    JobMeta meta;
    meta.owner_id = owner_id;
    meta.problem_id = problem_id;
    meta.status = JobStatus::QUEUED;
    meta.created_at_ms = job.created_at_ms;
    meta.updated_at_ms = job.created_at_ms;

    auto pushed = store_->push(job.job_id, job.to_entry(), meta, config_.meta_ttl);
    if (pushed.is_error()) return forward_error<std::string>(pushed);
    return Result<std::string>::ok(std::move(job.job_id));
}

Result<std::optional<ClaimedJob>> JobQueue::claim() {
    using R = Result<std::optional<ClaimedJob>>;

    auto claimed = store_->claim(config_.poll_timeout);
    if (claimed.is_error()) return forward_error<std::optional<ClaimedJob>>(claimed);
    if (!claimed.value()) return R::ok(std::nullopt);

    std::string entry = std::move(*claimed.value());
    auto job = Job::from_entry(entry);
    if (!job) {
        utils::log::warn("Dropping malformed queue entry");
        auto removed = store_->remove_processing(entry);
        if (removed.is_error()) return forward_error<std::optional<ClaimedJob>>(removed);
        return R::ok(std::nullopt);
    }

    auto marked = store_->set_status(job->job_id, JobStatus::PROCESSING,
                                     utils::to_epoch_ms(utils::now()));
    if (marked.is_error()) {
        if (marked.error_category() != ErrorCategory::NOT_FOUND) {
            return forward_error<std::optional<ClaimedJob>>(marked);
        }
        // Metadata expired while queued: nobody can poll for it any more
        utils::log::warn(std::format("Job {} expired before it was claimed, dropping", job->job_id));
        auto removed = store_->remove_processing(entry);
        if (removed.is_error()) return forward_error<std::optional<ClaimedJob>>(removed);
        return R::ok(std::nullopt);
    }

    return R::ok(ClaimedJob{std::move(*job), std::move(entry)});
}

Result<Unit> JobQueue::complete(const ClaimedJob& claimed, const JobResult& result) {
    JobResult stamped = result;
    if (stamped.completed_at_ms == 0) stamped.completed_at_ms = utils::to_epoch_ms(utils::now());

    // Result before status, so a poll that sees "completed" finds the result
    auto written = store_->write_result(claimed.job.job_id, stamped.to_json(), config_.result_ttl);
    if (written.is_error()) return written;

    const auto status = stamped.success ? JobStatus::COMPLETED : JobStatus::FAILED;
    auto marked = store_->set_status(claimed.job.job_id, status, stamped.completed_at_ms);
    if (marked.is_error() && marked.error_category() != ErrorCategory::NOT_FOUND) return marked;

    auto removed = store_->remove_processing(claimed.entry);
    if (removed.is_error()) return forward_error<Unit>(removed);
    return Result<Unit>::ok(Unit{});
}

Result<Unit> JobQueue::record(const Job& job, const JobResult& result) {
    JobResult stamped = result;
    if (stamped.completed_at_ms == 0) stamped.completed_at_ms = utils::to_epoch_ms(utils::now());

    JobMeta meta;
    meta.owner_id = job.owner_id;
    meta.problem_id = job.problem_id;
    meta.status = stamped.success ? JobStatus::COMPLETED : JobStatus::FAILED;
    meta.created_at_ms = job.created_at_ms;
    meta.updated_at_ms = stamped.completed_at_ms;

    auto written = store_->write_result(job.job_id, stamped.to_json(), config_.result_ttl);
    if (written.is_error()) return written;
    return store_->put_meta(job.job_id, meta, config_.meta_ttl);
}

Result<RecoveryReport> JobQueue::recover() {
    RecoveryReport report;
    const auto token = utils::generate_uuid();

    auto locked = store_->try_lock(kRecoveryLock, token, config_.recovery_lock_ttl);
    if (locked.is_error()) return forward_error<RecoveryReport>(locked);
    if (!locked.value()) return Result<RecoveryReport>::ok(report);
    report.lock_acquired = true;

    auto run = [&]() -> Result<Unit> {
        auto entries = store_->processing_entries();
        if (entries.is_error()) return forward_error<Unit>(entries);

        const auto now_ms = utils::to_epoch_ms(utils::now());
        const auto min_age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            config_.recovery_min_age).count();

        for (const auto& entry : entries.value()) {
            ++report.scanned;

            auto job = Job::from_entry(entry);
            std::optional<JobMeta> meta;
            if (job) {
                auto m = store_->get_meta(job->job_id);
                if (m.is_error()) return forward_error<Unit>(m);
                meta = m.value();
            }

            if (!job || !meta) {
                auto removed = store_->remove_processing(entry);
                if (removed.is_error()) return forward_error<Unit>(removed);
                if (removed.value()) ++report.dropped_malformed;
                continue;
            }

            if (is_terminal(meta->status)) {
                auto removed = store_->remove_processing(entry);
                if (removed.is_error()) return forward_error<Unit>(removed);
                if (removed.value()) ++report.removed_completed;
                continue;
            }

            if (now_ms - meta->updated_at_ms < min_age_ms) continue;

            auto requeued = store_->requeue(entry);
            if (requeued.is_error()) return forward_error<Unit>(requeued);
            if (requeued.value()) {
                ++report.requeued;
                auto marked = store_->set_status(job->job_id, JobStatus::QUEUED, now_ms);
                if (marked.is_error() && marked.error_category() != ErrorCategory::NOT_FOUND) {
                    return marked;
                }
            }
        }
        return Result<Unit>::ok(Unit{});
    };

    auto scanned = run();
    auto released = store_->unlock(kRecoveryLock, token);
    if (released.is_error()) {
        utils::log::warn(std::format("Recovery lock release failed: {}", released.error_message()));
    }
    if (scanned.is_error()) return forward_error<RecoveryReport>(scanned);

    if (report.scanned > 0) {
        utils::log::info(std::format(
            "Queue recovery: scanned={} requeued={} completed_removed={} malformed_dropped={}",
            report.scanned, report.requeued, report.removed_completed, report.dropped_malformed));
    }
    return Result<RecoveryReport>::ok(report);
}

Result<JobStatusView> JobQueue::status(const std::string& job_id, const std::string& caller_id) {
    using R = Result<JobStatusView>;

    auto meta = store_->get_meta(job_id);
    if (meta.is_error()) return forward_error<JobStatusView>(meta);
    if (!meta.value() || meta.value()->owner_id != caller_id) {
        return R::error(ErrorCategory::NOT_FOUND, "Job not found");
    }

    JobStatusView view;
    view.job_id = job_id;
    view.status = meta.value()->status;

    if (is_terminal(view.status)) {
        auto raw = store_->get_result(job_id);
        if (raw.is_error()) return forward_error<JobStatusView>(raw);
        if (raw.value()) {
            view.result = JobResult::from_json(*raw.value());
        }
    }
    return R::ok(std::move(view));
}

} // namespace sqlsandbox
