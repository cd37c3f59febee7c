#include "queue/worker.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace sqlsandbox {

QueueWorker::QueueWorker(const Config& config, std::shared_ptr<JobQueue> queue, Handler handler)
    : config_(config), queue_(std::move(queue)), handler_(std::move(handler)) {}

QueueWorker::~QueueWorker() {
    stop();
}

void QueueWorker::start() {
    if (running_.exchange(true)) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        run_loop(std::move(stop));
    });
}

void QueueWorker::stop() {
    if (!running_.exchange(false)) return;
    thread_.request_stop();
    if (thread_.joinable()) thread_.join();
}

QueueWorker::Stats QueueWorker::stats() const {
    Stats s;
    s.processed = processed_.load();
    s.succeeded = succeeded_.load();
    s.failed = failed_.load();
    s.queue_errors = queue_errors_.load();
    return s;
}

void QueueWorker::sleep_for(std::chrono::milliseconds duration, const std::stop_token& stop) const {
    const auto step = std::chrono::milliseconds{100};
    auto remaining = duration;
    while (remaining.count() > 0 && !stop.stop_requested()) {
        const auto slice = std::min(step, remaining);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
}

JobResult QueueWorker::handle(const Job& job) {
    JobResult result;
    try {
        auto graded = handler_(job);
        if (graded.is_ok()) {
            result.success = true;
            result.payload = std::move(graded.value());
        } else {
            result.success = false;
            result.error = graded.error_message();
            result.error_category = graded.error_category();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Job {}: handler threw: {}", job.job_id, e.what()));
        result.success = false;
        result.error = e.what();
        result.error_category = ErrorCategory::INTERNAL_ERROR;
    }
    result.completed_at_ms = utils::to_epoch_ms(utils::now());
    return result;
}

Result<bool> QueueWorker::process_one() {
    auto claimed = queue_->claim();
    if (claimed.is_error()) {
        queue_errors_.fetch_add(1);
        return Result<bool>::error(claimed.error_category(), claimed.error_message());
    }
    if (!claimed.value()) return Result<bool>::ok(false);

    const auto& job = *claimed.value();
    const auto result = handle(job.job);

    processed_.fetch_add(1);
    (result.success ? succeeded_ : failed_).fetch_add(1);

    auto completed = queue_->complete(job, result);
    if (completed.is_error()) {
        queue_errors_.fetch_add(1);
        // The processing entry stays behind; recovery finds it later
        utils::log::error(std::format("Job {}: result not recorded: {}",
            job.job.job_id, completed.error_message()));
        return Result<bool>::error(completed.error_category(), completed.error_message());
    }

    if (!result.success) {
        utils::log::warn(std::format("Job {} failed ({}): {}", job.job.job_id,
            error_category_to_string(result.error_category), result.error));
    }
    return Result<bool>::ok(true);
}

void QueueWorker::run_loop(std::stop_token stop) {
    auto last_recovery = std::chrono::steady_clock::time_point{};
    bool recovered_once = false;

    while (!stop.stop_requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (!recovered_once || now - last_recovery >= config_.recovery_interval) {
            auto report = queue_->recover();
            if (report.is_error()) {
                utils::log::warn(std::format("Queue recovery failed: {}", report.error_message()));
            }
            recovered_once = true;
            last_recovery = now;
        }

        auto processed = process_one();
        if (processed.is_error()) {
            utils::log::warn(std::format("Worker poll failed: {}", processed.error_message()));
            sleep_for(config_.error_backoff, stop);
        }
    }
}

// ============================================================================
// WorkerPool
// ============================================================================

WorkerPool::WorkerPool(size_t size, const QueueWorker::Config& config,
                       std::shared_ptr<JobQueue> queue, QueueWorker::Handler handler) {
    workers_.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        workers_.push_back(std::make_unique<QueueWorker>(config, queue, handler));
    }
}

void WorkerPool::start() {
    for (auto& w : workers_) w->start();
    utils::log::info(std::format("Started {} queue worker(s)", workers_.size()));
}

void WorkerPool::stop() {
    for (auto& w : workers_) w->stop();
}

QueueWorker::Stats WorkerPool::stats() const {
    QueueWorker::Stats total;
    for (const auto& w : workers_) {
        const auto s = w->stats();
        total.processed += s.processed;
        total.succeeded += s.succeeded;
        total.failed += s.failed;
        total.queue_errors += s.queue_errors;
    }
    return total;
}

} // namespace sqlsandbox
