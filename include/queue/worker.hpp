#pragma once

#include "core/error.hpp"
#include "queue/job_queue.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Background consumer of a JobQueue
 *
 * Each job is attempted exactly once: a handler error or exception becomes
 * a failed JobResult, never a retry. The queue is recovered once at startup
 * and then every recovery_interval, guarded by the queue's recovery lock so
 * several workers can run side by side. Recovery only takes back entries
 * older than the queue's lease, so a job another worker is still grading
 * stays with that worker.
 */
class QueueWorker {
public:
    // Grades one job; the returned JSON becomes the job's result payload
    using Handler = std::function<Result<nlohmann::json>(const Job& job)>;

    struct Config {
        std::chrono::seconds recovery_interval{60};
        // Back-off after the queue backend reports an error
        std::chrono::milliseconds error_backoff{1000};
    };

    struct Stats {
        uint64_t processed = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t queue_errors = 0;
    };

    QueueWorker(const Config& config, std::shared_ptr<JobQueue> queue, Handler handler);
    ~QueueWorker();

    QueueWorker(const QueueWorker&) = delete;
    QueueWorker& operator=(const QueueWorker&) = delete;

    void start();
    void stop();

    /**
     * @brief Claim and process at most one job on the calling thread
     * @return true if a job was processed, false on an empty poll
     */
    [[nodiscard]] Result<bool> process_one();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] Stats stats() const;

private:
    void run_loop(std::stop_token stop);
    [[nodiscard]] JobResult handle(const Job& job);
    void sleep_for(std::chrono::milliseconds duration, const std::stop_token& stop) const;

    Config config_;
    std::shared_ptr<JobQueue> queue_;
    Handler handler_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> queue_errors_{0};
    std::jthread thread_;
};

/**
 * @brief N workers sharing one queue and one handler
 */
class WorkerPool {
public:
    WorkerPool(size_t size, const QueueWorker::Config& config,
               std::shared_ptr<JobQueue> queue, QueueWorker::Handler handler);

    void start();
    void stop();

    [[nodiscard]] size_t size() const { return workers_.size(); }
    [[nodiscard]] QueueWorker::Stats stats() const;

private:
    std::vector<std::unique_ptr<QueueWorker>> workers_;
};

} // namespace sqlsandbox
