#pragma once

#include "core/error.hpp"
#include "queue/job_store.hpp"
#include "queue/job_types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief At-least-once, single-attempt work queue
 *
 * queued -> processing -> {completed | failed}, plus processing -> queued
 * when recovery finds a job orphaned by a crashed worker. Status and result
 * lookups are ownership-checked: a caller who does not own the job gets
 * the same NOT_FOUND as for a job that never existed.
 */
class JobQueue {
public:
    struct Config {
        std::chrono::milliseconds poll_timeout{1000};
        std::chrono::seconds result_ttl{300};
        std::chrono::seconds meta_ttl{3600};
        std::chrono::milliseconds recovery_lock_ttl{30000};
        // Lease: processing entries younger than this are left to their worker
        std::chrono::seconds recovery_min_age{300};
    };

    JobQueue(const Config& config, std::shared_ptr<IJobStore> store);

    /**
     * @return the new job id
     */
    [[nodiscard]] Result<std::string> enqueue(const std::string& owner_id,
                                              const std::string& problem_id,
                                              const std::string& sql);

    /**
     * @brief Atomically move the queue head into processing and mark it
     * @return nullopt when nothing arrived within poll_timeout
     */
    [[nodiscard]] Result<std::optional<ClaimedJob>> claim();

    /**
     * @brief Publish the result (TTL), flip status, drop the processing entry
     */
    [[nodiscard]] Result<Unit> complete(const ClaimedJob& claimed, const JobResult& result);

    /**
     * @brief Record a job that was graded outside the queue
     *
     * Used by synchronous failover so the job id still resolves via status().
     */
    [[nodiscard]] Result<Unit> record(const Job& job, const JobResult& result);

    /**
     * @brief Lock-guarded scan of the processing set
     *
     * Orphaned queued/processing jobs are moved back to the queue head,
     * finished ones are removed, malformed or expired entries are dropped.
     * Without the lock nothing is touched (lock_acquired = false).
     */
    [[nodiscard]] Result<RecoveryReport> recover();

    [[nodiscard]] Result<JobStatusView> status(const std::string& job_id, const std::string& caller_id);

    [[nodiscard]] Result<Unit> ping() { return store_->ping(); }
    [[nodiscard]] const Config& config() const { return config_; }

    static constexpr const char* kRecoveryLock = "recovery";

private:
    Config config_;
    std::shared_ptr<IJobStore> store_;
};

} // namespace sqlsandbox
