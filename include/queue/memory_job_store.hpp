#pragma once

#include "queue/job_store.hpp"

#include <condition_variable>
#include <deque>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sqlsandbox {

/**
 * @brief In-process job store
 *
 * One mutex guards the queue, the processing set and every keyed value, so
 * claim and requeue are atomic by construction. TTLs are enforced on read;
 * expired values nobody reads are swept every kSweepInterval writes and
 * whenever a claim finds the queue idle.
 */
class MemoryJobStore : public IJobStore {
public:
    MemoryJobStore() = default;

    [[nodiscard]] Result<Unit> push(const std::string& job_id, const std::string& entry,
                                    const JobMeta& meta, std::chrono::seconds meta_ttl) override;
    [[nodiscard]] Result<std::optional<std::string>> claim(std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<Unit> put_meta(const std::string& job_id, const JobMeta& meta,
                                        std::chrono::seconds meta_ttl) override;
    [[nodiscard]] Result<Unit> set_status(const std::string& job_id, JobStatus status,
                                          int64_t updated_at_ms) override;
    [[nodiscard]] Result<std::optional<JobMeta>> get_meta(const std::string& job_id) override;

    [[nodiscard]] Result<Unit> write_result(const std::string& job_id, const std::string& result,
                                            std::chrono::seconds ttl) override;
    [[nodiscard]] Result<std::optional<std::string>> get_result(const std::string& job_id) override;

    [[nodiscard]] Result<bool> remove_processing(const std::string& entry) override;
    [[nodiscard]] Result<std::vector<std::string>> processing_entries() override;
    [[nodiscard]] Result<bool> requeue(const std::string& entry) override;

    [[nodiscard]] Result<bool> try_lock(const std::string& name, const std::string& token,
                                        std::chrono::milliseconds ttl) override;
    [[nodiscard]] Result<Unit> unlock(const std::string& name, const std::string& token) override;

    [[nodiscard]] Result<Unit> ping() override { return Result<Unit>::ok(Unit{}); }

    [[nodiscard]] size_t queue_length() const;
    [[nodiscard]] size_t processing_length() const;
    // Metadata, results and locks currently held, expired or not
    [[nodiscard]] size_t stored_entries() const;

    static constexpr size_t kSweepInterval = 64;

private:
    using Clock = std::chrono::steady_clock;

    template <typename T>
    struct Expiring {
        T value;
        Clock::time_point expires_at;
    };

    template <typename T>
    static bool alive(const Expiring<T>& e) { return Clock::now() < e.expires_at; }

    // Callers hold mutex_
    void note_write();
    void sweep_expired();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;             // push_back = tail, front = head
    std::list<std::string> processing_;
    std::unordered_map<std::string, Expiring<JobMeta>> meta_;
    std::unordered_map<std::string, Expiring<std::string>> results_;
    std::unordered_map<std::string, Expiring<std::string>> locks_;
    size_t writes_since_sweep_ = 0;
};

} // namespace sqlsandbox
