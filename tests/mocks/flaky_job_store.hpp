#pragma once

#include "queue/memory_job_store.hpp"

#include <atomic>

namespace sqlsandbox::testing {

/**
 * @brief MemoryJobStore that can be switched off like a lost backend
 *
 * While down, every call fails with QUEUE_UNAVAILABLE.
 */
class FlakyJobStore : public IJobStore {
public:
    void set_available(bool available) { available_.store(available); }
    [[nodiscard]] uint64_t calls_while_down() const { return calls_while_down_.load(); }
    [[nodiscard]] MemoryJobStore& inner() { return inner_; }

    [[nodiscard]] Result<Unit> push(const std::string& job_id, const std::string& entry,
                                    const JobMeta& meta, std::chrono::seconds meta_ttl) override {
        if (!up()) return down<Unit>();
        return inner_.push(job_id, entry, meta, meta_ttl);
    }
    [[nodiscard]] Result<std::optional<std::string>> claim(std::chrono::milliseconds timeout) override {
        if (!up()) return down<std::optional<std::string>>();
        return inner_.claim(timeout);
    }
    [[nodiscard]] Result<Unit> put_meta(const std::string& job_id, const JobMeta& meta,
                                        std::chrono::seconds meta_ttl) override {
        if (!up()) return down<Unit>();
        return inner_.put_meta(job_id, meta, meta_ttl);
    }
    [[nodiscard]] Result<Unit> set_status(const std::string& job_id, JobStatus status,
                                          int64_t updated_at_ms) override {
        if (!up()) return down<Unit>();
        return inner_.set_status(job_id, status, updated_at_ms);
    }
    [[nodiscard]] Result<std::optional<JobMeta>> get_meta(const std::string& job_id) override {
        if (!up()) return down<std::optional<JobMeta>>();
        return inner_.get_meta(job_id);
    }
    [[nodiscard]] Result<Unit> write_result(const std::string& job_id, const std::string& result,
                                            std::chrono::seconds ttl) override {
        if (!up()) return down<Unit>();
        return inner_.write_result(job_id, result, ttl);
    }
    [[nodiscard]] Result<std::optional<std::string>> get_result(const std::string& job_id) override {
        if (!up()) return down<std::optional<std::string>>();
        return inner_.get_result(job_id);
    }
    [[nodiscard]] Result<bool> remove_processing(const std::string& entry) override {
        if (!up()) return down<bool>();
        return inner_.remove_processing(entry);
    }
    [[nodiscard]] Result<std::vector<std::string>> processing_entries() override {
        if (!up()) return down<std::vector<std::string>>();
        return inner_.processing_entries();
    }
    [[nodiscard]] Result<bool> requeue(const std::string& entry) override {
        if (!up()) return down<bool>();
        return inner_.requeue(entry);
    }
    [[nodiscard]] Result<bool> try_lock(const std::string& name, const std::string& token,
                                        std::chrono::milliseconds ttl) override {
        if (!up()) return down<bool>();
        return inner_.try_lock(name, token, ttl);
    }
    [[nodiscard]] Result<Unit> unlock(const std::string& name, const std::string& token) override {
        if (!up()) return down<Unit>();
        return inner_.unlock(name, token);
    }
    [[nodiscard]] Result<Unit> ping() override {
        if (!up()) return down<Unit>();
        return inner_.ping();
    }

private:
    bool up() {
        if (available_.load()) return true;
        calls_while_down_.fetch_add(1);
        return false;
    }

    template <typename T>
    static Result<T> down() {
        return Result<T>::error(ErrorCategory::QUEUE_UNAVAILABLE, "Connection refused");
    }

    MemoryJobStore inner_;
    std::atomic<bool> available_{true};
    std::atomic<uint64_t> calls_while_down_{0};
};

} // namespace sqlsandbox::testing
