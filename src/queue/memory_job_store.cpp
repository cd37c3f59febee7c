#include "queue/memory_job_store.hpp"

#include <algorithm>

namespace sqlsandbox {

void MemoryJobStore::note_write() {
    if (++writes_since_sweep_ >= kSweepInterval) sweep_expired();
}

void MemoryJobStore::sweep_expired() {
    writes_since_sweep_ = 0;
    std::erase_if(meta_, [](const auto& kv) { return !alive(kv.second); });
    std::erase_if(results_, [](const auto& kv) { return !alive(kv.second); });
    std::erase_if(locks_, [](const auto& kv) { return !alive(kv.second); });
}

Result<Unit> MemoryJobStore::push(const std::string& job_id, const std::string& entry,
                                  const JobMeta& meta, std::chrono::seconds meta_ttl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        meta_[job_id] = Expiring<JobMeta>{meta, Clock::now() + meta_ttl};
        queue_.push_back(entry);
        note_write();
    }
    queue_cv_.notify_one();
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<std::string>> MemoryJobStore::claim(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        sweep_expired();
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    std::string entry = std::move(queue_.front());
    queue_.pop_front();
    processing_.push_back(entry);
    return Result<std::optional<std::string>>::ok(std::move(entry));
}

Result<Unit> MemoryJobStore::put_meta(const std::string& job_id, const JobMeta& meta,
                                      std::chrono::seconds meta_ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    meta_[job_id] = Expiring<JobMeta>{meta, Clock::now() + meta_ttl};
    note_write();
    return Result<Unit>::ok(Unit{});
}

Result<Unit> MemoryJobStore::set_status(const std::string& job_id, JobStatus status,
                                        int64_t updated_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = meta_.find(job_id);
    if (it == meta_.end() || !alive(it->second)) {
        return Result<Unit>::error(ErrorCategory::NOT_FOUND, "Job metadata expired");
    }
    it->second.value.status = status;
    it->second.value.updated_at_ms = updated_at_ms;
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<JobMeta>> MemoryJobStore::get_meta(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = meta_.find(job_id);
    if (it == meta_.end()) return Result<std::optional<JobMeta>>::ok(std::nullopt);
    if (!alive(it->second)) {
        meta_.erase(it);
        return Result<std::optional<JobMeta>>::ok(std::nullopt);
    }
    return Result<std::optional<JobMeta>>::ok(it->second.value);
}

Result<Unit> MemoryJobStore::write_result(const std::string& job_id, const std::string& result,
                                          std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[job_id] = Expiring<std::string>{result, Clock::now() + ttl};
    note_write();
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<std::string>> MemoryJobStore::get_result(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(job_id);
    if (it == results_.end()) return Result<std::optional<std::string>>::ok(std::nullopt);
    if (!alive(it->second)) {
        results_.erase(it);
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(it->second.value);
}

Result<bool> MemoryJobStore::remove_processing(const std::string& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::ranges::find(processing_, entry);
    if (it == processing_.end()) return Result<bool>::ok(false);
    processing_.erase(it);
    return Result<bool>::ok(true);
}

Result<std::vector<std::string>> MemoryJobStore::processing_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::vector<std::string>>::ok(
        std::vector<std::string>(processing_.begin(), processing_.end()));
}

Result<bool> MemoryJobStore::requeue(const std::string& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::ranges::find(processing_, entry);
        if (it == processing_.end()) return Result<bool>::ok(false);
        processing_.erase(it);
        queue_.push_front(entry);
    }
    queue_cv_.notify_one();
    return Result<bool>::ok(true);
}

Result<bool> MemoryJobStore::try_lock(const std::string& name, const std::string& token,
                                      std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(name);
    if (it != locks_.end() && alive(it->second)) return Result<bool>::ok(false);
    locks_[name] = Expiring<std::string>{token, Clock::now() + ttl};
    return Result<bool>::ok(true);
}

Result<Unit> MemoryJobStore::unlock(const std::string& name, const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(name);
    // Only the holder may release; an expired lock may already belong to someone else
    if (it != locks_.end() && it->second.value == token) locks_.erase(it);
    return Result<Unit>::ok(Unit{});
}

size_t MemoryJobStore::queue_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t MemoryJobStore::processing_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processing_.size();
}

size_t MemoryJobStore::stored_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return meta_.size() + results_.size() + locks_.size();
}

} // namespace sqlsandbox
