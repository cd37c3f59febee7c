#pragma once

#include "core/error.hpp"
#include "queue/job_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Storage primitives behind the job queue
 *
 * claim() must move an entry from the queue into the processing set in one
 * atomic step, and requeue() must move it back the same way; at no point
 * may an entry be absent from both. Implementations report infrastructure
 * failures as QUEUE_UNAVAILABLE.
 */
class IJobStore {
public:
    virtual ~IJobStore() = default;

    /// Store metadata (with TTL) and push the entry onto the queue tail.
    [[nodiscard]] virtual Result<Unit> push(const std::string& job_id, const std::string& entry,
                                            const JobMeta& meta, std::chrono::seconds meta_ttl) = 0;

    /// Block up to timeout for the queue head; nullopt on timeout.
    [[nodiscard]] virtual Result<std::optional<std::string>> claim(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<Unit> put_meta(const std::string& job_id, const JobMeta& meta,
                                                std::chrono::seconds meta_ttl) = 0;
    [[nodiscard]] virtual Result<Unit> set_status(const std::string& job_id, JobStatus status,
                                                  int64_t updated_at_ms) = 0;
    [[nodiscard]] virtual Result<std::optional<JobMeta>> get_meta(const std::string& job_id) = 0;

    /// Overwrites any earlier result for the same job.
    [[nodiscard]] virtual Result<Unit> write_result(const std::string& job_id, const std::string& result,
                                                    std::chrono::seconds ttl) = 0;
    [[nodiscard]] virtual Result<std::optional<std::string>> get_result(const std::string& job_id) = 0;

    /// Remove one occurrence of entry from the processing set.
    [[nodiscard]] virtual Result<bool> remove_processing(const std::string& entry) = 0;
    [[nodiscard]] virtual Result<std::vector<std::string>> processing_entries() = 0;

    /// Atomically move entry from processing back to the queue head.
    [[nodiscard]] virtual Result<bool> requeue(const std::string& entry) = 0;

    [[nodiscard]] virtual Result<bool> try_lock(const std::string& name, const std::string& token,
                                                std::chrono::milliseconds ttl) = 0;
    [[nodiscard]] virtual Result<Unit> unlock(const std::string& name, const std::string& token) = 0;

    [[nodiscard]] virtual Result<Unit> ping() = 0;
};

} // namespace sqlsandbox
