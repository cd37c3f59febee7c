#pragma once

#include "cache/result_cache.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "executor/circuit_breaker.hpp"
#include "grading/grader.hpp"
#include "orchestrator/submission_sink.hpp"
#include "queue/job_queue.hpp"
#include "security/query_validator.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace sqlsandbox {

struct SubmitReceipt {
    std::string job_id;
    JobStatus status = JobStatus::QUEUED;
    bool synchronous = false;           // Queue was unavailable, already graded
};

/**
 * @brief Entry point for submit, poll and practice-mode test
 *
 * submit() screens the text with the fast validator and enqueues it behind
 * a circuit breaker. When the queue is unavailable, or the breaker is open,
 * the submission is graded on the calling thread and its result stored in
 * a process-local fallback queue, so the returned job id still resolves
 * through poll(). No submission is dropped silently.
 */
class SubmissionOrchestrator {
public:
    struct Config {
        size_t max_sql_length = 10000;
    };

    struct Stats {
        uint64_t submitted = 0;
        uint64_t rejected = 0;
        uint64_t failovers = 0;
        uint64_t tests = 0;
    };

    SubmissionOrchestrator(const Config& config,
                           std::shared_ptr<Grader> grader,
                           std::shared_ptr<JobQueue> queue,
                           std::shared_ptr<JobQueue> fallback_queue,
                           std::shared_ptr<CircuitBreaker> breaker,
                           std::shared_ptr<const QueryValidator> validator,
                           std::shared_ptr<ResultCache> cache,
                           std::shared_ptr<ISubmissionSink> sink);

    [[nodiscard]] Result<SubmitReceipt> submit(const std::string& user_id,
                                               const std::string& problem_id,
                                               const std::string& sql);

    /**
     * @brief Ownership-checked status lookup; foreign and unknown ids are both NOT_FOUND
     */
    [[nodiscard]] Result<JobStatusView> poll(const std::string& job_id, const std::string& caller_id);

    /**
     * @brief Synchronous grading for practice mode, cached per (user, problem, query)
     */
    [[nodiscard]] Result<GradeReport> test(const std::string& user_id,
                                           const std::string& problem_id,
                                           const std::string& sql,
                                           bool include_hidden);

    /**
     * @brief Grade a claimed job; the handler queue workers run
     */
    [[nodiscard]] Result<nlohmann::json> process_job(const Job& job);

    [[nodiscard]] Stats stats() const;

private:
    [[nodiscard]] Result<Unit> screen(const std::string& user_id,
                                      const std::string& problem_id,
                                      const std::string& sql) const;
    [[nodiscard]] Result<SubmitReceipt> grade_synchronously(const std::string& user_id,
                                                            const std::string& problem_id,
                                                            const std::string& sql);
    [[nodiscard]] Result<nlohmann::json> grade_job(const Job& job, bool synchronous);
    void persist(const SubmissionRecord& record);

    Config config_;
    std::shared_ptr<Grader> grader_;
    std::shared_ptr<JobQueue> queue_;
    std::shared_ptr<JobQueue> fallback_queue_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<const QueryValidator> validator_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<ISubmissionSink> sink_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> failovers_{0};
    std::atomic<uint64_t> tests_{0};
};

} // namespace sqlsandbox
