#pragma once

#ifdef SQLSANDBOX_ENABLE_REDIS

#include "queue/job_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace sqlsandbox {

/**
 * @brief Job store on Redis (hiredis)
 *
 * Keys, all under the configured prefix:
 *   <p>:queue        LIST  (LPUSH tail, consumed from the RIGHT)
 *   <p>:processing   LIST  (BLMOVE queue -> processing in one step)
 *   <p>:job:<id>     HASH  owner_id, problem_id, status, created_at, updated_at
 *   <p>:result:<id>  STRING with TTL (SETEX, overwritten on rewrite)
 *   <p>:lock:<name>  STRING, SET NX PX, released by compare-and-delete script
 *
 * hiredis contexts are not thread-safe; each call leases one from a small
 * pool and returns it only if it is still healthy.
 */
class RedisJobStore : public IJobStore {
public:
    struct Config {
        std::string host = "127.0.0.1";
        int port = 6379;
        std::string password;
        std::chrono::milliseconds connect_timeout{2000};
        std::string key_prefix = "sqlsandbox";
        size_t max_idle_connections = 8;
    };

    explicit RedisJobStore(const Config& config);
    ~RedisJobStore() override;

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

    [[nodiscard]] Result<Unit> ping() override;

private:
    class Connection;

    struct ReplyDeleter {
        void operator()(redisReply* r) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    /**
     * @brief RAII lease of one pooled connection
     */
    class Lease {
    public:
        Lease(RedisJobStore& store, std::unique_ptr<Connection> conn);
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] redisContext* get() const;
        void mark_broken() { broken_ = true; }

    private:
        RedisJobStore& store_;
        std::unique_ptr<Connection> conn_;
        bool broken_ = false;
    };

    [[nodiscard]] Result<std::unique_ptr<Connection>> connect() const;
    [[nodiscard]] Result<std::unique_ptr<Lease>> lease();
    void give_back(std::unique_ptr<Connection> conn);

    // Runs a command (argv form, binary-safe); transport and server errors
    // become QUEUE_UNAVAILABLE and the connection is not reused.
    [[nodiscard]] Result<ReplyPtr> command(const std::vector<std::string>& argv);
    [[nodiscard]] Result<ReplyPtr> command(Lease& lease, const std::vector<std::string>& argv);

    [[nodiscard]] std::string key(std::string_view suffix) const;

    Config config_;
    std::mutex pool_mutex_;
    std::vector<std::unique_ptr<Connection>> idle_;
};

} // namespace sqlsandbox

#endif // SQLSANDBOX_ENABLE_REDIS
