#ifdef SQLSANDBOX_ENABLE_REDIS

#include "queue/redis_job_store.hpp"
#include "core/utils.hpp"

#include <hiredis/hiredis.h>

#include <format>
#include <sys/time.h>

namespace sqlsandbox {

namespace {

// Moves entry back to the consuming end only if it was still in processing
constexpr const char* kRequeueScript =
    "if redis.call('LREM', KEYS[1], 1, ARGV[1]) == 1 then "
    "  redis.call('RPUSH', KEYS[2], ARGV[1]) return 1 "
    "end return 0";

constexpr const char* kUnlockScript =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then "
    "  return redis.call('DEL', KEYS[1]) "
    "end return 0";

constexpr const char* kSetStatusScript =
    "if redis.call('EXISTS', KEYS[1]) == 1 then "
    "  redis.call('HSET', KEYS[1], 'status', ARGV[1], 'updated_at', ARGV[2]) return 1 "
    "end return 0";

timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

std::string reply_string(const redisReply* r) {
    return std::string(r->str, r->len);
}

} // anonymous namespace

// ============================================================================
// Connection (RAII over redisContext)
// ============================================================================

class RedisJobStore::Connection {
public:
    explicit Connection(redisContext* ctx) : ctx_(ctx) {}
    ~Connection() {
        if (ctx_) redisFree(ctx_);
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] redisContext* get() const { return ctx_; }

private:
    redisContext* ctx_;
};

void RedisJobStore::ReplyDeleter::operator()(redisReply* r) const {
    if (r) freeReplyObject(r);
}

RedisJobStore::Lease::Lease(RedisJobStore& store, std::unique_ptr<Connection> conn)
    : store_(store), conn_(std::move(conn)) {}

RedisJobStore::Lease::~Lease() {
    if (!broken_ && conn_ && conn_->get()->err == 0) {
        store_.give_back(std::move(conn_));
    }
}

redisContext* RedisJobStore::Lease::get() const {
    return conn_->get();
}

// ============================================================================
// Pool
// ============================================================================

RedisJobStore::RedisJobStore(const Config& config)
    : config_(config) {}

RedisJobStore::~RedisJobStore() = default;

std::string RedisJobStore::key(std::string_view suffix) const {
    return std::format("{}:{}", config_.key_prefix, suffix);
}

Result<std::unique_ptr<RedisJobStore::Connection>> RedisJobStore::connect() const {
    using R = Result<std::unique_ptr<Connection>>;
    redisContext* ctx = redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                                to_timeval(config_.connect_timeout));
    if (!ctx) {
        return R::error(ErrorCategory::QUEUE_UNAVAILABLE, "Cannot allocate Redis context");
    }
    auto conn = std::make_unique<Connection>(ctx);
    if (ctx->err) {
        return R::error(ErrorCategory::QUEUE_UNAVAILABLE,
            std::format("Redis connection to {}:{} failed: {}", config_.host, config_.port, ctx->errstr));
    }

    if (!config_.password.empty()) {
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommand(ctx, "AUTH %b", config_.password.data(), config_.password.size())));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            return R::error(ErrorCategory::QUEUE_UNAVAILABLE,
                reply ? std::format("Redis AUTH failed: {}", reply_string(reply.get()))
                      : std::format("Redis AUTH failed: {}", ctx->errstr));
        }
    }
    return R::ok(std::move(conn));
}

Result<std::unique_ptr<RedisJobStore::Lease>> RedisJobStore::lease() {
    using R = Result<std::unique_ptr<Lease>>;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return R::ok(std::make_unique<Lease>(*this, std::move(conn)));
        }
    }
    auto conn = connect();
    if (conn.is_error()) {
        return R::error(conn.error_category(), conn.error_message());
    }
    return R::ok(std::make_unique<Lease>(*this, std::move(conn.value())));
}

void RedisJobStore::give_back(std::unique_ptr<Connection> conn) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (idle_.size() < config_.max_idle_connections) {
        idle_.push_back(std::move(conn));
    }
}

Result<RedisJobStore::ReplyPtr> RedisJobStore::command(Lease& lease, const std::vector<std::string>& argv) {
    std::vector<const char*> args;
    std::vector<size_t> lens;
    args.reserve(argv.size());
    lens.reserve(argv.size());
    for (const auto& a : argv) {
        args.push_back(a.data());
        lens.push_back(a.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
        lease.get(), static_cast<int>(args.size()), args.data(), lens.data())));
    if (!reply) {
        lease.mark_broken();
        return Result<ReplyPtr>::error(ErrorCategory::QUEUE_UNAVAILABLE,
            std::format("Redis {} failed: {}", argv.front(), lease.get()->errstr));
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        return Result<ReplyPtr>::error(ErrorCategory::QUEUE_UNAVAILABLE,
            std::format("Redis {} error: {}", argv.front(), reply_string(reply.get())));
    }
    return Result<ReplyPtr>::ok(std::move(reply));
}

Result<RedisJobStore::ReplyPtr> RedisJobStore::command(const std::vector<std::string>& argv) {
    auto leased = lease();
    if (leased.is_error()) {
        return Result<ReplyPtr>::error(leased.error_category(), leased.error_message());
    }
    return command(*leased.value(), argv);
}

// ============================================================================
// Queue Operations
// ============================================================================

Result<Unit> RedisJobStore::push(const std::string& job_id, const std::string& entry,
                                 const JobMeta& meta, std::chrono::seconds meta_ttl) {
    auto leased = lease();
    if (leased.is_error()) return Result<Unit>::error(leased.error_category(), leased.error_message());
    auto& l = *leased.value();
    const auto job_key = key("job:" + job_id);

    const std::vector<std::vector<std::string>> steps = {
        {"MULTI"},
        {"HSET", job_key,
         "owner_id", meta.owner_id,
         "problem_id", meta.problem_id,
         "status", job_status_to_string(meta.status),
         "created_at", std::to_string(meta.created_at_ms),
         "updated_at", std::to_string(meta.updated_at_ms)},
        {"EXPIRE", job_key, std::to_string(meta_ttl.count())},
        {"LPUSH", key("queue"), entry},
    };
    for (const auto& step : steps) {
        auto r = command(l, step);
        if (r.is_error()) {
            l.mark_broken();    // Leaves no half-open MULTI on a pooled connection
            return Result<Unit>::error(r.error_category(), r.error_message());
        }
    }
    auto exec = command(l, {"EXEC"});
    if (exec.is_error()) return Result<Unit>::error(exec.error_category(), exec.error_message());
    if (exec.value()->type != REDIS_REPLY_ARRAY) {
        return Result<Unit>::error(ErrorCategory::QUEUE_UNAVAILABLE, "Redis enqueue transaction aborted");
    }
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<std::string>> RedisJobStore::claim(std::chrono::milliseconds timeout) {
    using R = Result<std::optional<std::string>>;
    auto leased = lease();
    if (leased.is_error()) return R::error(leased.error_category(), leased.error_message());
    auto& l = *leased.value();

    // Socket read timeout must outlast the server-side block
    redisSetTimeout(l.get(), to_timeval(timeout + config_.connect_timeout));
    auto r = command(l, {"BLMOVE", key("queue"), key("processing"), "RIGHT", "LEFT",
                         std::format("{:.3f}", static_cast<double>(timeout.count()) / 1000.0)});
    redisSetTimeout(l.get(), to_timeval(config_.connect_timeout));
    if (r.is_error()) return R::error(r.error_category(), r.error_message());

    const auto* reply = r.value().get();
    if (reply->type == REDIS_REPLY_NIL) return R::ok(std::nullopt);
    if (reply->type != REDIS_REPLY_STRING) {
        return R::error(ErrorCategory::QUEUE_UNAVAILABLE, "Unexpected BLMOVE reply");
    }
    return R::ok(reply_string(reply));
}

Result<Unit> RedisJobStore::put_meta(const std::string& job_id, const JobMeta& meta,
                                     std::chrono::seconds meta_ttl) {
    const auto job_key = key("job:" + job_id);
    auto r = command({"HSET", job_key,
                      "owner_id", meta.owner_id,
                      "problem_id", meta.problem_id,
                      "status", job_status_to_string(meta.status),
                      "created_at", std::to_string(meta.created_at_ms),
                      "updated_at", std::to_string(meta.updated_at_ms)});
    if (r.is_error()) return Result<Unit>::error(r.error_category(), r.error_message());
    auto e = command({"EXPIRE", job_key, std::to_string(meta_ttl.count())});
    if (e.is_error()) return Result<Unit>::error(e.error_category(), e.error_message());
    return Result<Unit>::ok(Unit{});
}

Result<Unit> RedisJobStore::set_status(const std::string& job_id, JobStatus status,
                                       int64_t updated_at_ms) {
    auto r = command({"EVAL", kSetStatusScript, "1", key("job:" + job_id),
                      job_status_to_string(status), std::to_string(updated_at_ms)});
    if (r.is_error()) return Result<Unit>::error(r.error_category(), r.error_message());
    if (r.value()->type == REDIS_REPLY_INTEGER && r.value()->integer == 0) {
        return Result<Unit>::error(ErrorCategory::NOT_FOUND, "Job metadata expired");
    }
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<JobMeta>> RedisJobStore::get_meta(const std::string& job_id) {
    using R = Result<std::optional<JobMeta>>;
    auto r = command({"HGETALL", key("job:" + job_id)});
    if (r.is_error()) return R::error(r.error_category(), r.error_message());

    const auto* reply = r.value().get();
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements == 0) return R::ok(std::nullopt);

    JobMeta meta;
    bool has_status = false;
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        const auto field = reply_string(reply->element[i]);
        const auto value = reply_string(reply->element[i + 1]);
        if (field == "owner_id") {
            meta.owner_id = value;
        } else if (field == "problem_id") {
            meta.problem_id = value;
        } else if (field == "status") {
            if (auto s = job_status_from_string(value)) {
                meta.status = *s;
                has_status = true;
            }
        } else if (field == "created_at") {
            meta.created_at_ms = utils::parse_int<int64_t>(value);
        } else if (field == "updated_at") {
            meta.updated_at_ms = utils::parse_int<int64_t>(value);
        }
    }
    if (!has_status) return R::ok(std::nullopt);
    return R::ok(std::move(meta));
}

Result<Unit> RedisJobStore::write_result(const std::string& job_id, const std::string& result,
                                         std::chrono::seconds ttl) {
    auto r = command({"SETEX", key("result:" + job_id), std::to_string(ttl.count()), result});
    if (r.is_error()) return Result<Unit>::error(r.error_category(), r.error_message());
    return Result<Unit>::ok(Unit{});
}

Result<std::optional<std::string>> RedisJobStore::get_result(const std::string& job_id) {
    using R = Result<std::optional<std::string>>;
    auto r = command({"GET", key("result:" + job_id)});
    if (r.is_error()) return R::error(r.error_category(), r.error_message());
    if (r.value()->type != REDIS_REPLY_STRING) return R::ok(std::nullopt);
    return R::ok(reply_string(r.value().get()));
}

Result<bool> RedisJobStore::remove_processing(const std::string& entry) {
    auto r = command({"LREM", key("processing"), "1", entry});
    if (r.is_error()) return Result<bool>::error(r.error_category(), r.error_message());
    return Result<bool>::ok(r.value()->type == REDIS_REPLY_INTEGER && r.value()->integer > 0);
}

Result<std::vector<std::string>> RedisJobStore::processing_entries() {
    using R = Result<std::vector<std::string>>;
    auto r = command({"LRANGE", key("processing"), "0", "-1"});
    if (r.is_error()) return R::error(r.error_category(), r.error_message());

    std::vector<std::string> entries;
    const auto* reply = r.value().get();
    if (reply->type == REDIS_REPLY_ARRAY) {
        entries.reserve(reply->elements);
        for (size_t i = 0; i < reply->elements; ++i) {
            if (reply->element[i]->type == REDIS_REPLY_STRING) {
                entries.push_back(reply_string(reply->element[i]));
            }
        }
    }
    return R::ok(std::move(entries));
}

Result<bool> RedisJobStore::requeue(const std::string& entry) {
    auto r = command({"EVAL", kRequeueScript, "2", key("processing"), key("queue"), entry});
    if (r.is_error()) return Result<bool>::error(r.error_category(), r.error_message());
    return Result<bool>::ok(r.value()->type == REDIS_REPLY_INTEGER && r.value()->integer == 1);
}

Result<bool> RedisJobStore::try_lock(const std::string& name, const std::string& token,
                                     std::chrono::milliseconds ttl) {
    auto r = command({"SET", key("lock:" + name), token, "NX", "PX", std::to_string(ttl.count())});
    if (r.is_error()) return Result<bool>::error(r.error_category(), r.error_message());
    return Result<bool>::ok(r.value()->type == REDIS_REPLY_STATUS);
}

Result<Unit> RedisJobStore::unlock(const std::string& name, const std::string& token) {
    auto r = command({"EVAL", kUnlockScript, "1", key("lock:" + name), token});
    if (r.is_error()) return Result<Unit>::error(r.error_category(), r.error_message());
    return Result<Unit>::ok(Unit{});
}

Result<Unit> RedisJobStore::ping() {
    auto r = command({"PING"});
    if (r.is_error()) return Result<Unit>::error(r.error_category(), r.error_message());
    return Result<Unit>::ok(Unit{});
}

} // namespace sqlsandbox

#endif // SQLSANDBOX_ENABLE_REDIS
