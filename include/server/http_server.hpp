#pragma once

#include "core/error.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlsandbox {

class SubmissionOrchestrator;
class JobQueue;
class CircuitBreaker;
class SandboxEngine;
class ShutdownCoordinator;

/**
 * @brief HTTP front end of the grading service
 *
 * Routes:
 *   POST /api/submit       {"problem_id", "sql"}                    -> 202 job receipt
 *   GET  /api/jobs/<id>                                             -> status (+ result)
 *   POST /api/test         {"problem_id", "sql", "include_hidden"}  -> grade report
 *   GET  /health
 *
 * Caller identity comes from "Authorization: Bearer <api key>", mapped to a
 * user id by the configured key table. Handlers are public so they can be
 * driven in-process without a socket.
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        size_t threads = 4;
        size_t max_body_bytes = 65536;
        std::unordered_map<std::string, std::string> api_keys;     // key -> user id
    };

    HttpServer(const Config& config,
               std::shared_ptr<SubmissionOrchestrator> orchestrator,
               std::shared_ptr<JobQueue> queue,
               std::shared_ptr<CircuitBreaker> breaker,
               std::shared_ptr<SandboxEngine> engine);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve; blocks until stop()
     * @throws std::runtime_error if the socket cannot be bound
     */
    void start();
    void stop();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_submit(const httplib::Request& req, httplib::Response& res);
    void handle_job_status(const httplib::Request& req, httplib::Response& res);
    void handle_test(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    struct HttpStats {
        uint64_t requests;
        uint64_t auth_rejects;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    // Bearer key -> user id; writes the 401 itself on failure
    std::optional<std::string> authenticate(const httplib::Request& req, httplib::Response& res);
    void register_routes(httplib::Server& svr);

    // Wraps a handler with the in-flight guard and a 503 once draining
    template <typename Fn>
    void guarded(httplib::Response& res, Fn&& fn);

    Config config_;
    std::shared_ptr<SubmissionOrchestrator> orchestrator_;
    std::shared_ptr<JobQueue> queue_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<SandboxEngine> engine_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> auth_rejects_{0};
};

} // namespace sqlsandbox
