#include "server/http_server.hpp"
#include "core/utils.hpp"
#include "executor/circuit_breaker.hpp"
#include "grading/report_json.hpp"
#include "orchestrator/submission_orchestrator.hpp"
#include "queue/job_queue.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

#include <format>
#include <stdexcept>

namespace sqlsandbox {

namespace {

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        // Still touch b so the work does not depend on where the sizes differ
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= static_cast<unsigned char>(b[i]);
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), http::kJsonContentType);
}

void send_error(httplib::Response& res, ErrorCategory category, const std::string& message) {
    send_json(res, http::status_for(category), {
        {"success", false},
        {"error", message},
        {"error_category", error_category_to_string(category)},
    });
}

struct SqlRequest {
    std::string problem_id;
    std::string sql;
    bool include_hidden = false;
};

Result<SqlRequest> parse_sql_request(const std::string& body, size_t max_body_bytes) {
    using R = Result<SqlRequest>;
    if (body.size() > max_body_bytes) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Request body too large");
    }
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "Request body must be a JSON object");
    }

    SqlRequest parsed;
    const auto problem = json.find("problem_id");
    const auto sql = json.find("sql");
    if (problem == json.end() || !problem->is_string()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "problem_id must be a string");
    }
    if (sql == json.end() || !sql->is_string()) {
        return R::error(ErrorCategory::INVALID_REQUEST, "sql must be a string");
    }
    parsed.problem_id = problem->get<std::string>();
    parsed.sql = sql->get<std::string>();

    if (const auto hidden = json.find("include_hidden"); hidden != json.end()) {
        if (!hidden->is_boolean()) {
            return R::error(ErrorCategory::INVALID_REQUEST, "include_hidden must be a boolean");
        }
        parsed.include_hidden = hidden->get<bool>();
    }
    return R::ok(std::move(parsed));
}

nlohmann::json status_to_json(const JobStatusView& view) {
    nlohmann::json body = {
        {"success", true},
        {"job_id", view.job_id},
        {"status", job_status_to_string(view.status)},
    };
    if (view.result) {
        const auto& r = *view.result;
        nlohmann::json result = {
            {"success", r.success},
            {"completed_at_ms", r.completed_at_ms},
        };
        if (r.success) {
            result["report"] = r.payload;
        } else {
            result["error"] = r.error;
            result["error_category"] = error_category_to_string(r.error_category);
        }
        body["result"] = std::move(result);
    } else if (is_terminal(view.status)) {
        body["result"] = nullptr;
        body["note"] = "Result expired";
    }
    return body;
}

} // anonymous namespace

HttpServer::HttpServer(const Config& config,
                       std::shared_ptr<SubmissionOrchestrator> orchestrator,
                       std::shared_ptr<JobQueue> queue,
                       std::shared_ptr<CircuitBreaker> breaker,
                       std::shared_ptr<SandboxEngine> engine)
    : config_(config),
      orchestrator_(std::move(orchestrator)),
      queue_(std::move(queue)),
      breaker_(std::move(breaker)),
      engine_(std::move(engine)) {}

HttpServer::~HttpServer() = default;

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        auth_rejects_.load(std::memory_order_relaxed),
    };
}

std::optional<std::string> HttpServer::authenticate(const httplib::Request& req, httplib::Response& res) {
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() > http::kBearerPrefix.size() &&
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) == http::kBearerPrefix) {
        const auto token = std::string_view(auth).substr(http::kBearerPrefix.size());
        for (const auto& [key, user] : config_.api_keys) {
            if (constant_time_equals(token, key)) return user;
        }
    }
    auth_rejects_.fetch_add(1, std::memory_order_relaxed);
    res.status = httplib::StatusCode::Unauthorized_401;
    res.set_content(R"({"success":false,"error":"Unauthorized"})", http::kJsonContentType);
    return std::nullopt;
}

template <typename Fn>
void HttpServer::guarded(httplib::Response& res, Fn&& fn) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    if (!shutdown_coordinator_) {
        fn();
        return;
    }
    ShutdownCoordinator::RequestGuard guard(*shutdown_coordinator_);
    if (!guard.admitted()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(R"({"success":false,"error":"Server is shutting down"})", http::kJsonContentType);
        return;
    }
    fn();
}

// ============================================================================
// start() / stop()
// ============================================================================

void HttpServer::start() {
    auto svr_ptr = std::make_unique<httplib::Server>();
    auto& svr = *svr_ptr;

    const size_t pool_size = std::max<size_t>(config_.threads, 1);
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_body_bytes);

    register_routes(svr);

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        server_ = std::move(svr_ptr);
    }

    if (shutdown_coordinator_ && shutdown_coordinator_->is_shutting_down()) return;

    utils::log::info(std::format("Starting SQL sandbox server on {}:{} ({} threads)",
        config_.host, config_.port, pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to bind {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (server_ && server_->is_running()) {
        server_->stop();
        utils::log::info("HTTP server stopped");
    }
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kSubmitRoute, [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] { handle_submit(req, res); });
    });
    svr.Get(http::kJobRoute, [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] { handle_job_status(req, res); });
    });
    svr.Post(http::kTestRoute, [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] { handle_test(req, res); });
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        utils::log::error(std::format("Unhandled exception on {} {}: {}", req.method, req.path, what));
        send_error(res, ErrorCategory::INTERNAL_ERROR, "Internal server error");
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_submit(const httplib::Request& req, httplib::Response& res) {
    const auto user = authenticate(req, res);
    if (!user) return;

    auto parsed = parse_sql_request(req.body, config_.max_body_bytes);
    if (parsed.is_error()) {
        send_error(res, parsed.error_category(), parsed.error_message());
        return;
    }

    auto receipt = orchestrator_->submit(*user, parsed.value().problem_id, parsed.value().sql);
    if (receipt.is_error()) {
        send_error(res, receipt.error_category(), receipt.error_message());
        return;
    }

    const auto& r = receipt.value();
    send_json(res, r.synchronous ? 200 : 202, {
        {"success", true},
        {"job_id", r.job_id},
        {"status", job_status_to_string(r.status)},
        {"synchronous", r.synchronous},
    });
}

void HttpServer::handle_job_status(const httplib::Request& req, httplib::Response& res) {
    const auto user = authenticate(req, res);
    if (!user) return;

    if (req.matches.size() < 2) {
        send_error(res, ErrorCategory::INVALID_REQUEST, "Missing job id");
        return;
    }
    const std::string job_id = req.matches[1];

    auto view = orchestrator_->poll(job_id, *user);
    if (view.is_error()) {
        send_error(res, view.error_category(), view.error_message());
        return;
    }
    send_json(res, 200, status_to_json(view.value()));
}

void HttpServer::handle_test(const httplib::Request& req, httplib::Response& res) {
    const auto user = authenticate(req, res);
    if (!user) return;

    auto parsed = parse_sql_request(req.body, config_.max_body_bytes);
    if (parsed.is_error()) {
        send_error(res, parsed.error_category(), parsed.error_message());
        return;
    }

    const auto& p = parsed.value();
    auto report = orchestrator_->test(*user, p.problem_id, p.sql, p.include_hidden);
    if (report.is_error()) {
        send_error(res, report.error_category(), report.error_message());
        return;
    }

    auto body = grade_report_to_json(report.value());
    body["success"] = true;
    send_json(res, 200, body);
}

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    bool healthy = true;
    nlohmann::json checks = nlohmann::json::object();

    if (queue_) {
        auto ping = queue_->ping();
        checks["queue"] = ping.is_ok() ? "ok" : ping.error_message();
        // An unavailable queue degrades to synchronous grading, not an outage
    }
    if (breaker_) {
        checks["queue_circuit"] = circuit_state_to_string(breaker_->get_state());
    }
    if (engine_) {
        const auto s = engine_->stats();
        checks["sandboxes"] = {
            {"live", s.live}, {"created", s.created}, {"reused", s.reused}, {"evicted", s.evicted},
        };
    }
    if (shutdown_coordinator_ && shutdown_coordinator_->is_shutting_down()) {
        healthy = false;
        checks["shutdown"] = "draining";
    }

    send_json(res, healthy ? 200 : 503, {
        {"status", healthy ? "healthy" : "unhealthy"},
        {"service", "sqlsandbox"},
        {"checks", std::move(checks)},
    });
}

} // namespace sqlsandbox
