#include "cache/result_cache.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "executor/circuit_breaker.hpp"
#include "grading/grader.hpp"
#include "orchestrator/submission_orchestrator.hpp"
#include "orchestrator/submission_sink.hpp"
#include "problem/problem_repository.hpp"
#include "queue/job_queue.hpp"
#include "queue/memory_job_store.hpp"
#include "queue/worker.hpp"
#include "sandbox/dataset_resolver.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "security/query_validator.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "validation/hardcode_detector.hpp"
#include "validation/result_validator.hpp"

#ifdef SQLSANDBOX_ENABLE_REDIS
#include "queue/redis_job_store.hpp"
#endif

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <thread>

using namespace sqlsandbox;

namespace {

volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int signal) {
    g_signal = signal;
}

void print_usage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s [serve|worker] [config.toml]\n"
        "  serve   HTTP API plus in-process queue workers (default)\n"
        "  worker  queue workers only (redis backend)\n", argv0);
}

std::shared_ptr<IJobStore> make_job_store(const ServiceConfig& cfg) {
#ifdef SQLSANDBOX_ENABLE_REDIS
    if (cfg.queue.backend == "redis") {
        RedisJobStore::Config redis_cfg;
        redis_cfg.host = cfg.redis.host;
        redis_cfg.port = cfg.redis.port;
        redis_cfg.password = cfg.redis.password;
        redis_cfg.connect_timeout = std::chrono::milliseconds(cfg.redis.connect_timeout_ms);
        redis_cfg.key_prefix = cfg.queue.key_prefix;
        redis_cfg.max_idle_connections = std::max<size_t>(cfg.queue.workers + cfg.server.threads, 2);
        return std::make_shared<RedisJobStore>(redis_cfg);
    }
#endif
    return std::make_shared<MemoryJobStore>();
}

// Main thread parks here until SIGINT/SIGTERM
void wait_for_signal() {
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }
    utils::log::info(std::format("Received signal {}, shutting down...", static_cast<int>(g_signal)));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string mode = "serve";
        std::string config_file = "config/sqlsandbox.toml";
        int arg = 1;
        if (arg < argc && (std::string(argv[arg]) == "serve" || std::string(argv[arg]) == "worker")) {
            mode = argv[arg++];
        }
        if (arg < argc) {
            const std::string value = argv[arg++];
            if (value == "-h" || value == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            config_file = value;
        }
        if (arg < argc) {
            print_usage(argv[0]);
            return 2;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // =====================================================================
        // [1/6] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const auto& cfg = loaded.config;
        utils::log::set_level(utils::to_lower(cfg.logging.level));

        if (mode == "worker" && cfg.queue.backend != "redis") {
            utils::log::error("worker mode needs queue.backend = \"redis\"; the memory queue is process-local");
            return 1;
        }

        // =====================================================================
        // [2/6] Security validator + sandbox engine
        // =====================================================================
        utils::log::info("[2/6] Sandbox engine initializing...");
        QueryValidator::Config qv_cfg;
        qv_cfg.max_query_length = cfg.validator.max_query_length;
        auto query_validator = std::make_shared<const QueryValidator>(qv_cfg);

        LocalDatasetResolver::Config resolver_cfg;
        resolver_cfg.root = cfg.datasets.root;
        resolver_cfg.staging_dir = cfg.datasets.staging_dir;
        resolver_cfg.allowed_buckets = cfg.datasets.allowed_buckets;
        resolver_cfg.max_file_size_bytes = cfg.datasets.max_file_size_bytes;
        auto resolver = std::make_shared<LocalDatasetResolver>(resolver_cfg);

        SandboxEngine::Config engine_cfg;
        engine_cfg.sandbox.memory_limit = cfg.sandbox.memory_limit;
        engine_cfg.sandbox.threads = cfg.sandbox.threads;
        engine_cfg.sandbox.query_timeout = std::chrono::milliseconds(cfg.sandbox.query_timeout_ms);
        engine_cfg.sandbox.interrupt_grace = std::chrono::milliseconds(cfg.sandbox.interrupt_grace_ms);
        engine_cfg.sandbox.load_timeout = std::chrono::milliseconds(cfg.sandbox.load_timeout_ms);
        engine_cfg.sandbox.max_result_rows = cfg.sandbox.max_result_rows;
        engine_cfg.max_concurrent_sandboxes = cfg.sandbox.max_concurrent_sandboxes;
        engine_cfg.max_tables = cfg.sandbox.max_tables;
        auto engine = std::make_shared<SandboxEngine>(engine_cfg, resolver, query_validator);

        // =====================================================================
        // [3/6] Problems + grading
        // =====================================================================
        utils::log::info(std::format("[3/6] Problems from {}", cfg.problems.dir));
        auto problems = std::make_shared<FileProblemRepository>(
            FileProblemRepository::Config{cfg.problems.dir});

        ResultValidator::Config rv_cfg;
        rv_cfg.numeric_tolerance = cfg.validator.numeric_tolerance;
        rv_cfg.max_feedback_rows = cfg.validator.max_feedback_rows;
        auto result_validator = std::make_shared<const ResultValidator>(rv_cfg);

        HardcodeDetector::Config hd_cfg;
        hd_cfg.enabled = cfg.validator.anti_hardcode;
        hd_cfg.plan.fraction = cfg.validator.perturb_fraction;
        hd_cfg.plan.seed = cfg.validator.perturb_seed;
        auto detector = std::make_shared<const HardcodeDetector>(hd_cfg);

        Grader::Config grader_cfg;
        grader_cfg.pass_threshold = cfg.validator.pass_threshold;
        auto grader = std::make_shared<Grader>(grader_cfg, engine, problems, result_validator, detector);

        // =====================================================================
        // [4/6] Job queue + failover path
        // =====================================================================
        utils::log::info(std::format("[4/6] Job queue ({} backend)", cfg.queue.backend));
        JobQueue::Config queue_cfg;
        queue_cfg.poll_timeout = std::chrono::milliseconds(cfg.queue.poll_timeout_ms);
        queue_cfg.result_ttl = std::chrono::seconds(cfg.queue.result_ttl_seconds);
        queue_cfg.meta_ttl = std::chrono::seconds(cfg.queue.meta_ttl_seconds);
        queue_cfg.recovery_lock_ttl = std::chrono::milliseconds(cfg.queue.recovery_lock_ttl_ms);
        queue_cfg.recovery_min_age = std::chrono::seconds(cfg.queue.recovery_min_age_seconds);
        auto queue = std::make_shared<JobQueue>(queue_cfg, make_job_store(cfg));
        auto fallback_queue = std::make_shared<JobQueue>(queue_cfg, std::make_shared<MemoryJobStore>());

        CircuitBreaker::Config cb_cfg;
        cb_cfg.failure_threshold = static_cast<uint32_t>(cfg.circuit_breaker.failure_threshold);
        cb_cfg.success_threshold = static_cast<uint32_t>(cfg.circuit_breaker.success_threshold);
        cb_cfg.timeout = std::chrono::milliseconds(cfg.circuit_breaker.timeout_ms);
        cb_cfg.half_open_max_calls = static_cast<uint32_t>(cfg.circuit_breaker.half_open_max_calls);
        auto breaker = std::make_shared<CircuitBreaker>("job_queue", cb_cfg);

        ResultCache::Config cache_cfg;
        cache_cfg.enabled = cfg.cache.enabled;
        cache_cfg.max_entries = cfg.cache.max_entries;
        cache_cfg.num_shards = cfg.cache.num_shards;
        cache_cfg.ttl = std::chrono::seconds(cfg.cache.ttl_seconds);
        auto cache = std::make_shared<ResultCache>(cache_cfg);

        std::shared_ptr<ISubmissionSink> sink;
        if (!cfg.submissions.log.empty()) {
            sink = std::make_shared<JsonlSubmissionSink>(cfg.submissions.log);
        }

        SubmissionOrchestrator::Config orch_cfg;
        orch_cfg.max_sql_length = cfg.server.max_sql_length;
        auto orchestrator = std::make_shared<SubmissionOrchestrator>(orch_cfg, grader, queue,
            fallback_queue, breaker, query_validator, cache, sink);

        // =====================================================================
        // [5/6] Queue workers
        // =====================================================================
        QueueWorker::Config worker_cfg;
        worker_cfg.recovery_interval = std::chrono::seconds(cfg.queue.recovery_interval_seconds);
        WorkerPool workers(cfg.queue.workers, worker_cfg, queue,
            [orchestrator](const Job& job) { return orchestrator->process_job(job); });
        utils::log::info(std::format("[5/6] {} queue worker(s)", workers.size()));
        workers.start();

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        auto shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        if (mode == "worker") {
            utils::log::info("[6/6] Worker mode ready");
            wait_for_signal();
            shutdown->initiate_shutdown();
            workers.stop();
            engine->cleanup_all();
            const auto s = workers.stats();
            utils::log::info(std::format("Workers stopped: processed={} succeeded={} failed={}",
                s.processed, s.succeeded, s.failed));
            return 0;
        }

        // =====================================================================
        // [6/6] HTTP server
        // =====================================================================
        HttpServer::Config http_cfg;
        http_cfg.host = cfg.server.host;
        http_cfg.port = cfg.server.port;
        http_cfg.threads = cfg.server.threads;
        http_cfg.api_keys = cfg.server.api_keys;
        http_cfg.max_body_bytes = cfg.server.max_sql_length + 4096;
        auto server = std::make_shared<HttpServer>(http_cfg, orchestrator, queue, breaker, engine);
        server->set_shutdown_coordinator(shutdown);

        if (cfg.server.api_keys.empty()) {
            utils::log::warn("No API keys configured; every request will be rejected");
        }

        std::atomic<bool> server_failed{false};
        std::jthread server_thread([&server, &server_failed] {
            try {
                server->start();
            } catch (const std::exception& e) {
                utils::log::error(std::format("HTTP server: {}", e.what()));
                server_failed = true;
                g_signal = SIGTERM;
            }
        });
        utils::log::info(std::format("[6/6] Server ready on http://{}:{}", cfg.server.host, cfg.server.port));

        wait_for_signal();

        // Stop admitting requests, drain, then stop the rest
        shutdown->initiate_shutdown();
        if (shutdown->wait_for_drain()) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                shutdown->in_flight_count()));
        }
        server->stop();
        server_thread.join();
        workers.stop();
        engine->cleanup_all();
        utils::log::info("SQL sandbox service stopped");
        return server_failed ? 1 : 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
