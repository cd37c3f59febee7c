#include <catch2/catch_test_macros.hpp>
#include "orchestrator/submission_orchestrator.hpp"
#include "queue/worker.hpp"
#include "mocks/flaky_job_store.hpp"
#include "mocks/in_memory_problem_repository.hpp"
#include "mocks/recording_submission_sink.hpp"
#include "mocks/sandbox_fixture.hpp"

using namespace sqlsandbox;
using namespace sqlsandbox::testing;

namespace {

constexpr const char* kCorrectSql = "SELECT region, SUM(amount) AS total FROM orders GROUP BY region";

struct OrchestratorFixture {
    SandboxFixture sandboxes;
    std::shared_ptr<InMemoryProblemRepository> problems = std::make_shared<InMemoryProblemRepository>();
    std::shared_ptr<FlakyJobStore> store = std::make_shared<FlakyJobStore>();
    std::shared_ptr<JobQueue> queue;
    std::shared_ptr<JobQueue> fallback;
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<RecordingSubmissionSink> sink = std::make_shared<RecordingSubmissionSink>();
    std::shared_ptr<SubmissionOrchestrator> orchestrator;

    explicit OrchestratorFixture(uint32_t failure_threshold = 5) {
        ProblemDefinition def;
        def.id = "revenue";
        def.datasets = SandboxFixture::orders_only();
        TestCase main_case;
        main_case.id = "main";
        main_case.name = "main";
        ResultSet expected;
        expected.columns = {"region", "total"};
        expected.rows = {{std::string("North"), 800.25}};
        main_case.expected = expected;
        def.test_cases.push_back(main_case);
        problems->put(def);

        JobQueue::Config queue_config;
        queue_config.poll_timeout = std::chrono::milliseconds(20);
        queue = std::make_shared<JobQueue>(queue_config, store);
        fallback = std::make_shared<JobQueue>(queue_config, std::make_shared<MemoryJobStore>());

        CircuitBreaker::Config breaker_config;
        breaker_config.failure_threshold = failure_threshold;
        breaker_config.timeout = std::chrono::seconds(60);
        breaker = std::make_shared<CircuitBreaker>("job_queue", breaker_config);

        cache = std::make_shared<ResultCache>(ResultCache::Config{});

        auto grader = std::make_shared<Grader>(Grader::Config{}, sandboxes.engine, problems,
                                               std::make_shared<ResultValidator>(),
                                               std::make_shared<HardcodeDetector>());
        orchestrator = std::make_shared<SubmissionOrchestrator>(
            SubmissionOrchestrator::Config{.max_sql_length = 200},
            grader, queue, fallback, breaker, sandboxes.validator, cache, sink);
    }

    Result<bool> run_worker_once() {
        QueueWorker worker(QueueWorker::Config{}, queue, [this](const Job& job) {
            return orchestrator->process_job(job);
        });
        return worker.process_one();
    }
};

} // anonymous namespace

// ============================================================================
// submit / poll
// ============================================================================

TEST_CASE("SubmissionOrchestrator: queued submission is graded by a worker", "[orchestrator]") {
    OrchestratorFixture fx;

    auto receipt = fx.orchestrator->submit("alice", "revenue", kCorrectSql);
    REQUIRE(receipt.is_ok());
    CHECK_FALSE(receipt.value().synchronous);
    CHECK(receipt.value().status == JobStatus::QUEUED);
    const auto job_id = receipt.value().job_id;

    auto pending = fx.orchestrator->poll(job_id, "alice");
    REQUIRE(pending.is_ok());
    CHECK(pending.value().status == JobStatus::QUEUED);

    auto processed = fx.run_worker_once();
    REQUIRE(processed.is_ok());
    REQUIRE(processed.value());

    auto done = fx.orchestrator->poll(job_id, "alice");
    REQUIRE(done.is_ok());
    CHECK(done.value().status == JobStatus::COMPLETED);
    REQUIRE(done.value().result.has_value());
    CHECK(done.value().result->payload["outcome"]["is_correct"] == true);
    CHECK(done.value().result->payload["outcome"]["score"] == 100.0);

    const auto records = fx.sink->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].job_id == job_id);
    CHECK(records[0].user_id == "alice");
    CHECK_FALSE(records[0].synchronous);
    REQUIRE(records[0].report.has_value());
    CHECK(records[0].report->outcome.is_correct);
}

TEST_CASE("SubmissionOrchestrator: grading failure becomes a failed job", "[orchestrator]") {
    OrchestratorFixture fx;

    auto receipt = fx.orchestrator->submit("alice", "revenue", "SELECT nope FROM orders");
    REQUIRE(receipt.is_ok());
    REQUIRE(fx.run_worker_once().value());

    auto done = fx.orchestrator->poll(receipt.value().job_id, "alice");
    REQUIRE(done.is_ok());
    CHECK(done.value().status == JobStatus::FAILED);
    REQUIRE(done.value().result.has_value());
    CHECK(done.value().result->error_category == ErrorCategory::ENGINE_ERROR);

    const auto records = fx.sink->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].error_category == ErrorCategory::ENGINE_ERROR);
    CHECK_FALSE(records[0].report.has_value());
}

TEST_CASE("SubmissionOrchestrator: screening rejects before enqueue", "[orchestrator]") {
    OrchestratorFixture fx;

    SECTION("Chained destructive statement") {
        auto r = fx.orchestrator->submit("alice", "revenue", "SELECT * FROM orders; DROP TABLE orders;");
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::SECURITY_REJECTED);
    }
    SECTION("Missing fields") {
        CHECK(fx.orchestrator->submit("", "revenue", "SELECT 1").error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(fx.orchestrator->submit("alice", "", "SELECT 1").error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(fx.orchestrator->submit("alice", "revenue", "  \n ").error_category() == ErrorCategory::INVALID_REQUEST);
    }
    SECTION("Oversized text") {
        auto r = fx.orchestrator->submit("alice", "revenue", "SELECT " + std::string(300, '1'));
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_REQUEST);
    }

    CHECK(fx.store->inner().queue_length() == 0);
    CHECK(fx.orchestrator->stats().rejected >= 1);
    CHECK(fx.orchestrator->stats().submitted == 0);
}

TEST_CASE("SubmissionOrchestrator: poll is owner-only", "[orchestrator]") {
    OrchestratorFixture fx;
    auto receipt = fx.orchestrator->submit("alice", "revenue", kCorrectSql);
    REQUIRE(receipt.is_ok());

    auto foreign = fx.orchestrator->poll(receipt.value().job_id, "mallory");
    REQUIRE(foreign.is_error());
    CHECK(foreign.error_category() == ErrorCategory::NOT_FOUND);

    auto unknown = fx.orchestrator->poll("no-such-job", "alice");
    REQUIRE(unknown.is_error());
    CHECK(unknown.error_category() == ErrorCategory::NOT_FOUND);
}

// ============================================================================
// Failover
// ============================================================================

TEST_CASE("SubmissionOrchestrator: unavailable queue grades synchronously", "[orchestrator][failover]") {
    OrchestratorFixture fx(1);
    fx.store->set_available(false);

    auto receipt = fx.orchestrator->submit("alice", "revenue", kCorrectSql);
    REQUIRE(receipt.is_ok());
    CHECK(receipt.value().synchronous);
    CHECK(receipt.value().status == JobStatus::COMPLETED);
    CHECK(fx.breaker->get_state() == CircuitState::OPEN);

    // Result resolves through poll although the queue is still down
    auto view = fx.orchestrator->poll(receipt.value().job_id, "alice");
    REQUIRE(view.is_ok());
    CHECK(view.value().status == JobStatus::COMPLETED);
    REQUIRE(view.value().result.has_value());
    CHECK(view.value().result->payload["outcome"]["is_correct"] == true);

    const auto records = fx.sink->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].synchronous);

    // Open circuit: the backend is not even tried
    const auto calls_before = fx.store->calls_while_down();
    auto second = fx.orchestrator->submit("alice", "revenue", kCorrectSql);
    REQUIRE(second.is_ok());
    CHECK(second.value().synchronous);
    CHECK(second.value().job_id != receipt.value().job_id);
    CHECK(fx.store->calls_while_down() == calls_before);

    CHECK(fx.orchestrator->stats().failovers == 2);
    CHECK(fx.breaker->get_stats().rejected_count == 1);
}

TEST_CASE("SubmissionOrchestrator: synchronous failure is still recorded", "[orchestrator][failover]") {
    OrchestratorFixture fx;
    fx.store->set_available(false);

    auto receipt = fx.orchestrator->submit("alice", "unknown-problem", kCorrectSql);
    REQUIRE(receipt.is_ok());
    CHECK(receipt.value().synchronous);
    CHECK(receipt.value().status == JobStatus::FAILED);

    auto view = fx.orchestrator->poll(receipt.value().job_id, "alice");
    REQUIRE(view.is_ok());
    CHECK(view.value().status == JobStatus::FAILED);
    REQUIRE(view.value().result.has_value());
    CHECK(view.value().result->error_category == ErrorCategory::NOT_FOUND);
}

// ============================================================================
// Practice mode
// ============================================================================

TEST_CASE("SubmissionOrchestrator: practice runs are cached per normalized query", "[orchestrator][cache]") {
    OrchestratorFixture fx;

    auto first = fx.orchestrator->test("alice", "revenue", kCorrectSql, false);
    REQUIRE(first.is_ok());
    CHECK(first.value().outcome.is_correct);
    CHECK_FALSE(first.value().cached);

    auto same = fx.orchestrator->test("alice", "revenue",
        "select   region, sum(amount) as total\nfrom orders group by region", false);
    REQUIRE(same.is_ok());
    CHECK(same.value().cached);
    CHECK(same.value().outcome.score == first.value().outcome.score);

    auto with_hidden = fx.orchestrator->test("alice", "revenue", kCorrectSql, true);
    REQUIRE(with_hidden.is_ok());
    CHECK_FALSE(with_hidden.value().cached);

    auto other_user = fx.orchestrator->test("bob", "revenue", kCorrectSql, false);
    REQUIRE(other_user.is_ok());
    CHECK_FALSE(other_user.value().cached);

    CHECK(fx.cache->get_stats().hits == 1);
    CHECK(fx.orchestrator->stats().tests == 4);
    // Practice runs are not submissions
    CHECK(fx.sink->records().empty());
}

TEST_CASE("SubmissionOrchestrator: practice errors are returned, not cached", "[orchestrator][cache]") {
    OrchestratorFixture fx;

    auto rejected = fx.orchestrator->test("alice", "revenue", "DROP TABLE orders", false);
    REQUIRE(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::SECURITY_REJECTED);

    auto failed = fx.orchestrator->test("alice", "revenue", "SELECT nope FROM orders", false);
    REQUIRE(failed.is_error());
    CHECK(failed.error_category() == ErrorCategory::ENGINE_ERROR);
    CHECK(fx.cache->get_stats().current_entries == 0);
}
