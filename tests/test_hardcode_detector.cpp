#include <catch2/catch_test_macros.hpp>
#include "validation/hardcode_detector.hpp"
#include "mocks/sandbox_fixture.hpp"

using namespace sqlsandbox;
using sqlsandbox::testing::SandboxFixture;

namespace {

struct Run {
    ResultSet baseline;
    HardcodeDetector::Verdict verdict;
};

Run check(const HardcodeDetector& detector, Sandbox& sandbox, const std::string& sql) {
    auto baseline = sandbox.execute(sql);
    REQUIRE(baseline.is_ok());
    Run run;
    run.baseline = baseline.value();
    run.verdict = detector.check(sandbox, sql, run.baseline);
    return run;
}

} // anonymous namespace

TEST_CASE("HardcodeDetector: constant answer is flagged", "[hardcode_detector]") {
    SandboxFixture fx;
    auto sandbox = fx.engine->prepare("alice", "p1", SandboxFixture::orders_only()).value().sandbox;
    HardcodeDetector detector;

    auto run = check(detector, *sandbox, "SELECT 42 AS total");
    CHECK(run.verdict.checked);
    CHECK(run.verdict.low_confidence);
    CHECK(run.verdict.note == HardcodeDetector::kLowConfidenceNote);
}

TEST_CASE("HardcodeDetector: data-dependent answer passes", "[hardcode_detector]") {
    SandboxFixture fx;
    auto sandbox = fx.engine->prepare("alice", "p1", SandboxFixture::orders_only()).value().sandbox;
    HardcodeDetector detector;

    auto run = check(detector, *sandbox, "SELECT region, SUM(amount) AS total FROM orders GROUP BY region");
    CHECK(run.verdict.checked);
    CHECK_FALSE(run.verdict.low_confidence);
    CHECK(run.verdict.note.empty());

    // Baseline data is untouched afterwards
    auto after = sandbox->execute("SELECT SUM(amount) FROM orders");
    REQUIRE(after.is_ok());
    CHECK(std::get<double>(after.value().rows[0][0]) == 800.25);
}

TEST_CASE("HardcodeDetector: disabled detector does nothing", "[hardcode_detector]") {
    SandboxFixture fx;
    auto sandbox = fx.engine->prepare("alice", "p1", SandboxFixture::orders_only()).value().sandbox;
    HardcodeDetector detector(HardcodeDetector::Config{.enabled = false, .plan = {}});

    auto run = check(detector, *sandbox, "SELECT 42 AS total");
    CHECK_FALSE(run.verdict.checked);
    CHECK_FALSE(run.verdict.low_confidence);
    CHECK_FALSE(detector.enabled());
}

TEST_CASE("HardcodeDetector: sandbox without data is skipped, not flagged", "[hardcode_detector]") {
    SandboxFixture fx;
    auto sandbox = fx.engine->acquire("alice", "p1").value();
    HardcodeDetector detector;

    auto run = check(detector, *sandbox, "SELECT 42 AS total");
    CHECK_FALSE(run.verdict.checked);
    CHECK_FALSE(run.verdict.low_confidence);
    CHECK_FALSE(run.verdict.note.empty());
}
