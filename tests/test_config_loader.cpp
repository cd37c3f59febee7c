#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/temp_dir.hpp"

#include <algorithm>
#include <cstdlib>

using namespace sqlsandbox;
using sqlsandbox::testing::TempDir;

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
    return std::ranges::any_of(errors, [&](const std::string& e) {
        return e.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.api_keys.empty());
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.sandbox.memory_limit == "128MB");
    CHECK(cfg.sandbox.max_result_rows == 1000);
    CHECK(cfg.validator.pass_threshold == 95.0);
    CHECK(cfg.validator.anti_hardcode);
    CHECK(cfg.queue.backend == "memory");
    CHECK(cfg.queue.recovery_min_age_seconds == 300);
    CHECK(cfg.cache.enabled);
    CHECK(cfg.circuit_breaker.failure_threshold == 5);
    CHECK(cfg.datasets.allowed_buckets.empty());
    CHECK(cfg.submissions.log == "data/submissions.jsonl");
}

TEST_CASE("ConfigLoader: every section is read", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 8
max_sql_length = 5000
shutdown_timeout_ms = 1500

[server.api_keys]
"key-alice" = "alice"
"key-bob" = "bob"

[logging]
level = "warn"

[sandbox]
memory_limit = "256MB"
threads = 2
query_timeout_ms = 5000
interrupt_grace_ms = 500
max_result_rows = 200
max_concurrent_sandboxes = 3
max_tables = 8

[validator]
numeric_tolerance = 0.01
pass_threshold = 90.0
anti_hardcode = false
perturb_fraction = 0.05
perturb_seed = 7

[queue]
poll_timeout_ms = 250
result_ttl_seconds = 60
meta_ttl_seconds = 600
recovery_min_age_seconds = 600
workers = 4
key_prefix = "grading"

[cache]
enabled = false

[circuit_breaker]
failure_threshold = 3
timeout_ms = 2000

[datasets]
root = "/srv/datasets"
staging_dir = "/tmp/staging"
allowed_buckets = ["course", "public"]
max_file_size_bytes = 1024

[problems]
dir = "/srv/problems"

[submissions]
log = ""
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.threads == 8);
    CHECK(cfg.server.max_sql_length == 5000);
    CHECK(cfg.server.shutdown_timeout_ms == 1500);
    REQUIRE(cfg.server.api_keys.size() == 2);
    CHECK(cfg.server.api_keys.at("key-alice") == "alice");

    CHECK(cfg.logging.level == "warn");

    CHECK(cfg.sandbox.memory_limit == "256MB");
    CHECK(cfg.sandbox.threads == 2);
    CHECK(cfg.sandbox.query_timeout_ms == 5000);
    CHECK(cfg.sandbox.interrupt_grace_ms == 500);
    CHECK(cfg.sandbox.max_result_rows == 200);
    CHECK(cfg.sandbox.max_concurrent_sandboxes == 3);
    CHECK(cfg.sandbox.max_tables == 8);

    CHECK(cfg.validator.numeric_tolerance == 0.01);
    CHECK(cfg.validator.pass_threshold == 90.0);
    CHECK_FALSE(cfg.validator.anti_hardcode);
    CHECK(cfg.validator.perturb_fraction == 0.05);
    CHECK(cfg.validator.perturb_seed == 7);

    CHECK(cfg.queue.poll_timeout_ms == 250);
    CHECK(cfg.queue.result_ttl_seconds == 60);
    CHECK(cfg.queue.meta_ttl_seconds == 600);
    CHECK(cfg.queue.recovery_min_age_seconds == 600);
    CHECK(cfg.queue.workers == 4);
    CHECK(cfg.queue.key_prefix == "grading");

    CHECK_FALSE(cfg.cache.enabled);
    CHECK(cfg.circuit_breaker.failure_threshold == 3);
    CHECK(cfg.circuit_breaker.timeout_ms == 2000);
    CHECK(cfg.circuit_breaker.success_threshold == 2);

    CHECK(cfg.datasets.root == "/srv/datasets");
    CHECK(cfg.datasets.staging_dir == "/tmp/staging");
    CHECK(cfg.datasets.allowed_buckets == std::vector<std::string>{"course", "public"});
    CHECK(cfg.datasets.max_file_size_bytes == 1024);
    CHECK(cfg.problems.dir == "/srv/problems");
    CHECK(cfg.submissions.log.empty());
}

TEST_CASE("ConfigLoader: backend name is case-insensitive", "[config]") {
    auto result = ConfigLoader::load_from_string("[queue]\nbackend = \"MEMORY\"\n");
    REQUIRE(result.success);
    CHECK(result.config.queue.backend == "memory");
}

TEST_CASE("ConfigLoader: malformed TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = 1");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("ConfigLoader: ${VAR} expands from the environment", "[config][env]") {
    ::setenv("SQLSANDBOX_TEST_REDIS_PASSWORD", "s3cret", 1);
    ::unsetenv("SQLSANDBOX_TEST_UNSET_XYZ");

    const std::string toml = R"(
[redis]
password = "${SQLSANDBOX_TEST_REDIS_PASSWORD}"

[datasets]
root = "/data/${SQLSANDBOX_TEST_UNSET_XYZ}sets"
allowed_buckets = ["${SQLSANDBOX_TEST_REDIS_PASSWORD}-bucket"]
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.redis.password == "s3cret");
    CHECK(result.config.datasets.root == "/data/sets");
    CHECK(result.config.datasets.allowed_buckets == std::vector<std::string>{"s3cret-bucket"});

    ::unsetenv("SQLSANDBOX_TEST_REDIS_PASSWORD");
}

TEST_CASE("ConfigLoader: unclosed ${ is an error", "[config][env]") {
    auto result = ConfigLoader::load_from_string("[redis]\npassword = \"${UNCLOSED\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var substitution") != std::string::npos);
}

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("ConfigLoader: included file merges under the main file", "[config][include]") {
    TempDir tmp;
    tmp.write("keys.toml", R"(
[server]
port = 7000

[server.api_keys]
"key-included" = "carol"

[datasets]
allowed_buckets = ["shared"]
)");
    const auto main_path = tmp.write("main.toml", R"(
include = "keys.toml"

[server]
port = 9000

[datasets]
allowed_buckets = ["course"]
)");

    auto result = ConfigLoader::load_from_file(main_path.string());
    REQUIRE(result.success);
    CHECK(result.config.server.port == 9000);
    CHECK(result.config.server.api_keys.at("key-included") == "carol");
    CHECK(result.config.datasets.allowed_buckets ==
          std::vector<std::string>{"shared", "course"});
}

TEST_CASE("ConfigLoader: circular include is rejected", "[config][include]") {
    TempDir tmp;
    tmp.write("a.toml", "include = \"b.toml\"\n");
    tmp.write("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path() / "a.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular config include") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file fails to load", "[config][include]") {
    TempDir tmp;
    auto result = ConfigLoader::load_from_file((tmp.path() / "absent.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config:"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: semantic errors are collected", "[config][validation]") {
    const std::string toml = R"(
[server]
port = 70000

[logging]
level = "chatty"

[queue]
backend = "kafka"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("server.port must be 1-65535") != std::string::npos);
    CHECK(result.error_message.find("logging.level must be info, warn or error, got 'chatty'") !=
          std::string::npos);
    CHECK(result.error_message.find("queue.backend must be 'memory' or 'redis', got 'kafka'") !=
          std::string::npos);
}

TEST_CASE("ConfigLoader: validate_config checks ranges", "[config][validation]") {
    ServiceConfig cfg;
    CHECK(ConfigLoader::validate_config(cfg).empty());

    SECTION("Pass threshold") {
        cfg.validator.pass_threshold = 120.0;
        CHECK(has_error(ConfigLoader::validate_config(cfg),
                        "validator.pass_threshold must be between 0 and 100"));
    }
    SECTION("Perturbation fraction") {
        cfg.validator.perturb_fraction = 0.0;
        CHECK(has_error(ConfigLoader::validate_config(cfg), "validator.perturb_fraction must be in (0, 1]"));
    }
    SECTION("Result outlives its metadata") {
        cfg.queue.result_ttl_seconds = 600;
        cfg.queue.meta_ttl_seconds = 60;
        CHECK(has_error(ConfigLoader::validate_config(cfg),
                        "queue.meta_ttl_seconds must be >= queue.result_ttl_seconds"));
    }
    SECTION("Recovery lease shorter than a grading run") {
        cfg.queue.recovery_min_age_seconds = 0;
        CHECK(has_error(ConfigLoader::validate_config(cfg),
                        "queue.recovery_min_age_seconds must exceed the longest grading run (184000 ms)"));
        cfg.queue.recovery_min_age_seconds = 185;
        CHECK(ConfigLoader::validate_config(cfg).empty());
        cfg.sandbox.load_timeout_ms = 600000;
        CHECK(has_error(ConfigLoader::validate_config(cfg), "queue.recovery_min_age_seconds must exceed"));
    }
    SECTION("Enabled cache without capacity") {
        cfg.cache.max_entries = 0;
        CHECK(has_error(ConfigLoader::validate_config(cfg), "cache.max_entries must be > 0 when enabled"));
        cfg.cache.enabled = false;
        CHECK(ConfigLoader::validate_config(cfg).empty());
    }
    SECTION("Sandbox limits") {
        cfg.sandbox.max_result_rows = 0;
        cfg.sandbox.query_timeout_ms = 0;
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(has_error(errors, "sandbox.max_result_rows must be > 0"));
        CHECK(has_error(errors, "sandbox.query_timeout_ms must be > 0"));
    }
}

#ifndef SQLSANDBOX_ENABLE_REDIS
TEST_CASE("ConfigLoader: redis backend needs a redis build", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[queue]\nbackend = \"redis\"\n");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("requires a build with SQLSANDBOX_ENABLE_REDIS") != std::string::npos);
}
#endif
