#pragma once

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

// ============================================================================
// Section configs (mirror the TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 4;
    size_t max_sql_length = 10000;
    uint32_t shutdown_timeout_ms = 30000;
    std::unordered_map<std::string, std::string> api_keys;     // key -> user id
};

struct LoggingConfig {
    std::string level = "info";
};

struct SandboxSectionConfig {
    std::string memory_limit = "128MB";
    int threads = 1;
    int64_t query_timeout_ms = 30000;
    int64_t interrupt_grace_ms = 2000;
    int64_t load_timeout_ms = 120000;
    size_t max_result_rows = 1000;
    size_t max_concurrent_sandboxes = 10;
    size_t max_tables = 20;
};

struct ValidatorConfig {
    size_t max_query_length = 10000;
    double numeric_tolerance = 0.001;
    size_t max_feedback_rows = 3;
    double pass_threshold = 95.0;
    bool anti_hardcode = true;
    double perturb_fraction = 0.015;
    uint64_t perturb_seed = 1337;
};

struct QueueConfig {
    std::string backend = "memory";     // "memory" | "redis"
    int64_t poll_timeout_ms = 1000;
    int64_t result_ttl_seconds = 300;
    int64_t meta_ttl_seconds = 3600;
    int64_t recovery_lock_ttl_ms = 30000;
    int64_t recovery_min_age_seconds = 300;
    int64_t recovery_interval_seconds = 60;
    size_t workers = 2;
    std::string key_prefix = "sqlsandbox";
};

struct RedisConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int64_t connect_timeout_ms = 2000;
    std::string password;
};

struct CacheConfig {
    bool enabled = true;
    size_t max_entries = 5000;
    size_t num_shards = 16;
    int64_t ttl_seconds = 300;
};

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    int success_threshold = 2;
    int timeout_ms = 10000;
    int half_open_max_calls = 1;
};

struct DatasetsConfig {
    std::string root = "data/datasets";
    std::string staging_dir = "data/staging";
    std::vector<std::string> allowed_buckets;   // Empty: any bucket under root
    uint64_t max_file_size_bytes = 104857600;
};

struct ProblemsConfig {
    std::string dir = "data/problems";
};

struct SubmissionsConfig {
    std::string log = "data/submissions.jsonl";     // Empty disables the JSONL sink
};

// ============================================================================
// ServiceConfig - Complete parsed configuration
// ============================================================================

struct ServiceConfig {
    ServerConfig server;
    LoggingConfig logging;
    SandboxSectionConfig sandbox;
    ValidatorConfig validator;
    QueueConfig queue;
    RedisConfig redis;
    CacheConfig cache;
    CircuitBreakerConfig circuit_breaker;
    DatasetsConfig datasets;
    ProblemsConfig problems;
    SubmissionsConfig submissions;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML (toml++)
// ============================================================================

/**
 * @brief TOML config loading
 *
 * - ${VAR} in any string value expands from the environment (unset: empty)
 * - include = "other.toml" or ["a.toml", "b.toml"] pulls in files relative
 *   to the including file; the including file wins on conflicts, arrays
 *   concatenate; circular includes are an error
 * - every section is optional; semantic errors are collected, not thrown
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ServiceConfig config;

        static LoadResult ok(ServiceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @return one human-readable line per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ServiceConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static SandboxSectionConfig extract_sandbox(const toml::table& root);
    static ValidatorConfig extract_validator(const toml::table& root);
    static QueueConfig extract_queue(const toml::table& root);
    static RedisConfig extract_redis(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static CircuitBreakerConfig extract_circuit_breaker(const toml::table& root);
    static DatasetsConfig extract_datasets(const toml::table& root);
    static ProblemsConfig extract_problems(const toml::table& root);
    static SubmissionsConfig extract_submissions(const toml::table& root);

    static ServiceConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ServiceConfig config);
};

} // namespace sqlsandbox
