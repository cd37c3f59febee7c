#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlsandbox {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative numbers clamp to zero for unsigned settings
size_t toml_size(const toml::table& tbl, const std::string_view key, size_t fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    return *v < 0 ? 0 : static_cast<size_t>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    const auto port = s["port"].value_or(int64_t{8080});
    cfg.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    cfg.threads = toml_size(s, "threads", 4);
    cfg.max_sql_length = toml_size(s, "max_sql_length", 10000);
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(toml_size(s, "shutdown_timeout_ms", 30000));

    if (const auto* keys = s["api_keys"].as_table()) {
        for (const auto& [key, val] : *keys) {
            if (auto user = val.value<std::string>()) {
                cfg.api_keys.emplace(std::string(key.str()), *user);
            }
        }
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

SandboxSectionConfig ConfigLoader::extract_sandbox(const toml::table& root) {
    SandboxSectionConfig cfg;
    const auto* sandbox = root["sandbox"].as_table();
    if (!sandbox) return cfg;
    const auto& s = *sandbox;

    cfg.memory_limit = s["memory_limit"].value_or("128MB"s);
    cfg.threads = static_cast<int>(s["threads"].value_or(int64_t{1}));
    cfg.query_timeout_ms = s["query_timeout_ms"].value_or(int64_t{30000});
    cfg.interrupt_grace_ms = s["interrupt_grace_ms"].value_or(int64_t{2000});
    cfg.load_timeout_ms = s["load_timeout_ms"].value_or(int64_t{120000});
    cfg.max_result_rows = toml_size(s, "max_result_rows", 1000);
    cfg.max_concurrent_sandboxes = toml_size(s, "max_concurrent_sandboxes", 10);
    cfg.max_tables = toml_size(s, "max_tables", 20);
    return cfg;
}

ValidatorConfig ConfigLoader::extract_validator(const toml::table& root) {
    ValidatorConfig cfg;
    const auto* validator = root["validator"].as_table();
    if (!validator) return cfg;
    const auto& v = *validator;

    cfg.max_query_length = toml_size(v, "max_query_length", 10000);
    cfg.numeric_tolerance = v["numeric_tolerance"].value_or(0.001);
    cfg.max_feedback_rows = toml_size(v, "max_feedback_rows", 3);
    cfg.pass_threshold = v["pass_threshold"].value_or(95.0);
    cfg.anti_hardcode = v["anti_hardcode"].value_or(true);
    cfg.perturb_fraction = v["perturb_fraction"].value_or(0.015);
    cfg.perturb_seed = static_cast<uint64_t>(v["perturb_seed"].value_or(int64_t{1337}));
    return cfg;
}

QueueConfig ConfigLoader::extract_queue(const toml::table& root) {
    QueueConfig cfg;
    const auto* queue = root["queue"].as_table();
    if (!queue) return cfg;
    const auto& q = *queue;

    cfg.backend = utils::to_lower(q["backend"].value_or("memory"s));
    cfg.poll_timeout_ms = q["poll_timeout_ms"].value_or(int64_t{1000});
    cfg.result_ttl_seconds = q["result_ttl_seconds"].value_or(int64_t{300});
    cfg.meta_ttl_seconds = q["meta_ttl_seconds"].value_or(int64_t{3600});
    cfg.recovery_lock_ttl_ms = q["recovery_lock_ttl_ms"].value_or(int64_t{30000});
    cfg.recovery_min_age_seconds = q["recovery_min_age_seconds"].value_or(int64_t{300});
    cfg.recovery_interval_seconds = q["recovery_interval_seconds"].value_or(int64_t{60});
    cfg.workers = toml_size(q, "workers", 2);
    cfg.key_prefix = q["key_prefix"].value_or("sqlsandbox"s);
    return cfg;
}

RedisConfig ConfigLoader::extract_redis(const toml::table& root) {
    RedisConfig cfg;
    const auto* redis = root["redis"].as_table();
    if (!redis) return cfg;
    const auto& r = *redis;

    cfg.host = r["host"].value_or("127.0.0.1"s);
    const auto port = r["port"].value_or(int64_t{6379});
    cfg.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    cfg.connect_timeout_ms = r["connect_timeout_ms"].value_or(int64_t{2000});
    cfg.password = r["password"].value_or(""s);
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.enabled = c["enabled"].value_or(true);
    cfg.max_entries = toml_size(c, "max_entries", 5000);
    cfg.num_shards = toml_size(c, "num_shards", 16);
    cfg.ttl_seconds = c["ttl_seconds"].value_or(int64_t{300});
    return cfg;
}

CircuitBreakerConfig ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.failure_threshold = (*cb)["failure_threshold"].value_or(5);
    cfg.success_threshold = (*cb)["success_threshold"].value_or(2);
    cfg.timeout_ms = (*cb)["timeout_ms"].value_or(10000);
    cfg.half_open_max_calls = (*cb)["half_open_max_calls"].value_or(1);
    return cfg;
}

DatasetsConfig ConfigLoader::extract_datasets(const toml::table& root) {
    DatasetsConfig cfg;
    const auto* datasets = root["datasets"].as_table();
    if (!datasets) return cfg;
    const auto& d = *datasets;

    cfg.root = d["root"].value_or(cfg.root);
    cfg.staging_dir = d["staging_dir"].value_or(cfg.staging_dir);
    cfg.allowed_buckets = toml_string_array(d, "allowed_buckets");
    cfg.max_file_size_bytes = toml_size(d, "max_file_size_bytes", 104857600);
    return cfg;
}

ProblemsConfig ConfigLoader::extract_problems(const toml::table& root) {
    ProblemsConfig cfg;
    if (const auto* problems = root["problems"].as_table()) {
        cfg.dir = (*problems)["dir"].value_or(cfg.dir);
    }
    return cfg;
}

SubmissionsConfig ConfigLoader::extract_submissions(const toml::table& root) {
    SubmissionsConfig cfg;
    if (const auto* submissions = root["submissions"].as_table()) {
        cfg.log = (*submissions)["log"].value_or(cfg.log);
    }
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

ServiceConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ServiceConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.sandbox = extract_sandbox(tbl);
    config.validator = extract_validator(tbl);
    config.queue = extract_queue(tbl);
    config.redis = extract_redis(tbl);
    config.cache = extract_cache(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.datasets = extract_datasets(tbl);
    config.problems = extract_problems(tbl);
    config.submissions = extract_submissions(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ServiceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ServiceConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.threads == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.max_sql_length == 0) {
        errors.push_back("server.max_sql_length must be > 0");
    }
    for (const auto& [key, user] : config.server.api_keys) {
        if (key.empty() || user.empty()) {
            errors.push_back("server.api_keys entries need a non-empty key and user id");
            break;
        }
    }

    static const std::unordered_set<std::string> levels = {"info", "warn", "warning", "error"};
    if (!levels.contains(utils::to_lower(config.logging.level))) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.sandbox.memory_limit.empty()) {
        errors.push_back("sandbox.memory_limit must not be empty");
    }
    if (config.sandbox.threads <= 0) {
        errors.push_back("sandbox.threads must be > 0");
    }
    if (config.sandbox.query_timeout_ms <= 0) {
        errors.push_back("sandbox.query_timeout_ms must be > 0");
    }
    if (config.sandbox.interrupt_grace_ms < 0) {
        errors.push_back("sandbox.interrupt_grace_ms must be >= 0");
    }
    if (config.sandbox.load_timeout_ms <= 0) {
        errors.push_back("sandbox.load_timeout_ms must be > 0");
    }
    if (config.sandbox.max_result_rows == 0) {
        errors.push_back("sandbox.max_result_rows must be > 0");
    }
    if (config.sandbox.max_concurrent_sandboxes == 0) {
        errors.push_back("sandbox.max_concurrent_sandboxes must be > 0");
    }
    if (config.sandbox.max_tables == 0) {
        errors.push_back("sandbox.max_tables must be > 0");
    }

    if (config.validator.numeric_tolerance < 0.0) {
        errors.push_back("validator.numeric_tolerance must be >= 0");
    }
    if (config.validator.pass_threshold < 0.0 || config.validator.pass_threshold > 100.0) {
        errors.push_back("validator.pass_threshold must be between 0 and 100");
    }
    if (config.validator.perturb_fraction <= 0.0 || config.validator.perturb_fraction > 1.0) {
        errors.push_back("validator.perturb_fraction must be in (0, 1]");
    }

    if (config.queue.backend != "memory" && config.queue.backend != "redis") {
        errors.push_back(std::format("queue.backend must be 'memory' or 'redis', got '{}'",
            config.queue.backend));
    }
#ifndef SQLSANDBOX_ENABLE_REDIS
    if (config.queue.backend == "redis") {
        errors.push_back("queue.backend 'redis' requires a build with SQLSANDBOX_ENABLE_REDIS");
    }
#endif
    if (config.queue.poll_timeout_ms <= 0) {
        errors.push_back("queue.poll_timeout_ms must be > 0");
    }
    if (config.queue.result_ttl_seconds <= 0) {
        errors.push_back("queue.result_ttl_seconds must be > 0");
    }
    if (config.queue.meta_ttl_seconds < config.queue.result_ttl_seconds) {
        errors.push_back("queue.meta_ttl_seconds must be >= queue.result_ttl_seconds");
    }
    if (config.queue.recovery_lock_ttl_ms <= 0) {
        errors.push_back("queue.recovery_lock_ttl_ms must be > 0");
    }
    // A processing entry younger than the longest possible grading run may
    // still belong to a live worker: dataset load plus the query and its
    // perturbed rerun, each with its interrupt grace
    const int64_t longest_grade_ms = config.sandbox.load_timeout_ms +
        2 * (config.sandbox.query_timeout_ms + config.sandbox.interrupt_grace_ms);
    if (config.queue.recovery_min_age_seconds * 1000 <= longest_grade_ms) {
        errors.push_back(std::format(
            "queue.recovery_min_age_seconds must exceed the longest grading run ({} ms)",
            longest_grade_ms));
    }
    if (config.queue.recovery_interval_seconds <= 0) {
        errors.push_back("queue.recovery_interval_seconds must be > 0");
    }
    if (config.queue.key_prefix.empty()) {
        errors.push_back("queue.key_prefix must not be empty");
    }

    if (config.queue.backend == "redis") {
        if (config.redis.host.empty()) errors.push_back("redis.host must not be empty");
        if (config.redis.port == 0) errors.push_back("redis.port must be 1-65535");
        if (config.redis.connect_timeout_ms <= 0) errors.push_back("redis.connect_timeout_ms must be > 0");
    }

    if (config.cache.enabled) {
        if (config.cache.max_entries == 0) errors.push_back("cache.max_entries must be > 0 when enabled");
        if (config.cache.num_shards == 0) errors.push_back("cache.num_shards must be > 0 when enabled");
        if (config.cache.ttl_seconds <= 0) errors.push_back("cache.ttl_seconds must be > 0 when enabled");
    }

    if (config.circuit_breaker.failure_threshold <= 0) {
        errors.push_back("circuit_breaker.failure_threshold must be > 0");
    }
    if (config.circuit_breaker.success_threshold <= 0) {
        errors.push_back("circuit_breaker.success_threshold must be > 0");
    }
    if (config.circuit_breaker.timeout_ms <= 0) {
        errors.push_back("circuit_breaker.timeout_ms must be > 0");
    }
    if (config.circuit_breaker.half_open_max_calls <= 0) {
        errors.push_back("circuit_breaker.half_open_max_calls must be > 0");
    }

    if (config.datasets.root.empty()) errors.push_back("datasets.root must not be empty");
    if (config.datasets.staging_dir.empty()) errors.push_back("datasets.staging_dir must not be empty");
    if (config.datasets.max_file_size_bytes == 0) errors.push_back("datasets.max_file_size_bytes must be > 0");
    if (config.problems.dir.empty()) errors.push_back("problems.dir must not be empty");

    return errors;
}

} // namespace sqlsandbox
