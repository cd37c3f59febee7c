#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duckdb {
class DuckDB;
class Connection;
}

namespace sqlsandbox {

class QueryValidator;

/**
 * @brief Deterministic data variant used by the anti-hardcoding check
 *
 * In every table, ceil(row_count * fraction) rows (at least one) are picked
 * by ORDER BY hash(rowid + seed); their numeric columns get +1 and their
 * text columns get a '~' suffix. The change lives inside a transaction that
 * is always rolled back.
 */
struct PerturbationPlan {
    uint64_t seed = 1337;
    double fraction = 0.015;
};

struct VariantRun {
    ResultSet result;
    size_t rows_perturbed = 0;
    std::vector<std::string> perturbed_tables;
};

/**
 * @brief One isolated in-memory DuckDB instance for a (user, problem) pair
 *
 * Every statement runs on a single dedicated worker thread, so the sandbox
 * is never used by two executions at once. When a query overruns its
 * wall-clock budget the connection is interrupted and replaced with a
 * fresh one on the same database (tables survive); if the worker does not
 * come back within the grace period it is abandoned and a new worker is
 * started.
 *
 * Thread-safety: all public methods may be called from any thread;
 * executions are serialized.
 */
class Sandbox {
public:
    struct Config {
        std::string memory_limit = "128MB";
        int threads = 1;
        std::chrono::milliseconds query_timeout{30000};
        std::chrono::milliseconds interrupt_grace{2000};
        std::chrono::milliseconds load_timeout{120000};
        size_t max_result_rows = 1000;
    };

    /**
     * @throws std::runtime_error if the engine cannot be created
     */
    Sandbox(std::string user_id, std::string problem_id, const Config& config,
            std::shared_ptr<const QueryValidator> validator);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    [[nodiscard]] const std::string& user_id() const { return user_id_; }
    [[nodiscard]] const std::string& problem_id() const { return problem_id_; }
    [[nodiscard]] uint64_t id() const { return id_; }

    /**
     * @brief Materialize a staged Parquet/CSV file as a table
     *
     * Fails once the sandbox is sealed.
     */
    [[nodiscard]] Result<TableInfo> load_table_from_file(
        const std::string& table_name,
        const std::filesystem::path& local_path,
        const std::string& source,
        const std::string& integrity_tag);

    /**
     * @brief Create a hand-authored table with its sample rows atomically
     *
     * A table of the same name is replaced inside the same transaction.
     */
    [[nodiscard]] Result<TableInfo> create_table_from_schema(
        const TableSchema& schema, const std::string& integrity_tag);

    /**
     * @brief Validate (exhaustive) then run a learner query
     */
    [[nodiscard]] Result<ResultSet> execute(std::string_view sql);

    /**
     * @brief Run a learner query against a rolled-back perturbation of the data
     */
    [[nodiscard]] Result<VariantRun> execute_on_variant(std::string_view sql,
                                                        const PerturbationPlan& plan);

    /**
     * @brief Disable external file/URL access and lock the configuration
     */
    [[nodiscard]] Result<Unit> seal();

    /**
     * @brief Release the engine; idempotent
     */
    void cleanup();

    [[nodiscard]] bool is_sealed() const { return sealed_.load(); }
    [[nodiscard]] bool is_closed() const { return closed_.load(); }

    [[nodiscard]] std::vector<TableInfo> tables() const;
    [[nodiscard]] std::optional<TableInfo> table(const std::string& name) const;
    [[nodiscard]] bool has_table_with_tag(const std::string& name,
                                          const std::string& integrity_tag) const;

    // Number of times the connection was rebuilt after a timeout
    [[nodiscard]] uint64_t connection_rebuilds() const { return rebuilds_.load(); }

private:
    class Worker;

    template <typename T>
    Result<T> run_on_worker(std::function<Result<T>(duckdb::Connection&)> fn,
                            std::chrono::milliseconds timeout, std::string_view what);

    void rebuild_connection();
    void record_table(TableInfo info);

    std::string user_id_;
    std::string problem_id_;
    uint64_t id_;
    Config config_;
    std::shared_ptr<const QueryValidator> validator_;

    // Serializes executions and guards db_/conn_/worker_
    std::mutex exec_mutex_;
    std::unique_ptr<duckdb::DuckDB> db_;
    std::shared_ptr<duckdb::Connection> conn_;
    std::shared_ptr<Worker> worker_;

    mutable std::mutex tables_mutex_;
    std::map<std::string, TableInfo> tables_;

    std::atomic<bool> sealed_{false};
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> rebuilds_{0};
};

} // namespace sqlsandbox
