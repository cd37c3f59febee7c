#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "sandbox/dataset_resolver.hpp"
#include "sandbox/sandbox.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

class QueryValidator;

/**
 * @brief Everything a problem needs materialized before grading
 */
struct SandboxDatasets {
    std::vector<DatasetSource> sources;
    std::vector<TableSchema> schemas;
};

struct PreparedSandbox {
    std::shared_ptr<Sandbox> sandbox;
    LoadReport report;
};

/**
 * @brief Owner of all live sandboxes, keyed by (user_id, problem_id)
 *
 * acquire() is idempotent per key until eviction. The LRU order and the
 * sandbox table are guarded by one mutex; teardown of an evicted sandbox
 * happens outside that mutex so a long-running query on it does not stall
 * other users.
 */
class SandboxEngine {
public:
    struct Config {
        Sandbox::Config sandbox;
        size_t max_concurrent_sandboxes = 10;
        size_t max_tables = 20;
    };

    struct Stats {
        uint64_t created = 0;
        uint64_t reused = 0;
        uint64_t evicted = 0;
        size_t live = 0;
    };

    SandboxEngine(const Config& config,
                  std::shared_ptr<IDatasetResolver> resolver,
                  std::shared_ptr<const QueryValidator> validator);
    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Existing sandbox for the key, or a fresh one
     *
     * When the live count is at the ceiling the least recently used
     * sandbox is torn down first.
     */
    [[nodiscard]] Result<std::shared_ptr<Sandbox>> acquire(const std::string& user_id,
                                                           const std::string& problem_id);

    /**
     * @brief Load dataset files into a sandbox, isolating failures per table
     *
     * Tables whose integrity tag is unchanged are not reloaded. success is
     * false only when sources were given and none of them loaded.
     */
    [[nodiscard]] LoadReport load_tables(Sandbox& sandbox, const std::vector<DatasetSource>& sources);

    [[nodiscard]] Result<TableInfo> create_table_from_schema(Sandbox& sandbox, const TableSchema& schema);

    [[nodiscard]] Result<ResultSet> execute(Sandbox& sandbox, std::string_view sql);

    /**
     * @brief acquire + load every dataset + seal
     *
     * A sealed sandbox whose datasets changed is rebuilt from scratch, since
     * sealing cannot be undone.
     */
    [[nodiscard]] Result<PreparedSandbox> prepare(const std::string& user_id,
                                                  const std::string& problem_id,
                                                  const SandboxDatasets& datasets);

    /**
     * @brief Tear down and forget a sandbox; idempotent
     */
    void cleanup(Sandbox& sandbox);
    void cleanup_all();

    [[nodiscard]] bool contains(const std::string& user_id, const std::string& problem_id) const;
    [[nodiscard]] Stats stats() const;

    // Integrity tag of a hand-authored table definition
    [[nodiscard]] static std::string schema_tag(const TableSchema& schema);

private:
    using Key = std::string;
    struct Entry {
        std::shared_ptr<Sandbox> sandbox;
        std::list<Key>::iterator lru_it;
    };

    [[nodiscard]] static Key make_key(const std::string& user_id, const std::string& problem_id);
    [[nodiscard]] std::vector<Result<StagedDataset>> stage(const std::vector<DatasetSource>& sources);
    [[nodiscard]] LoadReport load_staged(Sandbox& sandbox,
                                         const std::vector<DatasetSource>& sources,
                                         const std::vector<Result<StagedDataset>>& staged);
    [[nodiscard]] static bool is_current(const Sandbox& sandbox,
                                         const SandboxDatasets& datasets,
                                         const std::vector<Result<StagedDataset>>& staged);
    void forget(const Key& key, uint64_t sandbox_id);

    Config config_;
    std::shared_ptr<IDatasetResolver> resolver_;
    std::shared_ptr<const QueryValidator> validator_;

    mutable std::mutex mutex_;
    std::list<Key> lru_;                        // Front = most recently used
    std::unordered_map<Key, Entry> sandboxes_;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> reused_{0};
    std::atomic<uint64_t> evicted_{0};
};

} // namespace sqlsandbox
