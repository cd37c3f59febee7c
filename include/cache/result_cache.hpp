#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Sharded LRU + TTL cache of practice-mode grade reports
 *
 * Keyed by (user, problem, normalized query). Entries of one problem can be
 * dropped in O(1) by bumping the problem's generation; stale entries are
 * evicted lazily on lookup.
 */
class ResultCache {
public:
    struct Config {
        bool enabled = true;
        size_t max_entries = 5000;
        size_t num_shards = 16;
        std::chrono::seconds ttl{300};
        size_t max_report_size_bytes = 1048576;  // 1MB
    };

    explicit ResultCache(const Config& config);

    /**
     * @brief Hash of the cache key parts (xxh64)
     *
     * include_hidden is part of the key so a visible-only report never
     * answers a request for hidden test cases.
     */
    [[nodiscard]] static uint64_t key_hash(std::string_view user_id, std::string_view problem_id,
                                           std::string_view normalized_sql, bool include_hidden);

    /// Returns nullopt on miss, expiry or invalidation
    [[nodiscard]] std::optional<GradeReport> get(uint64_t key_hash, const std::string& problem_id);

    /// Oversized reports are not cached
    void put(uint64_t key_hash, const std::string& problem_id, const GradeReport& report);

    /// Drop every entry of a problem (definition or datasets changed)
    void invalidate(const std::string& problem_id);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t invalidations;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        uint64_t key;
        std::string problem_id;
        GradeReport report;
        std::chrono::steady_clock::time_point expires_at;
        uint64_t generation = 0;             // Problem generation at insert time
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<GradeReport> get(uint64_t key, const std::string& problem_id);
        void put(uint64_t key, const std::string& problem_id, GradeReport report,
                 std::chrono::steady_clock::time_point expires_at);
        void invalidate(const std::string& problem_id);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        uint64_t generation_of(const std::string& problem_id) const;

        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<uint64_t, std::list<CacheEntry>::iterator> map_;
        std::unordered_map<std::string, uint64_t> generations_;
    };

    size_t select_shard(uint64_t key) const;
    static size_t estimate_report_size(const GradeReport& report);

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace sqlsandbox
