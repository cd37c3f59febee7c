#include "cache/result_cache.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <algorithm>

namespace sqlsandbox {

// ============================================================================
// ResultCache
// ============================================================================

ResultCache::ResultCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

uint64_t ResultCache::key_hash(std::string_view user_id, std::string_view problem_id,
                               std::string_view normalized_sql, bool include_hidden) {
    XXH64_state_t state;
    XXH64_reset(&state, 0);
    // Length-prefixed parts so ("ab","c") and ("a","bc") differ
    for (std::string_view part : {user_id, problem_id, normalized_sql}) {
        const uint64_t len = part.size();
        XXH64_update(&state, &len, sizeof(len));
        XXH64_update(&state, part.data(), part.size());
    }
    const char hidden = include_hidden ? 1 : 0;
    XXH64_update(&state, &hidden, 1);
    return XXH64_digest(&state);
}

size_t ResultCache::select_shard(uint64_t key) const {
    return key % shards_.size();
}

size_t ResultCache::estimate_report_size(const GradeReport& report) {
    size_t size = 0;
    for (const auto& col : report.columns) size += col.size();
    for (const auto& row : report.preview_rows) {
        for (const auto& cell : row) {
            const auto* s = std::get_if<std::string>(&cell);
            size += s ? s->size() : sizeof(double);
        }
    }
    for (const auto& line : report.outcome.feedback) size += line.size();
    for (const auto& tc : report.test_cases) {
        for (const auto& line : tc.feedback) size += line.size();
    }
    return size;
}

std::optional<GradeReport> ResultCache::get(uint64_t key_hash, const std::string& problem_id) {
    if (!config_.enabled) return std::nullopt;
    auto& shard = *shards_[select_shard(key_hash)];
    auto result = shard.get(key_hash, problem_id);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void ResultCache::put(uint64_t key_hash, const std::string& problem_id, const GradeReport& report) {
    if (!config_.enabled) return;
    if (estimate_report_size(report) > config_.max_report_size_bytes) {
        return;
    }
    const auto expires = std::chrono::steady_clock::now() + config_.ttl;
    shards_[select_shard(key_hash)]->put(key_hash, problem_id, report, expires);
}

void ResultCache::invalidate(const std::string& problem_id) {
    for (auto& shard : shards_) {
        shard->invalidate(problem_id);
    }
    invalidations_.fetch_add(1, std::memory_order_relaxed);
}

ResultCache::Stats ResultCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .invalidations = invalidations_.load(std::memory_order_relaxed),
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

uint64_t ResultCache::Shard::generation_of(const std::string& problem_id) const {
    auto it = generations_.find(problem_id);
    return it != generations_.end() ? it->second : 0;
}

std::optional<GradeReport> ResultCache::Shard::get(uint64_t key, const std::string& problem_id) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto& entry = *it->second;
    const bool stale = entry.problem_id != problem_id
        || entry.generation < generation_of(entry.problem_id)
        || std::chrono::steady_clock::now() >= entry.expires_at;
    if (stale) {
        lru_list_.erase(it->second);
        map_.erase(it);
        return std::nullopt;
    }

    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return entry.report;
}

void ResultCache::Shard::put(uint64_t key, const std::string& problem_id, GradeReport report,
                             std::chrono::steady_clock::time_point expires_at) {
    std::lock_guard lock(mutex_);
    const uint64_t gen = generation_of(problem_id);

    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->problem_id = problem_id;
        it->second->report = std::move(report);
        it->second->expires_at = expires_at;
        it->second->generation = gen;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        map_.erase(lru_list_.back().key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, problem_id, std::move(report), expires_at, gen});
    map_[key] = lru_list_.begin();
}

void ResultCache::Shard::invalidate(const std::string& problem_id) {
    std::lock_guard lock(mutex_);
    ++generations_[problem_id];
}

size_t ResultCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

} // namespace sqlsandbox
