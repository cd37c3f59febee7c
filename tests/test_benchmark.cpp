#include <benchmark/benchmark.h>

#include "cache/result_cache.hpp"
#include "parser/fingerprinter.hpp"
#include "parser/sql_tokenizer.hpp"
#include "security/query_validator.hpp"
#include "validation/result_hasher.hpp"
#include "validation/result_validator.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace sqlsandbox;

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Learner queries of varying complexity
const std::string kSimpleSelect =
    "SELECT region, SUM(amount) FROM orders GROUP BY region";
const std::string kJoin =
    "SELECT c.name, SUM(o.amount) AS total FROM customers c "
    "JOIN orders o ON o.customer_id = c.id "
    "WHERE o.amount > 100 GROUP BY c.name ORDER BY total DESC";
const std::string kWindow =
    "SELECT region, amount, RANK() OVER (PARTITION BY region ORDER BY amount DESC) AS rnk "
    "FROM orders WHERE amount BETWEEN 10 AND 5000";
const std::string kCte =
    "WITH monthly AS (SELECT date_trunc('month', created_at) AS m, SUM(amount) AS s "
    "FROM orders GROUP BY 1) "
    "SELECT m, s, s - LAG(s) OVER (ORDER BY m) AS delta FROM monthly ORDER BY m";
const std::string kSubquery =
    "SELECT * FROM customers WHERE id IN "
    "(SELECT customer_id FROM orders WHERE amount > "
    "(SELECT AVG(amount) FROM orders))";

const std::vector<std::string> kQueryComplexities = {
    kSimpleSelect, kJoin, kWindow, kCte, kSubquery
};

ResultSet make_result(size_t rows) {
    ResultSet rs;
    rs.columns = {"id", "region", "amount"};
    rs.rows.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        rs.rows.push_back({static_cast<int64_t>(i),
                           std::string(i % 2 == 0 ? "North" : "South"),
                           static_cast<double>(i) * 1.25});
    }
    return rs;
}

// Same rows, reversed, so unordered comparison has to match them up
ResultSet reversed(ResultSet rs) {
    std::reverse(rs.rows.begin(), rs.rows.end());
    return rs;
}

GradeReport make_report() {
    GradeReport r;
    r.problem_id = "revenue";
    r.outcome.is_correct = true;
    r.outcome.score = 100.0;
    r.outcome.feedback = {"All 1 test case(s) passed"};
    r.columns = {"region", "total"};
    r.preview_rows = {{std::string("North"), 800.25}};
    r.row_count = 1;
    return r;
}

ResultCache::Config bench_cache_config() {
    ResultCache::Config cfg;
    cfg.enabled = true;
    cfg.max_entries = 10000;
    cfg.num_shards = 16;
    cfg.ttl = std::chrono::seconds(300);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Category A: Latency Benchmarks
// ============================================================================

static void BM_Tokenize_Simple(benchmark::State& state) {
    for (auto _ : state) {
        auto tokens = SqlTokenizer::tokenize(kSimpleSelect);
        benchmark::DoNotOptimize(tokens);
    }
}
BENCHMARK(BM_Tokenize_Simple);

static void BM_Normalize_Simple(benchmark::State& state) {
    for (auto _ : state) {
        auto normalized = QueryFingerprinter::normalize(kSimpleSelect);
        benchmark::DoNotOptimize(normalized);
    }
}
BENCHMARK(BM_Normalize_Simple);

static void BM_ValidateFast_Simple(benchmark::State& state) {
    static const QueryValidator validator;
    for (auto _ : state) {
        auto verdict = validator.validate_fast(kSimpleSelect);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(BM_ValidateFast_Simple);

static void BM_Validate_Simple(benchmark::State& state) {
    static const QueryValidator validator;
    for (auto _ : state) {
        auto verdict = validator.validate(kSimpleSelect);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(BM_Validate_Simple);

static void BM_Validate_Rejected(benchmark::State& state) {
    static const QueryValidator validator;
    const std::string sql = "SELECT * FROM orders; DROP TABLE orders";
    for (auto _ : state) {
        auto verdict = validator.validate(sql);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(BM_Validate_Rejected);

static void BM_ResultCache_Get_Hit(benchmark::State& state) {
    ResultCache cache(bench_cache_config());
    const auto key = ResultCache::key_hash("alice", "revenue", "select 1", false);
    cache.put(key, "revenue", make_report());
    for (auto _ : state) {
        auto hit = cache.get(key, "revenue");
        benchmark::DoNotOptimize(hit);
    }
}
BENCHMARK(BM_ResultCache_Get_Hit);

static void BM_ResultCache_Get_Miss(benchmark::State& state) {
    ResultCache cache(bench_cache_config());
    const auto key = ResultCache::key_hash("alice", "revenue", "select 1", false);
    for (auto _ : state) {
        auto miss = cache.get(key, "revenue");
        benchmark::DoNotOptimize(miss);
    }
}
BENCHMARK(BM_ResultCache_Get_Miss);

// ============================================================================
// Category B: Throughput Benchmarks - Multi-threaded
// ============================================================================

static void BM_ValidateFast_Throughput(benchmark::State& state) {
    static const QueryValidator validator;
    const auto& sql = kQueryComplexities[static_cast<size_t>(state.thread_index()) % kQueryComplexities.size()];
    for (auto _ : state) {
        auto verdict = validator.validate_fast(sql);
        benchmark::DoNotOptimize(verdict);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ValidateFast_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

static void BM_ResultCache_Throughput(benchmark::State& state) {
    static ResultCache cache(bench_cache_config());
    const std::string user = "user_" + std::to_string(state.thread_index());
    const auto key = ResultCache::key_hash(user, "revenue", "select 1", false);
    cache.put(key, "revenue", make_report());
    for (auto _ : state) {
        auto hit = cache.get(key, "revenue");
        benchmark::DoNotOptimize(hit);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ResultCache_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// ============================================================================
// Category C: Scaling Benchmarks
// ============================================================================

static void BM_Validate_QueryComplexity(benchmark::State& state) {
    static const QueryValidator validator;
    const auto& sql = kQueryComplexities[static_cast<size_t>(state.range(0))];
    for (auto _ : state) {
        auto verdict = validator.validate(sql);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(BM_Validate_QueryComplexity)->DenseRange(0, 4);

static void BM_Normalize_QueryComplexity(benchmark::State& state) {
    const auto& sql = kQueryComplexities[static_cast<size_t>(state.range(0))];
    for (auto _ : state) {
        auto normalized = QueryFingerprinter::normalize(sql);
        benchmark::DoNotOptimize(normalized);
    }
}
BENCHMARK(BM_Normalize_QueryComplexity)->DenseRange(0, 4);

static void BM_Compare_Unordered_ResultSize(benchmark::State& state) {
    static const ResultValidator validator;
    const auto expected = make_result(static_cast<size_t>(state.range(0)));
    const auto actual = reversed(expected);
    const ValidationRules rules;
    for (auto _ : state) {
        auto outcome = validator.compare(actual, expected, rules);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Compare_Unordered_ResultSize)->Arg(1)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Compare_Ordered_ResultSize(benchmark::State& state) {
    static const ResultValidator validator;
    const auto expected = make_result(static_cast<size_t>(state.range(0)));
    ValidationRules rules;
    rules.strict_ordering = true;
    for (auto _ : state) {
        auto outcome = validator.compare(expected, expected, rules);
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Compare_Ordered_ResultSize)->Arg(1)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Digest_ResultSize(benchmark::State& state) {
    const auto rs = make_result(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto digest = ResultHasher::digest(rs, false);
        benchmark::DoNotOptimize(digest);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Digest_ResultSize)->Arg(1)->Arg(10)->Arg(100)->Arg(1000);
