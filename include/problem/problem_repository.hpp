#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "sandbox/sandbox_engine.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

class JsonValue;

/**
 * @brief One graded check of a problem
 *
 * Carries either expected rows (six-step comparison) or only a digest of
 * the expected result (hash comparison).
 */
struct TestCase {
    std::string id;
    std::string name;
    bool hidden = false;
    std::optional<ResultSet> expected;
    std::optional<std::string> expected_hash;
    ValidationRules rules;
};

struct ProblemDefinition {
    std::string id;
    std::string title;
    SandboxDatasets datasets;
    std::vector<TestCase> test_cases;   // Never empty once parsed
    bool anti_hardcode = true;
};

/**
 * @brief Outbound problem metadata lookup
 */
class IProblemRepository {
public:
    virtual ~IProblemRepository() = default;

    /**
     * @return NOT_FOUND for an unknown id, VALIDATION_ERROR for a broken definition
     */
    [[nodiscard]] virtual Result<ProblemDefinition> get(const std::string& problem_id) = 0;
};

/**
 * @brief Problem definitions read from <dir>/<problem_id>.json
 *
 * Layout:
 * @code
 * {
 *   "title": "Revenue by region",
 *   "datasets": [{"bucket": "course", "key": "orders.parquet", "table": "orders"}],
 *   "schemas": [{"table": "regions", "columns": [{"name": "id", "type": "INTEGER"}],
 *                "rows": [[1]]}],
 *   "expected": {"columns": ["region", "total"], "rows": [["North", 800.25]]},
 *   "expected_hash": "sha256:...",
 *   "rules": {"strict_ordering": false, "numeric_tolerance": 0.001},
 *   "test_cases": [{"id": "t1", "name": "...", "hidden": true,
 *                   "expected": {...}, "expected_hash": "...", "rules": {...}}],
 *   "anti_hardcode": true
 * }
 * @endcode
 * Without test_cases, the top-level expected answer becomes a single
 * visible case named "main". Parsed definitions are cached by file mtime.
 */
class FileProblemRepository : public IProblemRepository {
public:
    struct Config {
        std::filesystem::path dir;
    };

    explicit FileProblemRepository(const Config& config);

    [[nodiscard]] Result<ProblemDefinition> get(const std::string& problem_id) override;

    /**
     * @brief Parse one definition document (exposed for tests and tooling)
     */
    [[nodiscard]] static Result<ProblemDefinition> parse(const std::string& problem_id,
                                                         std::string_view json_text);

private:
    struct CachedDefinition {
        std::filesystem::file_time_type mtime;
        ProblemDefinition definition;
    };

    [[nodiscard]] static bool is_safe_id(std::string_view id);

    Config config_;
    std::mutex mutex_;
    std::unordered_map<std::string, CachedDefinition> cache_;
};

} // namespace sqlsandbox
