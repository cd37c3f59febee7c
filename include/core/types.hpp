#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlsandbox {

// ============================================================================
// Result Cells
// ============================================================================

/**
 * @brief One value of a result row
 *
 * monostate is SQL NULL. Integers of every width collapse to int64_t and
 * every floating/decimal type to double; anything else is carried as its
 * engine text rendering.
 */
using Cell = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Row = std::vector<Cell>;

[[nodiscard]] inline bool is_null(const Cell& c) noexcept {
    return std::holds_alternative<std::monostate>(c);
}

/**
 * @brief Display text of a cell: NULL, true/false, shortest round-trip
 * numbers, strings verbatim
 */
[[nodiscard]] inline std::string cell_to_string(const Cell& c) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::format("{}", v);
        }
    }, c);
}

/**
 * @brief Strongly-typed tabular output of one query
 */
struct ResultSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    bool truncated = false;                     // Row cap hit, more rows existed
    std::chrono::microseconds execution_time{0};
};

// ============================================================================
// Security Verdict
// ============================================================================

enum class RiskLevel {
    SAFE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

[[nodiscard]] inline constexpr const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE:     return "safe";
        case RiskLevel::LOW:      return "low";
        case RiskLevel::MEDIUM:   return "medium";
        case RiskLevel::HIGH:     return "high";
        case RiskLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

struct SecurityVerdict {
    bool is_valid = false;
    RiskLevel risk_level = RiskLevel::SAFE;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> detected_operations;

    // Sanitized text (control characters stripped) that is safe to execute
    std::string sanitized_sql;
};

// ============================================================================
// Datasets and Tables
// ============================================================================

struct ColumnDef {
    std::string name;
    std::string type;

    ColumnDef() = default;
    ColumnDef(std::string n, std::string t) : name(std::move(n)), type(std::move(t)) {}
};

/**
 * @brief Instructor-provided columnar file that becomes one table
 */
struct DatasetSource {
    std::string bucket;
    std::string key;
    std::string table_name;

    [[nodiscard]] std::string locator() const { return bucket + "/" + key; }
};

/**
 * @brief Hand-authored table: schema plus sample rows
 */
struct TableSchema {
    std::string table_name;
    std::vector<ColumnDef> columns;
    std::vector<Row> sample_rows;
};

struct TableInfo {
    std::string name;
    std::vector<ColumnDef> columns;
    uint64_t row_count = 0;
    std::string source;             // Locator the table was materialized from
    std::string integrity_tag;      // Content digest of the source
};

struct TableLoadError {
    std::string table_name;
    std::string source;
    std::string message;
};

struct LoadReport {
    bool success = false;           // At least one table loaded
    std::vector<TableInfo> loaded;
    std::vector<TableLoadError> errors;
    size_t skipped_unchanged = 0;   // Same integrity tag already materialized
};

// ============================================================================
// Validation
// ============================================================================

struct ValidationRules {
    bool strict_ordering = false;
    std::optional<double> numeric_tolerance;    // Relative epsilon
};

struct RowDiffSummary {
    size_t expected_rows = 0;
    size_t actual_rows = 0;
    size_t matched_rows = 0;
    size_t missing_rows = 0;        // Expected but not produced
    size_t unexpected_rows = 0;     // Produced but not expected
};

struct ValidationOutcome {
    bool is_correct = false;
    double score = 0.0;             // 0-100
    RowDiffSummary diff;
    std::vector<std::string> feedback;
    bool low_confidence = false;    // Anti-hardcoding advisory flag
};

// ============================================================================
// Grading
// ============================================================================

struct TestCaseResult {
    std::string id;
    std::string name;
    bool hidden = false;
    bool passed = false;
    double score = 0.0;
    std::vector<std::string> feedback;
};

/**
 * @brief Everything returned to a learner for one graded query
 */
struct GradeReport {
    std::string problem_id;
    ValidationOutcome outcome;
    std::vector<TestCaseResult> test_cases;
    std::vector<std::string> columns;
    std::vector<Row> preview_rows;              // First rows of the learner's output
    size_t row_count = 0;
    std::chrono::microseconds execution_time{0};
    bool cached = false;
};

} // namespace sqlsandbox
