#include "validation/result_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <unordered_map>

namespace sqlsandbox {

namespace {

std::optional<double> as_number(const Cell& c) {
    if (const auto* i = std::get_if<int64_t>(&c)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&c)) return *d;
    if (const auto* s = std::get_if<std::string>(&c)) {
        return utils::try_parse_double(utils::trim(*s));
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const Cell& c) {
    if (const auto* b = std::get_if<bool>(&c)) return *b;
    if (const auto* i = std::get_if<int64_t>(&c)) {
        if (*i == 0 || *i == 1) return *i == 1;
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&c)) {
        const auto v = utils::to_lower(utils::trim(*s));
        if (v == "true" || v == "1") return true;
        if (v == "false" || v == "0") return false;
    }
    return std::nullopt;
}

// Key under which exactly-equal cells collide; a first pass pairs rows by
// key before the tolerance-aware fallback.
std::string exact_key(const Cell& c) {
    if (is_null(c)) return "N";
    if (std::holds_alternative<bool>(c)) return std::get<bool>(c) ? "B1" : "B0";
    if (auto n = as_number(c)) {
        if (*n == 0.0) return "D0";     // Folds -0.0
        return std::format("D{}", *n);
    }
    return "S" + utils::trim(std::get<std::string>(c));
}

bool is_generated_name(const std::string& name) {
    return name.find('(') != std::string::npos || name == "?column?";
}

std::string row_key(const Row& row) {
    std::string key;
    for (const auto& cell : row) {
        key += exact_key(cell);
        key += '\x1f';
    }
    return key;
}

} // anonymous namespace

ResultValidator::ResultValidator(const Config& config)
    : config_(config) {}

// ============================================================================
// Cell Comparison
// ============================================================================

bool ResultValidator::numbers_equal(double expected, double actual, double tolerance) {
    if (std::isnan(expected) || std::isnan(actual)) {
        return std::isnan(expected) && std::isnan(actual);
    }
    if (expected == actual) return true;
    if (tolerance <= 0.0) return false;
    if (expected == 0.0) return std::fabs(actual) <= tolerance;
    return std::fabs(actual - expected) / std::fabs(expected) <= tolerance;
}

bool ResultValidator::cells_equal(const Cell& expected, const Cell& actual, double tolerance) {
    const bool e_null = is_null(expected);
    const bool a_null = is_null(actual);
    if (e_null || a_null) return e_null && a_null;

    // Same type: typed comparison
    if (expected.index() == actual.index()) {
        if (const auto* e = std::get_if<int64_t>(&expected)) return *e == std::get<int64_t>(actual);
        if (const auto* e = std::get_if<double>(&expected)) {
            return numbers_equal(*e, std::get<double>(actual), tolerance);
        }
        if (const auto* e = std::get_if<bool>(&expected)) return *e == std::get<bool>(actual);
        const auto& es = std::get<std::string>(expected);
        const auto& as = std::get<std::string>(actual);
        if (es == as || utils::trim(es) == utils::trim(as)) return true;
        const auto en = as_number(expected);
        const auto an = as_number(actual);
        return en && an && numbers_equal(*en, *an, tolerance);
    }

    if (std::holds_alternative<bool>(expected) || std::holds_alternative<bool>(actual)) {
        const auto eb = as_bool(expected);
        const auto ab = as_bool(actual);
        return eb && ab && *eb == *ab;
    }

    // int <-> float and numeric strings
    const auto en = as_number(expected);
    const auto an = as_number(actual);
    if (en && an) return numbers_equal(*en, *an, tolerance);

    return utils::trim(cell_to_string(expected)) == utils::trim(cell_to_string(actual));
}

bool ResultValidator::rows_equal(const Row& expected, const Row& actual, double tolerance) const {
    if (expected.size() != actual.size()) return false;
    for (size_t i = 0; i < expected.size(); ++i) {
        if (!cells_equal(expected[i], actual[i], tolerance)) return false;
    }
    return true;
}

// ============================================================================
// Feedback
// ============================================================================

std::string ResultValidator::describe_row(const std::vector<std::string>& columns, const Row& row) const {
    std::string out = "{";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out += ", ";
        const auto& name = i < columns.size() ? columns[i] : std::format("col{}", i + 1);
        if (std::holds_alternative<std::string>(row[i])) {
            out += std::format("{}: \"{}\"", name, std::get<std::string>(row[i]));
        } else {
            out += std::format("{}: {}", name, cell_to_string(row[i]));
        }
    }
    out += "}";
    return out;
}

std::string ResultValidator::describe_mismatch(const std::vector<std::string>& columns,
                                               const Row& expected, const Row& actual,
                                               double tolerance) const {
    std::string detail;
    for (size_t i = 0; i < expected.size() && i < actual.size(); ++i) {
        if (cells_equal(expected[i], actual[i], tolerance)) continue;
        if (!detail.empty()) detail += "; ";
        detail += std::format("{} expected {}, got {}", columns[i],
                              cell_to_string(expected[i]), cell_to_string(actual[i]));
    }
    return detail;
}

// ============================================================================
// Comparison Pipeline
// ============================================================================

Result<ValidationOutcome> ResultValidator::compare(const ResultSet& actual,
                                                   const ResultSet& expected,
                                                   const ValidationRules& rules) const {
    for (size_t i = 0; i < expected.rows.size(); ++i) {
        if (expected.rows[i].size() != expected.columns.size()) {
            return Result<ValidationOutcome>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("Expected row {} has {} values for {} columns",
                            i + 1, expected.rows[i].size(), expected.columns.size()));
        }
    }

    ValidationOutcome outcome;
    outcome.diff.expected_rows = expected.rows.size();
    outcome.diff.actual_rows = actual.rows.size();
    const double tolerance = rules.numeric_tolerance.value_or(config_.numeric_tolerance);

    // ===== 1. Column set =====
    std::vector<std::string> expected_lower;
    expected_lower.reserve(expected.columns.size());
    for (const auto& c : expected.columns) expected_lower.push_back(utils::to_lower(c));

    std::vector<std::string> notes;
    std::vector<std::string> missing_cols;
    std::vector<std::optional<size_t>> mapping(expected.columns.size());
    std::vector<bool> used(actual.columns.size(), false);
    for (size_t e = 0; e < expected_lower.size(); ++e) {
        for (size_t a = 0; a < actual.columns.size(); ++a) {
            if (!used[a] && utils::to_lower(actual.columns[a]) == expected_lower[e]) {
                mapping[e] = a;
                used[a] = true;
                break;
            }
        }
        if (!mapping[e]) missing_cols.push_back(expected.columns[e]);
    }
    // Unaliased expressions (engine-generated names such as "sum(amount)")
    // take the place of missing expected columns by position
    std::vector<size_t> unnamed;
    for (size_t a = 0; a < actual.columns.size(); ++a) {
        if (!used[a] && is_generated_name(actual.columns[a])) unnamed.push_back(a);
    }
    if (!missing_cols.empty() && unnamed.size() == missing_cols.size()) {
        size_t next = 0;
        for (size_t e = 0; e < mapping.size(); ++e) {
            if (mapping[e]) continue;
            mapping[e] = unnamed[next];
            used[unnamed[next]] = true;
            notes.push_back(std::format("Column {} matched to {} by position",
                                        actual.columns[unnamed[next]], expected.columns[e]));
            ++next;
        }
        missing_cols.clear();
    }

    std::vector<std::string> extra_cols;
    for (size_t a = 0; a < actual.columns.size(); ++a) {
        if (!used[a]) extra_cols.push_back(actual.columns[a]);
    }

    if (!missing_cols.empty() || !extra_cols.empty()) {
        auto list = [](const std::vector<std::string>& v) {
            std::string out;
            for (const auto& s : v) out += (out.empty() ? "" : ", ") + s;
            return out;
        };
        if (!missing_cols.empty()) {
            outcome.feedback.push_back(std::format("Missing columns: {}", list(missing_cols)));
        }
        if (!extra_cols.empty()) {
            outcome.feedback.push_back(std::format("Unexpected columns: {}", list(extra_cols)));
        }
        outcome.diff.missing_rows = expected.rows.size();
        outcome.diff.unexpected_rows = actual.rows.size();
        return Result<ValidationOutcome>::ok(std::move(outcome));
    }

    // ===== 2. Row count =====
    if (expected.rows.size() != actual.rows.size()) {
        outcome.feedback.push_back(std::format("Expected {} rows, got {}",
                                               expected.rows.size(), actual.rows.size()));
        outcome.diff.missing_rows = expected.rows.size() > actual.rows.size()
            ? expected.rows.size() - actual.rows.size() : 0;
        outcome.diff.unexpected_rows = actual.rows.size() > expected.rows.size()
            ? actual.rows.size() - expected.rows.size() : 0;
        return Result<ValidationOutcome>::ok(std::move(outcome));
    }

    // Actual rows projected into expected column order
    std::vector<Row> aligned;
    aligned.reserve(actual.rows.size());
    for (const auto& row : actual.rows) {
        Row projected;
        projected.reserve(mapping.size());
        for (const auto& idx : mapping) {
            projected.push_back(*idx < row.size() ? row[*idx] : Cell{});
        }
        aligned.push_back(std::move(projected));
    }

    // ===== 3-6. Content, normalization, tolerance, ordering =====
    std::vector<std::pair<size_t, size_t>> mismatched;     // (expected idx, actual idx)
    std::vector<size_t> missing;
    std::vector<size_t> unexpected;
    size_t matched = 0;

    if (rules.strict_ordering) {
        for (size_t i = 0; i < expected.rows.size(); ++i) {
            if (rows_equal(expected.rows[i], aligned[i], tolerance)) {
                ++matched;
            } else {
                mismatched.emplace_back(i, i);
            }
        }
    } else {
        std::vector<bool> taken(aligned.size(), false);
        std::vector<bool> satisfied(expected.rows.size(), false);

        std::unordered_map<std::string, std::vector<size_t>> by_key;
        for (size_t a = 0; a < aligned.size(); ++a) {
            by_key[row_key(aligned[a])].push_back(a);
        }
        for (size_t e = 0; e < expected.rows.size(); ++e) {
            auto it = by_key.find(row_key(expected.rows[e]));
            if (it == by_key.end() || it->second.empty()) continue;
            taken[it->second.back()] = true;
            it->second.pop_back();
            satisfied[e] = true;
            ++matched;
        }

        // Tolerance and cross-type pairs need the cell-wise comparison
        for (size_t e = 0; e < expected.rows.size(); ++e) {
            if (satisfied[e]) continue;
            for (size_t a = 0; a < aligned.size(); ++a) {
                if (!taken[a] && rows_equal(expected.rows[e], aligned[a], tolerance)) {
                    taken[a] = true;
                    satisfied[e] = true;
                    ++matched;
                    break;
                }
            }
            if (!satisfied[e]) missing.push_back(e);
        }
        for (size_t a = 0; a < aligned.size(); ++a) {
            if (!taken[a]) unexpected.push_back(a);
        }
    }

    outcome.diff.matched_rows = matched;
    outcome.diff.missing_rows = expected.rows.size() - matched;
    outcome.diff.unexpected_rows = actual.rows.size() - matched;

    if (outcome.diff.missing_rows == 0 && outcome.diff.unexpected_rows == 0) {
        outcome.is_correct = true;
        outcome.score = 100.0;
        outcome.feedback.push_back(std::format("All {} rows match", expected.rows.size()));
        outcome.feedback.insert(outcome.feedback.end(), notes.begin(), notes.end());
        return Result<ValidationOutcome>::ok(std::move(outcome));
    }

    outcome.score = expected.rows.empty()
        ? 0.0
        : 100.0 * static_cast<double>(matched) / static_cast<double>(expected.rows.size());

    const size_t limit = config_.max_feedback_rows;
    size_t reported = 0;
    size_t differing = 0;

    if (rules.strict_ordering) {
        differing = mismatched.size();
        for (const auto& [e, a] : mismatched) {
            if (reported >= limit) break;
            outcome.feedback.push_back(std::format("Row {}: {}", e + 1,
                describe_mismatch(expected.columns, expected.rows[e], aligned[a], tolerance)));
            ++reported;
        }
    } else {
        // Pair leftovers in order so each line shows what differs
        const size_t pairs = std::min(missing.size(), unexpected.size());
        differing = std::max(missing.size(), unexpected.size());
        for (size_t i = 0; i < pairs && reported < limit; ++i, ++reported) {
            outcome.feedback.push_back(std::format("Expected row {} but got {} ({})",
                describe_row(expected.columns, expected.rows[missing[i]]),
                describe_row(expected.columns, aligned[unexpected[i]]),
                describe_mismatch(expected.columns, expected.rows[missing[i]],
                                  aligned[unexpected[i]], tolerance)));
        }
        for (size_t i = pairs; i < missing.size() && reported < limit; ++i, ++reported) {
            outcome.feedback.push_back(std::format("Missing row {}",
                describe_row(expected.columns, expected.rows[missing[i]])));
        }
        for (size_t i = pairs; i < unexpected.size() && reported < limit; ++i, ++reported) {
            outcome.feedback.push_back(std::format("Unexpected row {}",
                describe_row(expected.columns, aligned[unexpected[i]])));
        }
    }

    if (differing > reported) {
        outcome.feedback.push_back(std::format("... and {} more differing rows", differing - reported));
    }
    return Result<ValidationOutcome>::ok(std::move(outcome));
}

} // namespace sqlsandbox
