#include "grading/report_json.hpp"

namespace sqlsandbox {

nlohmann::json cell_to_json(const Cell& cell) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, cell);
}

nlohmann::json outcome_to_json(const ValidationOutcome& outcome) {
    return {
        {"is_correct", outcome.is_correct},
        {"score", outcome.score},
        {"low_confidence", outcome.low_confidence},
        {"feedback", outcome.feedback},
        {"diff", {
            {"expected_rows", outcome.diff.expected_rows},
            {"actual_rows", outcome.diff.actual_rows},
            {"matched_rows", outcome.diff.matched_rows},
            {"missing_rows", outcome.diff.missing_rows},
            {"unexpected_rows", outcome.diff.unexpected_rows},
        }},
    };
}

nlohmann::json grade_report_to_json(const GradeReport& report) {
    nlohmann::json cases = nlohmann::json::array();
    for (const auto& tc : report.test_cases) {
        cases.push_back({
            {"id", tc.id},
            {"name", tc.name},
            {"hidden", tc.hidden},
            {"passed", tc.passed},
            {"score", tc.score},
            {"feedback", tc.feedback},
        });
    }

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : report.preview_rows) {
        nlohmann::json r = nlohmann::json::array();
        for (const auto& cell : row) r.push_back(cell_to_json(cell));
        rows.push_back(std::move(r));
    }

    return {
        {"problem_id", report.problem_id},
        {"outcome", outcome_to_json(report.outcome)},
        {"test_cases", std::move(cases)},
        {"columns", report.columns},
        {"preview_rows", std::move(rows)},
        {"row_count", report.row_count},
        {"execution_time_ms", static_cast<double>(report.execution_time.count()) / 1000.0},
        {"cached", report.cached},
    };
}

} // namespace sqlsandbox
