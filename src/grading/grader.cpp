#include "grading/grader.hpp"
#include "core/utils.hpp"
#include "validation/result_hasher.hpp"

#include <algorithm>
#include <format>

namespace sqlsandbox {

Grader::Grader(const Config& config,
               std::shared_ptr<SandboxEngine> engine,
               std::shared_ptr<IProblemRepository> problems,
               std::shared_ptr<const ResultValidator> validator,
               std::shared_ptr<const HardcodeDetector> detector)
    : config_(config),
      engine_(std::move(engine)),
      problems_(std::move(problems)),
      validator_(std::move(validator)),
      detector_(std::move(detector)) {}

Result<TestCaseResult> Grader::run_case(const TestCase& test, const ResultSet& actual,
                                        std::optional<RowDiffSummary>& diff) const {
    TestCaseResult result;
    result.id = test.id;
    result.name = test.name;
    result.hidden = test.hidden;

    if (test.expected) {
        auto outcome = validator_->compare(actual, *test.expected, test.rules);
        if (outcome.is_error()) {
            return Result<TestCaseResult>::error(outcome.error_category(),
                std::format("Test case {}: {}", test.id, outcome.error_message()));
        }
        result.score = outcome.value().score;
        diff = outcome.value().diff;
        result.feedback = std::move(outcome.value().feedback);
    } else {
        const bool match = ResultHasher::matches(actual, *test.expected_hash, test.rules.strict_ordering);
        result.score = match ? 100.0 : 0.0;
        result.feedback.push_back(match
            ? "Result digest matches the expected answer"
            : "Result digest does not match the expected answer");
    }

    result.passed = result.score >= config_.pass_threshold;
    return Result<TestCaseResult>::ok(std::move(result));
}

Result<GradeReport> Grader::grade(const std::string& user_id,
                                  const std::string& problem_id,
                                  const std::string& sql,
                                  bool include_hidden) {
    using R = Result<GradeReport>;

    auto problem = problems_->get(problem_id);
    if (problem.is_error()) return R::error(problem.error_category(), problem.error_message());
    const auto& def = problem.value();

    auto prepared = engine_->prepare(user_id, problem_id, def.datasets);
    if (prepared.is_error()) return R::error(prepared.error_category(), prepared.error_message());
    auto& sandbox = *prepared.value().sandbox;

    auto executed = engine_->execute(sandbox, sql);
    if (executed.is_error()) return R::error(executed.error_category(), executed.error_message());
    const auto& actual = executed.value();

    if (actual.truncated) {
        return R::error(ErrorCategory::RESOURCE_LIMIT_EXCEEDED,
            std::format("Query returned more than {} rows; narrow the result and try again",
                actual.rows.size()));
    }

    GradeReport report;
    report.problem_id = problem_id;
    report.columns = actual.columns;
    report.row_count = actual.rows.size();
    report.execution_time = actual.execution_time;
    const size_t preview = std::min(config_.preview_rows, actual.rows.size());
    report.preview_rows.assign(actual.rows.begin(), actual.rows.begin() + static_cast<std::ptrdiff_t>(preview));

    double total = 0.0;
    bool all_passed = true;
    bool diff_taken = false;

    for (const auto& test : def.test_cases) {
        if (test.hidden && !include_hidden) continue;

        std::optional<RowDiffSummary> diff;
        auto ran = run_case(test, actual, diff);
        if (ran.is_error()) return R::error(ran.error_category(), ran.error_message());
        auto tc = std::move(ran.value());

        // Row-level summary of the first visible row-compared case; a hidden
        // case's diff would reveal the size of its expected answer
        if (!diff_taken && diff && !test.hidden) {
            report.outcome.diff = *diff;
            diff_taken = true;
        }

        total += tc.score;
        all_passed = all_passed && tc.passed;

        if (!tc.passed) {
            if (tc.hidden) {
                report.outcome.feedback.push_back(std::format("Hidden test case '{}' failed", tc.name));
                tc.feedback.clear();
            } else {
                for (const auto& line : tc.feedback) {
                    report.outcome.feedback.push_back(std::format("[{}] {}", tc.name, line));
                }
            }
        }
        report.test_cases.push_back(std::move(tc));
    }

    if (report.test_cases.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("Problem {} has no test case to grade against", problem_id));
    }

    report.outcome.score = total / static_cast<double>(report.test_cases.size());
    report.outcome.is_correct = all_passed;
    if (all_passed) {
        report.outcome.feedback.push_back(std::format("All {} test case(s) passed", report.test_cases.size()));

        if (def.anti_hardcode && detector_ && detector_->enabled()) {
            const auto verdict = detector_->check(sandbox, sql, actual);
            report.outcome.low_confidence = verdict.low_confidence;
            if (verdict.low_confidence) {
                utils::log::info(std::format("Possible hardcoded answer by {} on {}", user_id, problem_id));
                report.outcome.feedback.push_back(verdict.note);
            }
        }
    }

    return R::ok(std::move(report));
}

} // namespace sqlsandbox
