#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "problem/problem_repository.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "validation/hardcode_detector.hpp"
#include "validation/result_validator.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sqlsandbox {

/**
 * @brief Runs one learner query and scores it against a problem's test cases
 *
 * The query executes once; its output is compared to every applicable test
 * case. Hidden cases take part only when include_hidden is set, and their
 * feedback never reveals expected data. The anti-hardcoding variant runs
 * only for answers that passed, and only adds an advisory flag.
 */
class Grader {
public:
    struct Config {
        double pass_threshold = 95.0;       // Per-case score needed to pass
        size_t preview_rows = 10;
    };

    Grader(const Config& config,
           std::shared_ptr<SandboxEngine> engine,
           std::shared_ptr<IProblemRepository> problems,
           std::shared_ptr<const ResultValidator> validator,
           std::shared_ptr<const HardcodeDetector> detector);

    /**
     * @return the report for a graded query (correct or not); an error only
     *         when the query could not be run or compared
     */
    [[nodiscard]] Result<GradeReport> grade(const std::string& user_id,
                                            const std::string& problem_id,
                                            const std::string& sql,
                                            bool include_hidden);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    // diff is set for row-compared cases
    [[nodiscard]] Result<TestCaseResult> run_case(const TestCase& test, const ResultSet& actual,
                                                  std::optional<RowDiffSummary>& diff) const;

    Config config_;
    std::shared_ptr<SandboxEngine> engine_;
    std::shared_ptr<IProblemRepository> problems_;
    std::shared_ptr<const ResultValidator> validator_;
    std::shared_ptr<const HardcodeDetector> detector_;
};

} // namespace sqlsandbox
