#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Deterministic comparison of query output against an expected answer
 *
 * Checks, cheapest first, stopping at the first failure:
 * 1. Column set (case-insensitive, order-independent)
 * 2. Row count
 * 3. Row content as a multiset, or position by position with strict ordering.
 *    Cells are compared with type normalization (int == equal float,
 *    NULL == NULL, numeric strings coerce, booleans against 1/0) and an
 *    optional relative numeric tolerance (absolute when expected is 0).
 *
 * A column or row-count failure scores 0; a content failure scores the
 * fraction of expected rows that were matched.
 */
class ResultValidator {
public:
    struct Config {
        double numeric_tolerance = 0.001;   // Used when the rules set none
        size_t max_feedback_rows = 3;
    };

    ResultValidator() : ResultValidator(Config{}) {}
    explicit ResultValidator(const Config& config);

    /**
     * @return VALIDATION_ERROR when the expected data itself is malformed;
     *         a wrong answer is a successful result with is_correct = false
     */
    [[nodiscard]] Result<ValidationOutcome> compare(const ResultSet& actual,
                                                    const ResultSet& expected,
                                                    const ValidationRules& rules) const;

    [[nodiscard]] static bool cells_equal(const Cell& expected, const Cell& actual, double tolerance);
    [[nodiscard]] static bool numbers_equal(double expected, double actual, double tolerance);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] bool rows_equal(const Row& expected, const Row& actual, double tolerance) const;
    [[nodiscard]] std::string describe_row(const std::vector<std::string>& columns, const Row& row) const;
    [[nodiscard]] std::string describe_mismatch(const std::vector<std::string>& columns,
                                                const Row& expected, const Row& actual,
                                                double tolerance) const;

    Config config_;
};

} // namespace sqlsandbox
