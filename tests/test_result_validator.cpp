#include <catch2/catch_test_macros.hpp>
#include "validation/result_validator.hpp"

#include <string>

using namespace sqlsandbox;

namespace {

ResultSet make_set(std::vector<std::string> columns, std::vector<Row> rows) {
    ResultSet rs;
    rs.columns = std::move(columns);
    rs.rows = std::move(rows);
    return rs;
}

const ResultSet kExpected = make_set({"region", "total"}, {
    {std::string("North"), 800.25},
    {std::string("South"), 120.5},
});

} // anonymous namespace

TEST_CASE("ResultValidator: identical result is correct", "[result_validator]") {
    ResultValidator validator;
    auto r = validator.compare(kExpected, kExpected, {});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    CHECK(o.is_correct);
    CHECK(o.score == 100.0);
    CHECK(o.diff.matched_rows == 2);
    CHECK(o.diff.missing_rows == 0);
    CHECK(o.diff.unexpected_rows == 0);
    CHECK(o.feedback.front() == "All 2 rows match");
}

TEST_CASE("ResultValidator: column names are case-insensitive and order-free", "[result_validator]") {
    ResultValidator validator;
    auto actual = make_set({"TOTAL", "Region"}, {
        {120.5, std::string("South")},
        {800.25, std::string("North")},
    });
    auto r = validator.compare(actual, kExpected, {});
    REQUIRE(r.is_ok());
    CHECK(r.value().is_correct);
}

TEST_CASE("ResultValidator: column set mismatch scores zero", "[result_validator]") {
    ResultValidator validator;
    auto actual = make_set({"region", "sum_total"}, {
        {std::string("North"), 800.25},
        {std::string("South"), 120.5},
    });
    auto r = validator.compare(actual, kExpected, {});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    CHECK_FALSE(o.is_correct);
    CHECK(o.score == 0.0);
    REQUIRE(o.feedback.size() == 2);
    CHECK(o.feedback[0] == "Missing columns: total");
    CHECK(o.feedback[1] == "Unexpected columns: sum_total");
}

TEST_CASE("ResultValidator: unaliased expression matches by position", "[result_validator]") {
    ResultValidator validator;
    auto actual = make_set({"region", "sum(amount)"}, {
        {std::string("North"), 800.25},
        {std::string("South"), 120.5},
    });
    auto r = validator.compare(actual, kExpected, {});
    REQUIRE(r.is_ok());
    CHECK(r.value().is_correct);
    CHECK(r.value().feedback.back().find("matched to total by position") != std::string::npos);
}

TEST_CASE("ResultValidator: row count mismatch scores zero", "[result_validator]") {
    ResultValidator validator;
    auto actual = make_set({"region", "total"}, {{std::string("North"), 800.25}});
    auto r = validator.compare(actual, kExpected, {});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    CHECK_FALSE(o.is_correct);
    CHECK(o.score == 0.0);
    CHECK(o.feedback.front() == "Expected 2 rows, got 1");
    CHECK(o.diff.missing_rows == 1);
}

TEST_CASE("ResultValidator: content mismatch scores matched fraction", "[result_validator]") {
    ResultValidator validator;
    auto actual = make_set({"region", "total"}, {
        {std::string("North"), 800.25},
        {std::string("South"), 999.0},
    });
    auto r = validator.compare(actual, kExpected, {});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    CHECK_FALSE(o.is_correct);
    CHECK(o.score == 50.0);
    CHECK(o.diff.matched_rows == 1);
    REQUIRE_FALSE(o.feedback.empty());
    CHECK(o.feedback.front().find("total expected 120.5, got 999") != std::string::npos);
}

TEST_CASE("ResultValidator: type normalization", "[result_validator]") {
    SECTION("Integer equals equal float") {
        CHECK(ResultValidator::cells_equal(int64_t{5}, 5.0, 0.0));
    }
    SECTION("NULL only equals NULL") {
        CHECK(ResultValidator::cells_equal(Cell{}, Cell{}, 0.0));
        CHECK_FALSE(ResultValidator::cells_equal(Cell{}, int64_t{0}, 0.0));
        CHECK_FALSE(ResultValidator::cells_equal(std::string("NULL"), Cell{}, 0.0));
    }
    SECTION("Numeric strings coerce") {
        CHECK(ResultValidator::cells_equal(std::string("42"), int64_t{42}, 0.0));
        CHECK(ResultValidator::cells_equal(std::string(" 3.50 "), 3.5, 0.0));
    }
    SECTION("Booleans against 1/0") {
        CHECK(ResultValidator::cells_equal(true, int64_t{1}, 0.0));
        CHECK(ResultValidator::cells_equal(false, std::string("false"), 0.0));
        CHECK_FALSE(ResultValidator::cells_equal(true, int64_t{2}, 0.0));
    }
    SECTION("Strings compare after trimming, case-sensitive") {
        CHECK(ResultValidator::cells_equal(std::string("North"), std::string("North "), 0.0));
        CHECK_FALSE(ResultValidator::cells_equal(std::string("North"), std::string("north"), 0.0));
    }
}

TEST_CASE("ResultValidator: numeric tolerance is relative", "[result_validator]") {
    CHECK(ResultValidator::numbers_equal(1000.0, 1000.5, 0.001));
    CHECK_FALSE(ResultValidator::numbers_equal(1000.0, 1002.0, 0.001));
    // Expected zero uses the tolerance as an absolute bound
    CHECK(ResultValidator::numbers_equal(0.0, 0.0005, 0.001));
    CHECK_FALSE(ResultValidator::numbers_equal(0.0, 0.01, 0.001));
    CHECK_FALSE(ResultValidator::numbers_equal(1.0, 1.0000001, 0.0));

    ResultValidator validator;
    auto actual = make_set({"region", "total"}, {
        {std::string("North"), 800.2501},
        {std::string("South"), 120.5},
    });
    ValidationRules exact;
    exact.numeric_tolerance = 0.0;
    CHECK(validator.compare(actual, kExpected, {}).value().is_correct);
    CHECK_FALSE(validator.compare(actual, kExpected, exact).value().is_correct);
}

TEST_CASE("ResultValidator: ordering", "[result_validator]") {
    ResultValidator validator;
    auto reversed = make_set({"region", "total"}, {
        {std::string("South"), 120.5},
        {std::string("North"), 800.25},
    });

    SECTION("Multiset comparison ignores order") {
        CHECK(validator.compare(reversed, kExpected, {}).value().is_correct);
    }
    SECTION("Strict ordering compares by position") {
        ValidationRules rules;
        rules.strict_ordering = true;
        auto r = validator.compare(reversed, kExpected, rules);
        REQUIRE(r.is_ok());
        CHECK_FALSE(r.value().is_correct);
        CHECK(r.value().score == 0.0);
        CHECK(r.value().feedback.front().starts_with("Row 1:"));
    }
}

TEST_CASE("ResultValidator: duplicate rows count as a multiset", "[result_validator]") {
    ResultValidator validator;
    auto expected = make_set({"x"}, {{int64_t{1}}, {int64_t{1}}, {int64_t{2}}});
    auto actual = make_set({"x"}, {{int64_t{1}}, {int64_t{2}}, {int64_t{2}}});
    auto r = validator.compare(actual, expected, {});
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().is_correct);
    CHECK(r.value().diff.matched_rows == 2);
}

TEST_CASE("ResultValidator: feedback is capped", "[result_validator]") {
    ResultValidator::Config cfg;
    cfg.max_feedback_rows = 2;
    ResultValidator validator(cfg);

    auto expected = make_set({"x"}, {{int64_t{1}}, {int64_t{2}}, {int64_t{3}}, {int64_t{4}}});
    auto actual = make_set({"x"}, {{int64_t{5}}, {int64_t{6}}, {int64_t{7}}, {int64_t{8}}});
    auto r = validator.compare(actual, expected, {});
    REQUIRE(r.is_ok());
    const auto& fb = r.value().feedback;
    REQUIRE(fb.size() == 3);
    CHECK(fb.back() == "... and 2 more differing rows");
}

TEST_CASE("ResultValidator: malformed expected data is a validation error", "[result_validator]") {
    ResultValidator validator;
    auto expected = make_set({"a", "b"}, {{int64_t{1}}});
    auto r = validator.compare(expected, expected, {});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
}
