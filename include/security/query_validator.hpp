#pragma once

#include "core/types.hpp"
#include "parser/sql_tokenizer.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Multi-layer static analysis of learner SQL
 *
 * Layers, in order:
 * 1. Length and emptiness limits
 * 2. Control character stripping (tab/newline/CR survive)
 * 3. Statement splitting: exactly one statement
 * 4. Recursive keyword deny-list over the whole token tree
 * 5. Leading keyword must be SELECT or WITH
 * 6. Deny patterns for file, network and system access
 * 7. Complexity signals (warnings only)
 *
 * validate_fast() stops after layer 5 and is used at submission time;
 * validate() runs every layer plus a libpg_query AST pass and is used
 * inside the sandbox before each execution.
 *
 * Thread-safety: immutable after construction, safe for concurrent use.
 */
class QueryValidator {
public:
    struct Config {
        size_t max_query_length = 10000;
        bool ast_analysis = true;       // libpg_query pass in validate()
    };

    struct ComplexitySignals {
        size_t tables = 0;
        size_t joins = 0;
        size_t functions = 0;
        size_t subqueries = 0;
        size_t where_clauses = 0;

        [[nodiscard]] size_t score() const {
            return tables * 2 + joins * 3 + functions * 2 + subqueries * 5 + where_clauses;
        }
    };

    QueryValidator() : QueryValidator(Config{}) {}
    explicit QueryValidator(const Config& config);

    /**
     * @brief Exhaustive validation (all layers)
     */
    [[nodiscard]] SecurityVerdict validate(std::string_view sql) const;

    /**
     * @brief Keyword-level validation (layers 1-5)
     */
    [[nodiscard]] SecurityVerdict validate_fast(std::string_view sql) const;

    /**
     * @brief Lexical complexity signals of a tokenized statement
     */
    [[nodiscard]] static ComplexitySignals measure_complexity(const TokenList& tokens);

    [[nodiscard]] static std::string strip_control_chars(std::string_view sql);
    [[nodiscard]] static bool is_denied_keyword(std::string_view upper_word);

    static constexpr std::string_view kMultipleStatementsError =
        "Multiple statements not allowed. Only single SELECT or WITH statements permitted.";

private:
    struct DenyPattern {
        std::regex pattern;
        std::string message;
        std::string operation;
    };

    [[nodiscard]] SecurityVerdict run(std::string_view sql, bool exhaustive) const;

    void check_keywords(const TokenList& tokens, SecurityVerdict& verdict) const;
    void check_leading_keyword(const TokenList& statement, SecurityVerdict& verdict) const;
    void check_patterns(const std::string& sql, const TokenList& tokens, SecurityVerdict& verdict) const;
    void check_complexity(const ComplexitySignals& signals, SecurityVerdict& verdict) const;
    void analyze_ast(const std::string& sql, SecurityVerdict& verdict,
                     ComplexitySignals& signals) const;

    static void elevate(SecurityVerdict& verdict, RiskLevel level);
    static void add_unique(std::vector<std::string>& list, std::string value);

    Config config_;
    std::vector<DenyPattern> patterns_;
};

} // namespace sqlsandbox
