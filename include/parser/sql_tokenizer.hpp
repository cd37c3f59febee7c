#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlsandbox {

/**
 * @brief One lexical element of a SQL statement
 *
 * Parenthesized regions become a GROUP token whose children hold the
 * enclosed tokens, so subqueries, CTE bodies and function arguments form a
 * tree. Comments are dropped during tokenization.
 */
struct SqlToken {
    enum class Kind {
        WORD,               // Keyword or unquoted identifier (text uppercased)
        QUOTED_IDENTIFIER,  // "name"
        STRING,             // 'text', E'text', $tag$text$tag$
        NUMBER,
        PARAMETER,          // $1, ?
        OPERATOR,           // Any other punctuation run
        COMMA,
        SEMICOLON,
        GROUP               // ( children )
    };

    Kind kind = Kind::OPERATOR;
    std::string text;           // WORD: uppercase; STRING: unquoted content
    size_t offset = 0;          // Byte offset in the source text
    std::vector<SqlToken> children;

    [[nodiscard]] bool is_word(std::string_view upper) const {
        return kind == Kind::WORD && text == upper;
    }
};

using TokenList = std::vector<SqlToken>;

/**
 * @brief Dialect-tolerant SQL lexer producing a token tree
 *
 * Understands single-quoted strings with '' escapes, double-quoted
 * identifiers, dollar-quoted strings, line and (nested) block comments.
 * Thread-safety: stateless.
 */
class SqlTokenizer {
public:
    /**
     * @brief Tokenize SQL text
     * @return Token tree, or INVALID_REQUEST for unterminated strings,
     *         comments or unbalanced parentheses
     */
    [[nodiscard]] static Result<TokenList> tokenize(std::string_view sql);

    /**
     * @brief Split a token list on top-level semicolons
     *
     * Empty statements (e.g. after a trailing semicolon) are dropped.
     */
    [[nodiscard]] static std::vector<TokenList> split_statements(const TokenList& tokens);

    /**
     * @brief Collect every WORD token at any nesting depth, in source order
     */
    static void collect_words(const TokenList& tokens, std::vector<const SqlToken*>& out);

    /**
     * @brief First WORD of a statement, descending into leading groups
     *
     * "(SELECT 1) UNION SELECT 2" yields SELECT.
     */
    [[nodiscard]] static std::optional<std::string> first_keyword(const TokenList& tokens);

    /**
     * @brief Source text with every comment replaced by one space
     *
     * Comment boundaries come from the same lexer as tokenize(), so a "--"
     * inside a string literal is left alone. Fails exactly when tokenize()
     * fails.
     */
    [[nodiscard]] static Result<std::string> strip_comments(std::string_view sql);

    /// Maximum parenthesis nesting accepted before tokenization fails.
    static constexpr size_t kMaxDepth = 256;

private:
    using Span = std::pair<size_t, size_t>;     // [begin, end) byte range

    [[nodiscard]] static Result<TokenList> lex(std::string_view sql, std::vector<Span>* comments);
};

} // namespace sqlsandbox
