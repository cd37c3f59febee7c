#include "parser/sql_tokenizer.hpp"

#include <cctype>
#include <format>

namespace sqlsandbox {

namespace {

inline bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

// Non-ASCII bytes are accepted so UTF-8 identifiers stay one word
inline bool is_ident_start(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

inline bool is_ident_continue(unsigned char c) {
    return is_ident_start(c) || is_digit(c) || c == '$';
}

inline bool is_operator_char(unsigned char c) {
    switch (c) {
        case '+': case '-': case '*': case '/': case '<': case '>': case '=':
        case '~': case '!': case '@': case '#': case '%': case '^': case '&':
        case '|': case '`': case ':': case '.': case '[': case ']': case '{':
        case '}': case '\\':
            return true;
        default:
            return false;
    }
}

// Reads a quoted run starting at sql[i] == quote. Doubled quotes escape; with
// backslash_escapes (E'' strings) a backslash escapes the next byte.
std::optional<size_t> scan_quoted(std::string_view sql, size_t i, char quote,
                                  bool backslash_escapes, std::string& content) {
    ++i;
    while (i < sql.size()) {
        const char c = sql[i];
        if (backslash_escapes && c == '\\' && i + 1 < sql.size()) {
            content += sql[i + 1];
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < sql.size() && sql[i + 1] == quote) {
                content += quote;
                i += 2;
                continue;
            }
            return i + 1;
        }
        content += c;
        ++i;
    }
    return std::nullopt;
}

// $tag$ opener at sql[i]; returns the tag including both dollars, or empty
std::string_view dollar_tag(std::string_view sql, size_t i) {
    size_t j = i + 1;
    while (j < sql.size() && (is_ident_start(static_cast<unsigned char>(sql[j])) ||
                              is_digit(static_cast<unsigned char>(sql[j])))) {
        ++j;
    }
    if (j < sql.size() && sql[j] == '$') {
        // "$1$" is not a tag: tags cannot start with a digit
        if (j > i + 1 && is_digit(static_cast<unsigned char>(sql[i + 1]))) return {};
        return sql.substr(i, j - i + 1);
    }
    return {};
}

} // anonymous namespace

Result<TokenList> SqlTokenizer::tokenize(std::string_view sql) {
    return lex(sql, nullptr);
}

Result<std::string> SqlTokenizer::strip_comments(std::string_view sql) {
    std::vector<Span> comments;
    auto lexed = lex(sql, &comments);
    if (lexed.is_error()) {
        return Result<std::string>::error(lexed.error_category(), lexed.error_message());
    }

    std::string out;
    out.reserve(sql.size());
    size_t pos = 0;
    for (const auto& [begin, end] : comments) {
        out.append(sql.substr(pos, begin - pos));
        out += ' ';
        pos = end;
    }
    out.append(sql.substr(pos));
    return Result<std::string>::ok(std::move(out));
}

Result<TokenList> SqlTokenizer::lex(std::string_view sql, std::vector<Span>* comments) {
    std::vector<TokenList> stack(1);
    std::vector<size_t> open_offsets;

    auto emit = [&stack](SqlToken::Kind kind, std::string text, size_t offset) {
        SqlToken tok;
        tok.kind = kind;
        tok.text = std::move(text);
        tok.offset = offset;
        stack.back().push_back(std::move(tok));
    };

    const size_t n = sql.size();
    size_t i = 0;
    while (i < n) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const auto next = (i + 1 < n) ? static_cast<unsigned char>(sql[i + 1]) : static_cast<unsigned char>('\0');

        if (is_space(c)) {
            ++i;
            continue;
        }

        // -- line comment
        if (c == '-' && next == '-') {
            const size_t start = i;
            while (i < n && sql[i] != '\n') ++i;
            if (comments) comments->emplace_back(start, i);
            continue;
        }

        // /* block comment */ (nesting allowed)
        if (c == '/' && next == '*') {
            const size_t start = i;
            int depth = 1;
            i += 2;
            while (i < n && depth > 0) {
                if (sql[i] == '/' && i + 1 < n && sql[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (sql[i] == '*' && i + 1 < n && sql[i + 1] == '/') {
                    --depth;
                    i += 2;
                } else {
                    ++i;
                }
            }
            if (depth > 0) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Unterminated block comment starting at position {}", start));
            }
            if (comments) comments->emplace_back(start, i);
            continue;
        }

        // E'escaped string'
        if ((c == 'E' || c == 'e') && next == '\'') {
            std::string content;
            const auto end = scan_quoted(sql, i + 1, '\'', true, content);
            if (!end) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Unterminated string literal starting at position {}", i));
            }
            emit(SqlToken::Kind::STRING, std::move(content), i);
            i = *end;
            continue;
        }

        if (c == '\'') {
            std::string content;
            const auto end = scan_quoted(sql, i, '\'', false, content);
            if (!end) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Unterminated string literal starting at position {}", i));
            }
            emit(SqlToken::Kind::STRING, std::move(content), i);
            i = *end;
            continue;
        }

        if (c == '"') {
            std::string content;
            const auto end = scan_quoted(sql, i, '"', false, content);
            if (!end) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Unterminated quoted identifier starting at position {}", i));
            }
            emit(SqlToken::Kind::QUOTED_IDENTIFIER, std::move(content), i);
            i = *end;
            continue;
        }

        if (c == '$') {
            if (is_digit(next)) {
                const size_t start = i++;
                while (i < n && is_digit(static_cast<unsigned char>(sql[i]))) ++i;
                emit(SqlToken::Kind::PARAMETER, std::string(sql.substr(start, i - start)), start);
                continue;
            }
            const auto tag = dollar_tag(sql, i);
            if (!tag.empty()) {
                const size_t body = i + tag.size();
                const size_t close = sql.find(tag, body);
                if (close == std::string_view::npos) {
                    return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                        std::format("Unterminated dollar-quoted string starting at position {}", i));
                }
                emit(SqlToken::Kind::STRING, std::string(sql.substr(body, close - body)), i);
                i = close + tag.size();
                continue;
            }
        }

        if (is_digit(c) || (c == '.' && is_digit(next))) {
            const size_t start = i;
            while (i < n) {
                const auto d = static_cast<unsigned char>(sql[i]);
                if (is_digit(d) || d == '.' || d == '_') {
                    ++i;
                } else if ((d == 'e' || d == 'E') && i + 1 < n &&
                           (is_digit(static_cast<unsigned char>(sql[i + 1])) ||
                            ((sql[i + 1] == '+' || sql[i + 1] == '-') && i + 2 < n &&
                             is_digit(static_cast<unsigned char>(sql[i + 2]))))) {
                    i += 2;
                } else {
                    break;
                }
            }
            emit(SqlToken::Kind::NUMBER, std::string(sql.substr(start, i - start)), start);
            continue;
        }

        if (is_ident_start(c)) {
            const size_t start = i;
            std::string word;
            while (i < n && is_ident_continue(static_cast<unsigned char>(sql[i]))) {
                word += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[i])));
                ++i;
            }
            emit(SqlToken::Kind::WORD, std::move(word), start);
            continue;
        }

        if (c == '(') {
            if (stack.size() >= kMaxDepth) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Parenthesis nesting exceeds {} levels", kMaxDepth));
            }
            open_offsets.push_back(i);
            stack.emplace_back();
            ++i;
            continue;
        }

        if (c == ')') {
            if (stack.size() == 1) {
                return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("Unbalanced parentheses: unexpected ')' at position {}", i));
            }
            SqlToken group;
            group.kind = SqlToken::Kind::GROUP;
            group.text = "()";
            group.offset = open_offsets.back();
            group.children = std::move(stack.back());
            open_offsets.pop_back();
            stack.pop_back();
            stack.back().push_back(std::move(group));
            ++i;
            continue;
        }

        if (c == ',') {
            emit(SqlToken::Kind::COMMA, ",", i++);
            continue;
        }
        if (c == ';') {
            emit(SqlToken::Kind::SEMICOLON, ";", i++);
            continue;
        }
        if (c == '?') {
            emit(SqlToken::Kind::PARAMETER, "?", i++);
            continue;
        }

        // Operator run; stops before anything that starts a comment
        const size_t start = i;
        while (i < n) {
            const auto d = static_cast<unsigned char>(sql[i]);
            if (!is_operator_char(d)) break;
            if (i > start && ((d == '-' && i + 1 < n && sql[i + 1] == '-') ||
                              (d == '/' && i + 1 < n && sql[i + 1] == '*'))) {
                break;
            }
            ++i;
        }
        if (i == start) ++i;  // Unknown byte becomes a one-character operator
        emit(SqlToken::Kind::OPERATOR, std::string(sql.substr(start, i - start)), start);
    }

    if (stack.size() > 1) {
        return Result<TokenList>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Unbalanced parentheses: '(' at position {} is never closed",
                        open_offsets.back()));
    }
    return Result<TokenList>::ok(std::move(stack.front()));
}

std::vector<TokenList> SqlTokenizer::split_statements(const TokenList& tokens) {
    std::vector<TokenList> statements;
    TokenList current;
    for (const auto& tok : tokens) {
        if (tok.kind == SqlToken::Kind::SEMICOLON) {
            if (!current.empty()) {
                statements.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(tok);
    }
    if (!current.empty()) {
        statements.push_back(std::move(current));
    }
    return statements;
}

void SqlTokenizer::collect_words(const TokenList& tokens, std::vector<const SqlToken*>& out) {
    for (const auto& tok : tokens) {
        if (tok.kind == SqlToken::Kind::WORD) {
            out.push_back(&tok);
        } else if (tok.kind == SqlToken::Kind::GROUP) {
            collect_words(tok.children, out);
        }
    }
}

std::optional<std::string> SqlTokenizer::first_keyword(const TokenList& tokens) {
    for (const auto& tok : tokens) {
        if (tok.kind == SqlToken::Kind::WORD) return tok.text;
        if (tok.kind == SqlToken::Kind::GROUP) return first_keyword(tok.children);
        // Anything else before the first word means the statement does not
        // open with a keyword at all
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace sqlsandbox
