#include "security/identifier_validator.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>
#include <unordered_set>

namespace sqlsandbox {

namespace {

const std::unordered_set<std::string_view> kReservedWords = {
    "ALL", "ALTER", "AND", "ANY", "ARRAY", "AS", "ASC", "ATTACH", "BETWEEN",
    "BOTH", "BY", "CASE", "CAST", "CHECK", "COLLATE", "COLUMN", "CONSTRAINT",
    "COPY", "CREATE", "CROSS", "DEFAULT", "DELETE", "DESC", "DETACH",
    "DISTINCT", "DO", "DROP", "ELSE", "END", "EXCEPT", "EXISTS", "FALSE",
    "FETCH", "FOR", "FOREIGN", "FROM", "FULL", "GRANT", "GROUP", "HAVING",
    "IN", "INNER", "INSERT", "INTERSECT", "INTO", "IS", "JOIN", "LATERAL",
    "LEADING", "LEFT", "LIKE", "LIMIT", "NATURAL", "NOT", "NULL", "OFFSET",
    "ON", "ONLY", "OR", "ORDER", "OUTER", "PIVOT", "PRAGMA", "PRIMARY",
    "QUALIFY", "REFERENCES", "RETURNING", "RIGHT", "SELECT", "SET", "SOME",
    "TABLE", "THEN", "TO", "TRAILING", "TRUE", "TRUNCATE", "UNION", "UNIQUE",
    "UNPIVOT", "UPDATE", "USING", "VALUES", "WHEN", "WHERE", "WINDOW", "WITH",
};

// Types accepted verbatim (after uppercasing and whitespace collapsing)
const std::unordered_set<std::string_view> kPlainTypes = {
    "INTEGER", "INT", "BIGINT", "SMALLINT", "TINYINT", "HUGEINT",
    "UINTEGER", "UBIGINT", "USMALLINT", "UTINYINT",
    "DOUBLE", "FLOAT", "REAL", "BOOLEAN", "BOOL",
    "DATE", "TIME", "TIMESTAMP", "TIMESTAMPTZ", "TIMESTAMP WITH TIME ZONE",
    "INTERVAL", "UUID", "BLOB", "TEXT", "VARCHAR", "CHAR", "STRING",
    "DECIMAL", "NUMERIC",
};

const std::regex kIdentifierPattern("^[A-Za-z_][A-Za-z0-9_]{0,62}$");
const std::regex kLengthTypePattern(R"(^(VARCHAR|CHAR)\((\d{1,5})\)$)");
const std::regex kDecimalTypePattern(R"(^(DECIMAL|NUMERIC)\((\d{1,2})(,(\d{1,2}))?\)$)");

// Uppercase, drop spaces around parentheses/commas, collapse other runs
std::string canonical_type_text(std::string_view type) {
    const std::string upper = utils::to_upper(utils::trim(type));
    std::string out;
    out.reserve(upper.size());
    bool pending_space = false;
    for (const char c : upper) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty() && c != '(' && c != ')' && c != ',' &&
            out.back() != '(' && out.back() != ',') {
            out += ' ';
        }
        pending_space = false;
        out += c;
    }
    return out;
}

} // anonymous namespace

bool IdentifierValidator::is_reserved(std::string_view upper_word) {
    return kReservedWords.contains(upper_word);
}

Result<Unit> IdentifierValidator::validate_identifier(std::string_view name) {
    if (name.empty()) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST, "Identifier must not be empty");
    }
    if (name.size() > kMaxIdentifierLength) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Identifier exceeds {} characters", kMaxIdentifierLength));
    }
    const std::string value(name);
    if (!std::regex_match(value, kIdentifierPattern)) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Invalid identifier '{}': use letters, digits and underscores, "
                        "starting with a letter or underscore", value));
    }
    if (is_reserved(utils::to_upper(value))) {
        return Result<Unit>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Invalid identifier '{}': reserved word", value));
    }
    return Result<Unit>::ok({});
}

Result<std::string> IdentifierValidator::normalize_type(std::string_view type) {
    const std::string canonical = canonical_type_text(type);
    if (canonical.empty()) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST, "Column type must not be empty");
    }
    if (kPlainTypes.contains(canonical)) {
        return Result<std::string>::ok(canonical);
    }

    std::smatch match;
    if (std::regex_match(canonical, match, kLengthTypePattern)) {
        const auto length = utils::parse_int<int>(match[2].str());
        if (length >= 1) {
            return Result<std::string>::ok(canonical);
        }
    } else if (std::regex_match(canonical, match, kDecimalTypePattern)) {
        const auto precision = utils::parse_int<int>(match[2].str());
        const auto scale = match[4].matched ? utils::parse_int<int>(match[4].str()) : 0;
        if (precision >= 1 && precision <= 38 && scale <= precision) {
            return Result<std::string>::ok(canonical);
        }
    }

    return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
        std::format("Column type '{}' is not allowed", std::string(type)));
}

} // namespace sqlsandbox
