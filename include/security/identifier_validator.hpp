#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace sqlsandbox {

/**
 * @brief Gatekeeper for admin-authored names and types that end up in DDL
 *
 * Table names, column names and column types come from problem authors and
 * are interpolated into CREATE TABLE text, so they are checked against a
 * strict grammar and a closed allow-list before any statement is built.
 */
class IdentifierValidator {
public:
    /// Maximum identifier length (matches the PostgreSQL NAMEDATALEN limit).
    static constexpr size_t kMaxIdentifierLength = 63;

    /**
     * @brief Validate a table or column identifier
     *
     * Accepts ^[A-Za-z_][A-Za-z0-9_]{0,62}$ that is not a reserved word.
     */
    [[nodiscard]] static Result<Unit> validate_identifier(std::string_view name);

    /**
     * @brief Validate a column type against the allow-list
     * @return Canonical uppercase type text safe to interpolate
     */
    [[nodiscard]] static Result<std::string> normalize_type(std::string_view type);

    /// Reserved words that may not be used as bare identifiers.
    [[nodiscard]] static bool is_reserved(std::string_view upper_word);
};

} // namespace sqlsandbox
