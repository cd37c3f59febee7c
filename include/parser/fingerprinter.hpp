#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sqlsandbox {

struct QueryFingerprint {
    uint64_t hash;              // xxHash64 of normalized query
    std::string normalized;     // Canonical query text

    QueryFingerprint() : hash(0) {}
    QueryFingerprint(uint64_t h, std::string n) : hash(h), normalized(std::move(n)) {}
};

/**
 * @brief Query fingerprinter - single-pass SQL normalization
 *
 * Produces a canonical form used as the practice-mode cache key:
 * - Strip comments (block and line -- '\n')
 * - Collapse whitespace runs to one space, none next to punctuation
 * - Lowercase everything outside quotes
 * - Drop trailing semicolons
 * - Keep literals verbatim (a different literal is a different answer)
 * - Compute xxHash64 of normalized query
 *
 * Example:
 *   Input:  "SELECT  Region , SUM(amount) -- total\n FROM orders;"
 *   Output: "select region,sum(amount) from orders"
 */
class QueryFingerprinter {
public:
    /**
     * @brief Compute fingerprint of SQL query
     * @param sql Raw SQL query string
     * @return QueryFingerprint with normalized query and xxHash64
     */
    static QueryFingerprint fingerprint(std::string_view sql);

    /**
     * @brief Normalize SQL query (single pass)
     */
    static std::string normalize(std::string_view sql);

    /**
     * @brief Compute xxHash64 of string
     */
    static uint64_t compute_hash(std::string_view data, uint64_t seed = 0);

private:
    enum class State {
        NORMAL,              // Normal SQL text
        IN_SINGLE_QUOTE,     // Inside 'string literal'
        IN_DOUBLE_QUOTE,     // Inside "identifier"
        IN_BLOCK_COMMENT,    // Inside /* block comment */
        IN_LINE_COMMENT      // Inside -- line comment
    };
};

} // namespace sqlsandbox
