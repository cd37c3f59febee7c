#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace sqlsandbox {

/**
 * @brief Stable serialization + SHA-256 digest of a result set
 *
 * Columns are lowercased and put in name order; numbers print as integers
 * when integral, otherwise rounded to six decimals; rows are sorted unless
 * the order is significant. Expected answers hashed at authoring time with
 * this serializer compare by digest equality.
 */
class ResultHasher {
public:
    [[nodiscard]] static std::string canonicalize(const ResultSet& rs, bool ordered);
    [[nodiscard]] static std::string digest(const ResultSet& rs, bool ordered);

    // Accepts a bare hex digest or one prefixed with "sha256:", any case
    [[nodiscard]] static bool matches(const ResultSet& rs, std::string_view expected_digest, bool ordered);

    [[nodiscard]] static std::string canonical_cell(const Cell& cell);
};

} // namespace sqlsandbox
