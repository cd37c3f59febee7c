#include "validation/result_hasher.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace sqlsandbox {

namespace {

std::string canonical_number(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        return std::format("{}", static_cast<int64_t>(v));
    }
    auto text = std::format("{:.6f}", v);
    while (text.back() == '0') text.pop_back();
    if (text.back() == '.') text.pop_back();
    if (text == "-0") text = "0";
    return text;
}

} // anonymous namespace

std::string ResultHasher::canonical_cell(const Cell& cell) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "N";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "T" : "F";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "#" + std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return "#" + canonical_number(v);
        } else {
            // Length prefix: no separator inside a string can shift fields
            return std::format("s{}:{}", v.size(), v);
        }
    }, cell);
}

std::string ResultHasher::canonicalize(const ResultSet& rs, bool ordered) {
    std::vector<size_t> order(rs.columns.size());
    std::iota(order.begin(), order.end(), 0);
    std::vector<std::string> lowered;
    lowered.reserve(rs.columns.size());
    for (const auto& c : rs.columns) lowered.push_back(utils::to_lower(c));
    std::ranges::stable_sort(order, [&](size_t a, size_t b) { return lowered[a] < lowered[b]; });

    std::string header;
    for (const auto idx : order) {
        header += lowered[idx];
        header += '\x1f';
    }

    std::vector<std::string> rows;
    rows.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        std::string line;
        for (const auto idx : order) {
            line += idx < row.size() ? canonical_cell(row[idx]) : "N";
            line += '\x1f';
        }
        rows.push_back(std::move(line));
    }
    if (!ordered) std::ranges::sort(rows);

    std::string out = std::move(header);
    for (const auto& line : rows) {
        out += '\x1e';
        out += line;
    }
    return out;
}

std::string ResultHasher::digest(const ResultSet& rs, bool ordered) {
    return Sha256::hex(canonicalize(rs, ordered));
}

bool ResultHasher::matches(const ResultSet& rs, std::string_view expected_digest, bool ordered) {
    auto expected = utils::to_lower(utils::trim(expected_digest));
    if (expected.starts_with("sha256:")) expected.erase(0, 7);
    return !expected.empty() && digest(rs, ordered) == expected;
}

} // namespace sqlsandbox
