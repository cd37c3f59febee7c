#include "parser/fingerprinter.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

namespace sqlsandbox {

// ============================================================================
// Lookup table for character classification: avoids locale-dependent
// std::isspace/tolower in the hot loop.
// ============================================================================
namespace {

struct CharTable {
    bool space[256];
    char lower[256];

    constexpr CharTable() : space{}, lower{} {
        for (int i = 0; i < 256; ++i) {
            lower[i] = static_cast<char>(i);
        }
        for (int i = 'A'; i <= 'Z'; ++i) {
            lower[i] = static_cast<char>(i + 32);
        }
        space[' '] = true; space['\t'] = true; space['\n'] = true;
        space['\r'] = true; space['\f'] = true; space['\v'] = true;
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c) { return CT.space[c]; }
inline char ct_lower(unsigned char c) { return CT.lower[c]; }

// Whitespace collapses to one space except around list punctuation, so
// "SUM ( x )" and "SUM(x)" normalize identically.
inline bool needs_separator(unsigned char prev, unsigned char next) {
    if (prev == '(' || prev == ',') return false;
    if (next == '(' || next == ')' || next == ',') return false;
    return true;
}

} // anonymous namespace

QueryFingerprint QueryFingerprinter::fingerprint(std::string_view sql) {
    std::string normalized = normalize(sql);
    const uint64_t hash = compute_hash(normalized);
    return QueryFingerprint(hash, std::move(normalized));
}

std::string QueryFingerprinter::normalize(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    State state = State::NORMAL;
    bool pending_space = false;
    int comment_depth = 0;

    auto append = [&](char c) {
        if (pending_space && !result.empty() &&
            needs_separator(static_cast<unsigned char>(result.back()),
                            static_cast<unsigned char>(c))) {
            result += ' ';
        }
        pending_space = false;
        result += c;
    };

    const size_t len = sql.size();
    for (size_t i = 0; i < len; ++i) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const auto next_c = (i + 1 < len) ? static_cast<unsigned char>(sql[i + 1])
                                          : static_cast<unsigned char>('\0');

        switch (state) {
            case State::NORMAL:
                if (c == '/' && next_c == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    comment_depth = 1;
                    pending_space = true;
                    ++i;
                } else if (c == '-' && next_c == '-') {
                    state = State::IN_LINE_COMMENT;
                    pending_space = true;
                    ++i;
                } else if (ct_space(c)) {
                    pending_space = true;
                } else if (c == '\'') {
                    append('\'');
                    state = State::IN_SINGLE_QUOTE;
                } else if (c == '"') {
                    append('"');
                    state = State::IN_DOUBLE_QUOTE;
                } else {
                    append(ct_lower(c));
                }
                break;

            case State::IN_SINGLE_QUOTE:
                result += static_cast<char>(c);
                if (c == '\'') {
                    if (next_c == '\'') {
                        result += '\'';
                        ++i;
                    } else {
                        state = State::NORMAL;
                    }
                }
                break;

            case State::IN_DOUBLE_QUOTE:
                result += static_cast<char>(c);
                if (c == '"') {
                    if (next_c == '"') {
                        result += '"';
                        ++i;
                    } else {
                        state = State::NORMAL;
                    }
                }
                break;

            case State::IN_BLOCK_COMMENT:
                if (c == '/' && next_c == '*') {
                    ++comment_depth;
                    ++i;
                } else if (c == '*' && next_c == '/') {
                    ++i;
                    if (--comment_depth == 0) state = State::NORMAL;
                }
                break;

            case State::IN_LINE_COMMENT:
                if (c == '\n') state = State::NORMAL;
                break;
        }
    }

    // Trailing semicolons do not change the query
    while (!result.empty() && (result.back() == ';' || result.back() == ' ')) {
        result.pop_back();
    }
    return result;
}

uint64_t QueryFingerprinter::compute_hash(std::string_view data, uint64_t seed) {
    return XXH64(data.data(), data.size(), seed);
}

} // namespace sqlsandbox
