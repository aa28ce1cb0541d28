#pragma once

#include <cstdint>
#include <string>

namespace fastaseek {

// Parse an unsigned decimal integer. The whole string must be digits
// (commas are skipped when allow_commas is set, e.g. "1,000,000").
// Returns false on an empty string, any other character, or overflow.
inline bool parse_u64(const std::string& s, uint64_t& out,
                      bool allow_commas = false) {
    uint64_t val = 0;
    bool any_digit = false;
    for (char c : s) {
        if (c == ',' && allow_commas) continue;
        if (c < '0' || c > '9') return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (val > (UINT64_MAX - d) / 10) return false;
        val = val * 10 + d;
        any_digit = true;
    }
    if (!any_digit) return false;
    out = val;
    return true;
}

} // namespace fastaseek
