#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace fastxio {

// Parse a byte count with optional suffix (K, M, G; powers of 1024).
// Examples: "300" -> 300, "64K" -> 65536, "1.5M" -> 1572864.
// Returns false (out unchanged, error_msg set) on empty, negative,
// zero or malformed input.
inline bool parse_size_string(const std::string& s, uint64_t& out,
                              std::string& error_msg) {
    if (s.empty()) {
        error_msg = "empty size";
        return false;
    }

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || val <= 0) {
        error_msg = "invalid size '" + s + "'";
        return false;
    }

    uint64_t multiplier = 1;
    if (*end != '\0') {
        switch (*end) {
            case 'K': case 'k': multiplier = uint64_t(1) << 10; break;
            case 'M': case 'm': multiplier = uint64_t(1) << 20; break;
            case 'G': case 'g': multiplier = uint64_t(1) << 30; break;
            default:
                error_msg = "unknown size suffix in '" + s + "'";
                return false;
        }
        if (end[1] != '\0') {
            error_msg = "trailing characters in size '" + s + "'";
            return false;
        }
    }
    out = static_cast<uint64_t>(val * static_cast<double>(multiplier));
    return true;
}

} // namespace fastxio
