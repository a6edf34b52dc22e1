#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/config.hpp"

namespace fastxio {

enum class ErrorKind : uint8_t {
    kNone = 0,
    kIo,          // open/read failure on the underlying source
    kFormat,      // structural grammar violation
    kAllocation,  // buffer growth failed
};

// First error observed by a reader. line is the 1-based input line the
// error refers to (0 if not tied to a line).
struct ReadError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;
    uint64_t line = 0;

    bool ok() const { return kind == ErrorKind::kNone; }
    void clear() {
        kind = ErrorKind::kNone;
        message.clear();
        line = 0;
    }
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:       return "none";
        case ErrorKind::kIo:         return "I/O error";
        case ErrorKind::kFormat:     return "format error";
        case ErrorKind::kAllocation: return "allocation failure";
    }
    return "unknown";
}

struct ReaderConfig {
    size_t size_hint = DEFAULT_SIZE_HINT;
    bool detect_compression = true;
};

} // namespace fastxio
