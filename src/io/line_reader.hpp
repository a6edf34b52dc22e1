#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "io/byte_source.hpp"
#include "io/growable_buffer.hpp"

namespace fastxio {

// True for empty or whitespace-only lines.
inline bool is_blank_line(std::string_view line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Short quoted form of a line for error messages.
inline std::string line_excerpt(std::string_view line, size_t max_len = 40) {
    if (line.size() <= max_len) return "'" + std::string(line) + "'";
    return "'" + std::string(line.substr(0, max_len)) + "...'";
}

// Splits a byte source into lines. "\n" and "\r\n" terminators are
// stripped; a final unterminated line is still delivered.
//
// Returned views point either into the read chunk or into the line buffer
// and stay valid until the next call to next_line().
class LineReader {
public:
    explicit LineReader(std::unique_ptr<ByteSource> src,
                        size_t size_hint = DEFAULT_SIZE_HINT);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Returns true with the next line, false at end of stream or on a read
    // failure (check failed()). May throw std::bad_alloc.
    bool next_line(std::string_view& line);

    // Re-deliver the most recently returned line on the next call.
    // Only one line can be pending; returns false if there is nothing to
    // push back or a line is already pending.
    bool push_back();

    bool failed() const { return !error_.empty(); }
    const std::string& error() const { return error_; }
    bool eof() const { return eof_ && !pending_; }

    // 1-based number of the last delivered line (0 before the first).
    uint64_t line_number() const { return line_number_; }

    size_t line_capacity() const { return line_.capacity(); }

private:
    // Refill the chunk. Returns false at end of stream or on failure.
    bool fill();

    std::unique_ptr<ByteSource> src_;
    std::vector<uint8_t> chunk_;
    size_t pos_ = 0;
    size_t end_ = 0;
    GrowableBuffer line_;
    std::string_view current_;
    bool has_current_ = false;
    bool pending_ = false;
    bool eof_ = false;
    uint64_t line_number_ = 0;
    std::string error_;
};

} // namespace fastxio
