#include "io/line_reader.hpp"

#include <cstring>

namespace fastxio {

LineReader::LineReader(std::unique_ptr<ByteSource> src, size_t size_hint)
    : src_(std::move(src)),
      chunk_(READ_CHUNK_SIZE),
      line_(clamp_size_hint(size_hint)) {}

bool LineReader::fill() {
    if (eof_ || failed()) return false;
    ssize_t r = src_->read(chunk_.data(), chunk_.size());
    if (r < 0) {
        error_ = src_->error();
        if (error_.empty()) error_ = "read failed";
        return false;
    }
    if (r == 0) {
        eof_ = true;
        return false;
    }
    pos_ = 0;
    end_ = static_cast<size_t>(r);
    return true;
}

bool LineReader::next_line(std::string_view& line) {
    if (pending_) {
        pending_ = false;
        line = current_;
        line_number_++;
        return true;
    }
    has_current_ = false;

    line_.clear();
    bool partial = false;
    while (true) {
        if (pos_ == end_ && !fill()) {
            if (failed() || !partial) return false;
            // Unterminated last line
            if (!line_.empty() && line_.back() == '\r') line_.pop_back();
            current_ = line_.view();
            break;
        }

        const char* begin = reinterpret_cast<const char*>(chunk_.data()) + pos_;
        size_t avail = end_ - pos_;
        const char* nl = static_cast<const char*>(std::memchr(begin, '\n', avail));
        if (!nl) {
            line_.append(begin, avail);
            pos_ = end_;
            partial = true;
            continue;
        }

        size_t len = static_cast<size_t>(nl - begin);
        pos_ += len + 1;
        if (!partial) {
            // Whole line inside the chunk: hand out a view, no copy.
            if (len > 0 && begin[len - 1] == '\r') len--;
            current_ = std::string_view(begin, len);
        } else {
            line_.append(begin, len);
            if (!line_.empty() && line_.back() == '\r') line_.pop_back();
            current_ = line_.view();
        }
        break;
    }

    has_current_ = true;
    line_number_++;
    line = current_;
    return true;
}

bool LineReader::push_back() {
    if (!has_current_ || pending_) return false;
    pending_ = true;
    line_number_--;
    return true;
}

} // namespace fastxio
