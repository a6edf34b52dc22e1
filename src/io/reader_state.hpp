#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

#include "core/types.hpp"
#include "io/byte_source.hpp"
#include "io/compression.hpp"
#include "io/line_reader.hpp"

namespace fastxio {

// Input side shared by the record readers: the (decompressed) byte source,
// its LineReader, the finished flag and the first error.
// Owned by exactly one reader; not copyable.
class ReaderState {
public:
    explicit ReaderState(const ReaderConfig& config = {}) : config_(config) {}

    ReaderState(const ReaderState&) = delete;
    ReaderState& operator=(const ReaderState&) = delete;

    // Open a file. "-" means standard input.
    bool open(const std::string& path);
    bool open_stdin();
    // The stream must outlive this state.
    bool open_stream(std::istream& in);
    bool open_memory(std::string data);
    bool open_source(std::unique_ptr<ByteSource> src);

    bool is_open() const { return lines_ != nullptr; }
    LineReader& lines() { return *lines_; }

    // Record a failure; the state is finished afterwards.
    void fail(ErrorKind kind, const std::string& message, uint64_t line = 0);
    // End of stream reached.
    void finish() { finished_ = true; }

    bool finished() const { return finished_; }
    bool failed() const { return !error_.ok(); }
    const ReadError& error() const { return error_; }
    Compression compression() const { return compression_; }
    const ReaderConfig& config() const { return config_; }

private:
    ReaderConfig config_;
    std::unique_ptr<LineReader> lines_;
    Compression compression_ = Compression::kNone;
    bool finished_ = false;
    ReadError error_;
};

} // namespace fastxio
