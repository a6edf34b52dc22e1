#pragma once

#include <bzlib.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "io/byte_source.hpp"

namespace fastxio {

enum class Compression { kNone, kGzip, kBzip2 };

// Classify a byte prefix by magic bytes (gzip 1F 8B, bzip2 "BZh").
// Anything else, including a prefix too short to match, is kNone.
Compression detect_compression(const uint8_t* data, size_t n);

const char* compression_name(Compression c);

// Inspect the first bytes of src and return a source yielding uncompressed
// bytes. The inspected bytes are replayed ahead of the rest of the stream,
// so this works on pipes and stdin. Returns nullptr if the initial read
// fails (error_msg set). detected, if non-null, receives the detected type.
std::unique_ptr<ByteSource> open_decompressed(std::unique_ptr<ByteSource> src,
                                              std::string& error_msg,
                                              Compression* detected = nullptr);

// gzip decoder over another source. Concatenated members are decoded
// in sequence; bytes after the last member that do not start a new member
// (e.g. NUL padding) end the stream.
class GzipSource : public ByteSource {
public:
    explicit GzipSource(std::unique_ptr<ByteSource> inner);
    ~GzipSource() override;

    GzipSource(const GzipSource&) = delete;
    GzipSource& operator=(const GzipSource&) = delete;

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    std::unique_ptr<ByteSource> inner_;
    std::vector<uint8_t> in_buf_;
    z_stream zs_;
    bool input_eof_ = false;
    bool member_done_ = false;
    bool finished_ = false;
};

// bzip2 decoder over another source. Concatenated streams (pbzip2 output)
// are decoded in sequence.
class Bzip2Source : public ByteSource {
public:
    explicit Bzip2Source(std::unique_ptr<ByteSource> inner);
    ~Bzip2Source() override;

    Bzip2Source(const Bzip2Source&) = delete;
    Bzip2Source& operator=(const Bzip2Source&) = delete;

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    void init_stream();

    std::unique_ptr<ByteSource> inner_;
    std::vector<uint8_t> in_buf_;
    bz_stream bs_;
    bool stream_open_ = false;
    bool input_eof_ = false;
    bool member_done_ = false;
    bool finished_ = false;
};

} // namespace fastxio
