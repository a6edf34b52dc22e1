#include "io/compression.hpp"

#include "core/config.hpp"

#include <climits>
#include <cstring>
#include <new>

namespace fastxio {

Compression detect_compression(const uint8_t* data, size_t n) {
    if (n >= 2 && data[0] == GZIP_MAGIC[0] && data[1] == GZIP_MAGIC[1])
        return Compression::kGzip;
    if (n >= 3 && data[0] == BZIP2_MAGIC[0] && data[1] == BZIP2_MAGIC[1] &&
        data[2] == BZIP2_MAGIC[2])
        return Compression::kBzip2;
    return Compression::kNone;
}

const char* compression_name(Compression c) {
    switch (c) {
        case Compression::kNone:  return "none";
        case Compression::kGzip:  return "gzip";
        case Compression::kBzip2: return "bzip2";
    }
    return "unknown";
}

std::unique_ptr<ByteSource> open_decompressed(std::unique_ptr<ByteSource> src,
                                              std::string& error_msg,
                                              Compression* detected) {
    // Sources may return short reads; keep reading until the magic
    // prefix is filled or the stream ends.
    std::vector<uint8_t> magic(MAX_MAGIC_LEN);
    size_t got = 0;
    while (got < magic.size()) {
        ssize_t r = src->read(magic.data() + got, magic.size() - got);
        if (r < 0) {
            error_msg = src->error();
            return nullptr;
        }
        if (r == 0) break;
        got += static_cast<size_t>(r);
    }
    magic.resize(got);

    Compression c = detect_compression(magic.data(), magic.size());
    if (detected) *detected = c;

    auto replay = std::make_unique<PrefixedSource>(std::move(magic), std::move(src));
    switch (c) {
        case Compression::kGzip:
            return std::make_unique<GzipSource>(std::move(replay));
        case Compression::kBzip2:
            return std::make_unique<Bzip2Source>(std::move(replay));
        case Compression::kNone:
            break;
    }
    return replay;
}

// ---------------------------------------------------------------------------
// GzipSource

GzipSource::GzipSource(std::unique_ptr<ByteSource> inner)
    : inner_(std::move(inner)), in_buf_(READ_CHUNK_SIZE) {
    std::memset(&zs_, 0, sizeof(zs_));
    // 15 + 16: gzip wrapper only
    int ret = inflateInit2(&zs_, 15 + 16);
    if (ret == Z_MEM_ERROR) throw std::bad_alloc();
    if (ret != Z_OK) {
        fail("gzip: inflateInit2 failed");
        finished_ = true;
    }
}

GzipSource::~GzipSource() {
    inflateEnd(&zs_);
}

ssize_t GzipSource::read(uint8_t* buf, size_t n) {
    if (!error().empty()) return -1;
    if (finished_ || n == 0) return 0;

    uInt want = static_cast<uInt>(n > UINT_MAX ? UINT_MAX : n);
    zs_.next_out = buf;
    zs_.avail_out = want;

    while (zs_.avail_out == want) {
        if (zs_.avail_in == 0 && !input_eof_) {
            ssize_t r = inner_->read(in_buf_.data(), in_buf_.size());
            if (r < 0) return fail(inner_->error());
            if (r == 0) {
                input_eof_ = true;
            } else {
                zs_.next_in = in_buf_.data();
                zs_.avail_in = static_cast<uInt>(r);
            }
        }
        if (zs_.avail_in == 0 && input_eof_) {
            if (!member_done_) {
                return fail("gzip: unexpected end of compressed stream");
            }
            finished_ = true;
            break;
        }
        if (member_done_) {
            if (zs_.avail_in == 1 && !input_eof_) {
                // Need two bytes to look for the next member's magic
                in_buf_[0] = *zs_.next_in;
                ssize_t r = inner_->read(in_buf_.data() + 1, in_buf_.size() - 1);
                if (r < 0) return fail(inner_->error());
                if (r == 0) input_eof_ = true;
                zs_.next_in = in_buf_.data();
                zs_.avail_in = 1 + static_cast<uInt>(r);
                continue;
            }
            if (zs_.avail_in < 2 || zs_.next_in[0] != GZIP_MAGIC[0] ||
                zs_.next_in[1] != GZIP_MAGIC[1]) {
                // Trailing padding after the last member is ignored
                zs_.avail_in = 0;
                finished_ = true;
                break;
            }
            // Another member follows the one just completed
            inflateReset(&zs_);
            member_done_ = false;
        }

        int ret = inflate(&zs_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
        } else if (ret == Z_MEM_ERROR) {
            throw std::bad_alloc();
        } else if (ret == Z_BUF_ERROR && zs_.avail_in == 0) {
            // No progress without more input; loop reads the next chunk.
            continue;
        } else if (ret != Z_OK) {
            return fail(std::string("gzip: ") + (zs_.msg ? zs_.msg : "corrupt data"));
        }
    }
    return static_cast<ssize_t>(want - zs_.avail_out);
}

// ---------------------------------------------------------------------------
// Bzip2Source

Bzip2Source::Bzip2Source(std::unique_ptr<ByteSource> inner)
    : inner_(std::move(inner)), in_buf_(READ_CHUNK_SIZE) {
    std::memset(&bs_, 0, sizeof(bs_));
    init_stream();
}

Bzip2Source::~Bzip2Source() {
    if (stream_open_) BZ2_bzDecompressEnd(&bs_);
}

void Bzip2Source::init_stream() {
    int ret = BZ2_bzDecompressInit(&bs_, 0, 0);
    if (ret == BZ_MEM_ERROR) throw std::bad_alloc();
    if (ret != BZ_OK) {
        fail("bzip2: BZ2_bzDecompressInit failed");
        finished_ = true;
        return;
    }
    stream_open_ = true;
}

ssize_t Bzip2Source::read(uint8_t* buf, size_t n) {
    if (!error().empty()) return -1;
    if (finished_ || n == 0) return 0;

    unsigned int want = static_cast<unsigned int>(n > UINT_MAX ? UINT_MAX : n);
    bs_.next_out = reinterpret_cast<char*>(buf);
    bs_.avail_out = want;

    while (bs_.avail_out == want) {
        if (bs_.avail_in == 0 && !input_eof_) {
            ssize_t r = inner_->read(in_buf_.data(), in_buf_.size());
            if (r < 0) return fail(inner_->error());
            if (r == 0) {
                input_eof_ = true;
            } else {
                bs_.next_in = reinterpret_cast<char*>(in_buf_.data());
                bs_.avail_in = static_cast<unsigned int>(r);
            }
        }
        if (bs_.avail_in == 0 && input_eof_) {
            if (!member_done_) {
                return fail("bzip2: unexpected end of compressed stream");
            }
            finished_ = true;
            break;
        }
        if (member_done_) {
            // BZ2_bzDecompress cannot be reset; start a fresh stream
            // that keeps the pending input and output pointers.
            char* next_in = bs_.next_in;
            unsigned int avail_in = bs_.avail_in;
            char* next_out = bs_.next_out;
            unsigned int avail_out = bs_.avail_out;
            BZ2_bzDecompressEnd(&bs_);
            stream_open_ = false;
            std::memset(&bs_, 0, sizeof(bs_));
            init_stream();
            if (!stream_open_) return -1;
            bs_.next_in = next_in;
            bs_.avail_in = avail_in;
            bs_.next_out = next_out;
            bs_.avail_out = avail_out;
            member_done_ = false;
        }

        int ret = BZ2_bzDecompress(&bs_);
        if (ret == BZ_STREAM_END) {
            member_done_ = true;
        } else if (ret == BZ_MEM_ERROR) {
            throw std::bad_alloc();
        } else if (ret != BZ_OK) {
            return fail("bzip2: corrupt data (error " + std::to_string(ret) + ")");
        }
    }
    return static_cast<ssize_t>(want - bs_.avail_out);
}

} // namespace fastxio
