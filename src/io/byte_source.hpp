#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace fastxio {

// A place bytes come from. Implementations are single-pass.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to n bytes into buf.
    // Returns the number of bytes read, 0 at end of stream, -1 on failure
    // (message available from error()).
    virtual ssize_t read(uint8_t* buf, size_t n) = 0;

    const std::string& error() const { return error_; }

protected:
    ssize_t fail(const std::string& msg) {
        error_ = msg;
        return -1;
    }

private:
    std::string error_;
};

// POSIX file descriptor source.
class FdSource : public ByteSource {
public:
    FdSource(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}
    ~FdSource() override;

    FdSource(const FdSource&) = delete;
    FdSource& operator=(const FdSource&) = delete;

    // Open path read-only. Returns nullptr on failure with error_msg set.
    static std::unique_ptr<FdSource> open(const std::string& path,
                                          std::string& error_msg);

    // Wrap standard input (not closed on destruction).
    static std::unique_ptr<FdSource> standard_input();

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    int fd_;
    bool owns_fd_;
};

// Caller-owned std::istream. The stream must outlive the source.
class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    std::istream& in_;
};

// Owned in-memory bytes.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data) : data_(std::move(data)) {}

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    std::string data_;
    size_t pos_ = 0;
};

// Replays a byte prefix, then reads from the inner source.
// Used to put back bytes consumed while sniffing a non-seekable stream.
class PrefixedSource : public ByteSource {
public:
    PrefixedSource(std::vector<uint8_t> prefix, std::unique_ptr<ByteSource> inner)
        : prefix_(std::move(prefix)), inner_(std::move(inner)) {}

    ssize_t read(uint8_t* buf, size_t n) override;

private:
    std::vector<uint8_t> prefix_;
    size_t prefix_pos_ = 0;
    std::unique_ptr<ByteSource> inner_;
};

} // namespace fastxio
