#include "io/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fastxio {

FdSource::~FdSource() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<FdSource> FdSource::open(const std::string& path,
                                         std::string& error_msg) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        error_msg = "cannot open '" + path + "': " + std::strerror(errno);
        return nullptr;
    }
    return std::make_unique<FdSource>(fd, true);
}

std::unique_ptr<FdSource> FdSource::standard_input() {
    return std::make_unique<FdSource>(STDIN_FILENO, false);
}

ssize_t FdSource::read(uint8_t* buf, size_t n) {
    while (true) {
        ssize_t r = ::read(fd_, buf, n);
        if (r < 0) {
            if (errno == EINTR) continue;
            return fail(std::string("read failed: ") + std::strerror(errno));
        }
        return r;
    }
}

ssize_t IstreamSource::read(uint8_t* buf, size_t n) {
    if (n == 0) return 0;
    if (!in_.good()) {
        // A stream that was never readable is not an empty one
        if (in_.eof()) return 0;
        return fail("read failed: stream not readable");
    }
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
    if (in_.bad() || (in_.fail() && !in_.eof())) {
        return fail("read failed: stream error");
    }
    return static_cast<ssize_t>(in_.gcount());
}

ssize_t MemorySource::read(uint8_t* buf, size_t n) {
    size_t avail = data_.size() - pos_;
    size_t take = std::min(avail, n);
    if (take > 0) {
        std::memcpy(buf, data_.data() + pos_, take);
        pos_ += take;
    }
    return static_cast<ssize_t>(take);
}

ssize_t PrefixedSource::read(uint8_t* buf, size_t n) {
    if (prefix_pos_ < prefix_.size()) {
        size_t take = std::min(prefix_.size() - prefix_pos_, n);
        std::memcpy(buf, prefix_.data() + prefix_pos_, take);
        prefix_pos_ += take;
        return static_cast<ssize_t>(take);
    }
    ssize_t r = inner_->read(buf, n);
    if (r < 0) return fail(inner_->error());
    return r;
}

} // namespace fastxio
