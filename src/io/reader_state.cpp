#include "io/reader_state.hpp"

#include <new>

namespace fastxio {

bool ReaderState::open(const std::string& path) {
    if (path == "-") return open_stdin();

    std::string msg;
    auto src = FdSource::open(path, msg);
    if (!src) {
        fail(ErrorKind::kIo, msg);
        return false;
    }
    return open_source(std::move(src));
}

bool ReaderState::open_stdin() {
    return open_source(FdSource::standard_input());
}

bool ReaderState::open_stream(std::istream& in) {
    return open_source(std::make_unique<IstreamSource>(in));
}

bool ReaderState::open_memory(std::string data) {
    return open_source(std::make_unique<MemorySource>(std::move(data)));
}

bool ReaderState::open_source(std::unique_ptr<ByteSource> src) {
    lines_.reset();
    finished_ = false;
    error_.clear();
    compression_ = Compression::kNone;

    try {
        if (config_.detect_compression) {
            std::string msg;
            src = open_decompressed(std::move(src), msg, &compression_);
            if (!src) {
                fail(ErrorKind::kIo, msg);
                return false;
            }
        }
        lines_ = std::make_unique<LineReader>(std::move(src), config_.size_hint);
    } catch (const std::bad_alloc&) {
        fail(ErrorKind::kAllocation, "out of memory while opening input");
        return false;
    }
    return true;
}

void ReaderState::fail(ErrorKind kind, const std::string& message, uint64_t line) {
    if (error_.ok()) {
        error_.kind = kind;
        error_.line = line;
        error_.message = line > 0 ? "line " + std::to_string(line) + ": " + message
                                  : message;
    }
    finished_ = true;
}

} // namespace fastxio
