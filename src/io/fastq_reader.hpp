#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "io/growable_buffer.hpp"
#include "io/reader_state.hpp"

namespace fastxio {

struct FastqRecord {
    std::string id;       // header line without the leading '@'
    std::string sequence; // concatenated sequence lines
    std::string quality;  // concatenated quality lines, same length as sequence
};

// Borrowed record; views are valid until the next read call.
struct FastqView {
    std::string_view id;
    std::string_view sequence;
    std::string_view quality;
};

// Streaming FASTQ reader with structural validation:
//   - header must start with '@'
//   - sequence may span several lines and ends at a line starting with '+'
//   - text after '+', if any, must equal the id
//   - quality may span several lines and must match the sequence length
// Same open/next/error contract as FastaReader.
class FastqReader {
public:
    explicit FastqReader(const ReaderConfig& config = {});

    FastqReader(const FastqReader&) = delete;
    FastqReader& operator=(const FastqReader&) = delete;

    bool open(const std::string& path) { return state_.open(path); }
    bool open_stdin() { return state_.open_stdin(); }
    bool open_stream(std::istream& in) { return state_.open_stream(in); }
    bool open_memory(std::string data) { return state_.open_memory(std::move(data)); }
    bool open_source(std::unique_ptr<ByteSource> src) {
        return state_.open_source(std::move(src));
    }

    bool next(FastqRecord& rec);
    bool next_view(FastqView& view);

    bool finished() const { return state_.finished(); }
    bool failed() const { return state_.failed(); }
    const ReadError& error() const { return state_.error(); }
    Compression compression() const { return state_.compression(); }
    uint64_t records_read() const { return records_read_; }

private:
    enum class Stage {
        kExpectHeader,
        kAccumulateSequence,
        kExpectSeparator,
        kAccumulateQuality,
        kRecordReady,
        kEndOfStream,
    };

    bool assemble();
    bool format_error(const std::string& message);

    ReaderState state_;
    GrowableBuffer id_;
    GrowableBuffer seq_;
    GrowableBuffer qual_;
    Stage stage_ = Stage::kExpectHeader;
    uint64_t records_read_ = 0;
};

bool read_fastq(const std::string& path, std::vector<FastqRecord>& records,
                ReadError& error, const ReaderConfig& config = {});

bool read_fastq_stream(std::istream& in, std::vector<FastqRecord>& records,
                       ReadError& error, const ReaderConfig& config = {});

} // namespace fastxio
