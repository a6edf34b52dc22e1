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

struct FastaRecord {
    std::string id;       // header line without the leading '>'
    std::string sequence; // concatenated sequence lines
};

// Borrowed record; views are valid until the next read call.
struct FastaView {
    std::string_view id;
    std::string_view sequence;
};

// Streaming FASTA reader. Compression (gzip, bzip2) is detected from the
// content. Single pass: each call parses exactly one record, and after end
// of stream or the first error every further call returns false.
//
//   FastaReader reader;
//   if (!reader.open(path)) { ... reader.error() ... }
//   FastaRecord rec;
//   while (reader.next(rec)) { ... }
//   if (reader.failed()) { ... reader.error() ... }
class FastaReader {
public:
    explicit FastaReader(const ReaderConfig& config = {});

    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;

    // "-" reads standard input.
    bool open(const std::string& path) { return state_.open(path); }
    bool open_stdin() { return state_.open_stdin(); }
    bool open_stream(std::istream& in) { return state_.open_stream(in); }
    bool open_memory(std::string data) { return state_.open_memory(std::move(data)); }
    bool open_source(std::unique_ptr<ByteSource> src) {
        return state_.open_source(std::move(src));
    }

    // Read the next record into rec, reusing its string capacity.
    // Returns false at end of stream or on error (check failed()).
    bool next(FastaRecord& rec);

    // Zero-copy variant of next().
    bool next_view(FastaView& view);

    bool finished() const { return state_.finished(); }
    bool failed() const { return state_.failed(); }
    const ReadError& error() const { return state_.error(); }
    Compression compression() const { return state_.compression(); }
    uint64_t records_read() const { return records_read_; }

private:
    enum class Stage { kExpectHeader, kAccumulateSequence, kRecordReady, kEndOfStream };

    bool assemble();

    ReaderState state_;
    GrowableBuffer id_;
    GrowableBuffer seq_;
    Stage stage_ = Stage::kExpectHeader;
    uint64_t records_read_ = 0;
};

// Read all records from a FASTA file ("-" for stdin).
// On failure records is left empty and error describes the first problem.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                ReadError& error, const ReaderConfig& config = {});

// Read all records from an input stream.
bool read_fasta_stream(std::istream& in, std::vector<FastaRecord>& records,
                       ReadError& error, const ReaderConfig& config = {});

} // namespace fastxio
