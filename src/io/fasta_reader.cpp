#include "io/fasta_reader.hpp"

#include "core/config.hpp"

#include <new>

namespace fastxio {

FastaReader::FastaReader(const ReaderConfig& config)
    : state_(config),
      id_(MIN_SIZE_HINT),
      seq_(clamp_size_hint(config.size_hint)) {}

bool FastaReader::assemble() {
    LineReader& lines = state_.lines();
    std::string_view line;

    id_.clear();
    seq_.clear();
    stage_ = Stage::kExpectHeader;

    while (stage_ != Stage::kRecordReady) {
        bool got = lines.next_line(line);
        if (!got && lines.failed()) {
            state_.fail(ErrorKind::kIo, lines.error());
            return false;
        }

        switch (stage_) {
            case Stage::kExpectHeader:
                if (!got) {
                    stage_ = Stage::kEndOfStream;
                    state_.finish();
                    return false;
                }
                if (is_blank_line(line)) break;
                if (line[0] != FASTA_HEADER_CHAR) {
                    state_.fail(ErrorKind::kFormat,
                                "expected FASTA header starting with '>', found " +
                                    line_excerpt(line),
                                lines.line_number());
                    return false;
                }
                id_.append(line.substr(1));
                stage_ = Stage::kAccumulateSequence;
                break;

            case Stage::kAccumulateSequence:
                if (!got) {
                    // End of stream closes the last record
                    stage_ = Stage::kRecordReady;
                    break;
                }
                if (is_blank_line(line)) break;
                if (line[0] == FASTA_HEADER_CHAR) {
                    // Next record's header; leave it for the next call
                    lines.push_back();
                    stage_ = Stage::kRecordReady;
                    break;
                }
                seq_.append(line);
                break;

            case Stage::kRecordReady:
            case Stage::kEndOfStream:
                break;
        }
    }
    return true;
}

bool FastaReader::next_view(FastaView& view) {
    if (!state_.is_open() || state_.finished()) return false;

    try {
        if (!assemble()) return false;
    } catch (const std::bad_alloc&) {
        state_.fail(ErrorKind::kAllocation, "out of memory while buffering FASTA record",
                    state_.lines().line_number());
        return false;
    }

    view.id = id_.view();
    view.sequence = seq_.view();
    records_read_++;
    return true;
}

bool FastaReader::next(FastaRecord& rec) {
    FastaView view;
    if (!next_view(view)) return false;

    try {
        rec.id.assign(view.id.data(), view.id.size());
        rec.sequence.assign(view.sequence.data(), view.sequence.size());
    } catch (const std::bad_alloc&) {
        state_.fail(ErrorKind::kAllocation, "out of memory while copying FASTA record");
        return false;
    }
    return true;
}

static bool drain(FastaReader& reader, std::vector<FastaRecord>& records,
                  ReadError& error) {
    FastaRecord rec;
    try {
        while (reader.next(rec)) {
            records.push_back(rec);
        }
    } catch (const std::bad_alloc&) {
        records.clear();
        error.kind = ErrorKind::kAllocation;
        error.message = "out of memory while collecting FASTA records";
        error.line = 0;
        return false;
    }
    if (reader.failed()) {
        records.clear();
        error = reader.error();
        return false;
    }
    return true;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                ReadError& error, const ReaderConfig& config) {
    records.clear();
    error.clear();

    FastaReader reader(config);
    if (!reader.open(path)) {
        error = reader.error();
        return false;
    }
    return drain(reader, records, error);
}

bool read_fasta_stream(std::istream& in, std::vector<FastaRecord>& records,
                       ReadError& error, const ReaderConfig& config) {
    records.clear();
    error.clear();

    FastaReader reader(config);
    if (!reader.open_stream(in)) {
        error = reader.error();
        return false;
    }
    return drain(reader, records, error);
}

} // namespace fastxio
