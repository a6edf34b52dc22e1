#include "io/fastq_reader.hpp"

#include "core/config.hpp"

#include <cctype>
#include <new>

namespace fastxio {

FastqReader::FastqReader(const ReaderConfig& config)
    : state_(config),
      id_(MIN_SIZE_HINT),
      seq_(clamp_size_hint(config.size_hint)),
      qual_(clamp_size_hint(config.size_hint)) {}

static std::string_view trim_whitespace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool FastqReader::format_error(const std::string& message) {
    state_.fail(ErrorKind::kFormat, message, state_.lines().line_number());
    return false;
}

bool FastqReader::assemble() {
    LineReader& lines = state_.lines();
    std::string_view line;

    id_.clear();
    seq_.clear();
    qual_.clear();
    stage_ = Stage::kExpectHeader;

    while (stage_ != Stage::kRecordReady) {
        if (stage_ == Stage::kAccumulateQuality && qual_.size() >= seq_.size()) {
            stage_ = Stage::kRecordReady;
            break;
        }

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
                if (line[0] != FASTQ_HEADER_CHAR) {
                    return format_error(
                        "expected FASTQ header starting with '@', found " +
                        line_excerpt(line));
                }
                id_.append(line.substr(1));
                stage_ = Stage::kAccumulateSequence;
                break;

            case Stage::kAccumulateSequence:
                if (!got) {
                    return format_error("truncated record '" + std::string(id_.view()) +
                                        "': end of stream before '+' separator");
                }
                if (is_blank_line(line)) break;
                if (line[0] == FASTQ_SEPARATOR_CHAR) {
                    lines.push_back();
                    stage_ = Stage::kExpectSeparator;
                    break;
                }
                seq_.append(line);
                break;

            case Stage::kExpectSeparator: {
                // got is always true here: the separator was pushed back
                // Surrounding whitespace is not part of either id
                std::string_view secondary = trim_whitespace(line.substr(1));
                if (!secondary.empty() && secondary != trim_whitespace(id_.view())) {
                    return format_error("separator id " + line_excerpt(secondary) +
                                        " does not match header id " +
                                        line_excerpt(id_.view()));
                }
                stage_ = Stage::kAccumulateQuality;
                break;
            }

            case Stage::kAccumulateQuality:
                if (!got) {
                    return format_error("truncated record '" + std::string(id_.view()) +
                                        "': quality has " + std::to_string(qual_.size()) +
                                        " of " + std::to_string(seq_.size()) +
                                        " characters at end of stream");
                }
                if (is_blank_line(line)) break;
                qual_.append(line);
                if (qual_.size() > seq_.size()) {
                    return format_error("record '" + std::string(id_.view()) +
                                        "': quality length (" +
                                        std::to_string(qual_.size()) +
                                        ") exceeds sequence length (" +
                                        std::to_string(seq_.size()) + ")");
                }
                break;

            case Stage::kRecordReady:
            case Stage::kEndOfStream:
                break;
        }
    }
    return true;
}

bool FastqReader::next_view(FastqView& view) {
    if (!state_.is_open() || state_.finished()) return false;

    try {
        if (!assemble()) return false;
    } catch (const std::bad_alloc&) {
        state_.fail(ErrorKind::kAllocation, "out of memory while buffering FASTQ record",
                    state_.lines().line_number());
        return false;
    }

    view.id = id_.view();
    view.sequence = seq_.view();
    view.quality = qual_.view();
    records_read_++;
    return true;
}

bool FastqReader::next(FastqRecord& rec) {
    FastqView view;
    if (!next_view(view)) return false;

    try {
        rec.id.assign(view.id.data(), view.id.size());
        rec.sequence.assign(view.sequence.data(), view.sequence.size());
        rec.quality.assign(view.quality.data(), view.quality.size());
    } catch (const std::bad_alloc&) {
        state_.fail(ErrorKind::kAllocation, "out of memory while copying FASTQ record");
        return false;
    }
    return true;
}

static bool drain(FastqReader& reader, std::vector<FastqRecord>& records,
                  ReadError& error) {
    FastqRecord rec;
    try {
        while (reader.next(rec)) {
            records.push_back(rec);
        }
    } catch (const std::bad_alloc&) {
        records.clear();
        error.kind = ErrorKind::kAllocation;
        error.message = "out of memory while collecting FASTQ records";
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

bool read_fastq(const std::string& path, std::vector<FastqRecord>& records,
                ReadError& error, const ReaderConfig& config) {
    records.clear();
    error.clear();

    FastqReader reader(config);
    if (!reader.open(path)) {
        error = reader.error();
        return false;
    }
    return drain(reader, records, error);
}

bool read_fastq_stream(std::istream& in, std::vector<FastqRecord>& records,
                       ReadError& error, const ReaderConfig& config) {
    records.clear();
    error.clear();

    FastqReader reader(config);
    if (!reader.open_stream(in)) {
        error = reader.error();
        return false;
    }
    return drain(reader, records, error);
}

} // namespace fastxio
