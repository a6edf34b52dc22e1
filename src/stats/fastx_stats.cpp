#include "stats/fastx_stats.hpp"

#include "core/config.hpp"
#include "io/fasta_reader.hpp"
#include "io/fastq_reader.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iomanip>
#include <memory>

#include <json/json.h>

namespace fastxio {

bool parse_format(const std::string& str, FastxFormat& out, std::string& error_msg) {
    if (str == "auto") {
        out = FastxFormat::kAuto;
    } else if (str == "fasta") {
        out = FastxFormat::kFasta;
    } else if (str == "fastq") {
        out = FastxFormat::kFastq;
    } else {
        error_msg = "unknown format '" + str + "' (expected auto, fasta or fastq)";
        return false;
    }
    return true;
}

const char* format_name(FastxFormat fmt) {
    switch (fmt) {
        case FastxFormat::kAuto:  return "auto";
        case FastxFormat::kFasta: return "fasta";
        case FastxFormat::kFastq: return "fastq";
    }
    return "unknown";
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FastxFormat format_from_path(const std::string& path) {
    std::string name = path;
    for (auto& c : name)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    // Compression suffix does not affect the record format
    if (ends_with(name, ".gz")) {
        name.resize(name.size() - 3);
    } else if (ends_with(name, ".bz2")) {
        name.resize(name.size() - 4);
    }

    if (ends_with(name, ".fq") || ends_with(name, ".fastq"))
        return FastxFormat::kFastq;
    return FastxFormat::kFasta;
}

uint64_t compute_n50(std::vector<uint64_t>& lengths) {
    if (lengths.empty()) return 0;
    std::sort(lengths.begin(), lengths.end(), std::greater<uint64_t>());

    uint64_t total = 0;
    for (uint64_t len : lengths) total += len;

    uint64_t running = 0;
    for (uint64_t len : lengths) {
        running += len;
        if (running * 2 >= total) return len;
    }
    return lengths.back();
}

// Length bookkeeping shared by both formats.
static void add_length(SequenceStats& stats, std::vector<uint64_t>& lengths,
                       uint64_t len) {
    if (stats.num_records == 0 || len < stats.min_length) stats.min_length = len;
    if (stats.num_records == 0 || len > stats.max_length) stats.max_length = len;
    stats.num_records++;
    stats.total_length += len;
    lengths.push_back(len);
}

static void finish_stats(SequenceStats& stats, std::vector<uint64_t>& lengths) {
    if (stats.num_records > 0) {
        stats.mean_length = static_cast<double>(stats.total_length) /
                            static_cast<double>(stats.num_records);
    }
    stats.n50 = compute_n50(lengths);
}

bool compute_stats(const std::string& path, FastxFormat format,
                   const ReaderConfig& config, SequenceStats& stats) {
    stats = SequenceStats();
    stats.path = path;
    stats.format = (format == FastxFormat::kAuto) ? format_from_path(path) : format;

    std::vector<uint64_t> lengths;

    if (stats.format == FastxFormat::kFastq) {
        FastqReader reader(config);
        if (!reader.open(path)) {
            stats.error = reader.error();
            return false;
        }
        uint64_t qual_sum = 0;
        FastqView view;
        while (reader.next_view(view)) {
            add_length(stats, lengths, view.sequence.size());
            for (char c : view.quality) {
                int q = static_cast<unsigned char>(c) - PHRED_OFFSET;
                if (q > 0) qual_sum += static_cast<uint64_t>(q);
            }
        }
        if (reader.failed()) {
            stats.error = reader.error();
            return false;
        }
        if (stats.total_length > 0) {
            stats.mean_quality = static_cast<double>(qual_sum) /
                                 static_cast<double>(stats.total_length);
        }
    } else {
        FastaReader reader(config);
        if (!reader.open(path)) {
            stats.error = reader.error();
            return false;
        }
        FastaView view;
        while (reader.next_view(view)) {
            add_length(stats, lengths, view.sequence.size());
        }
        if (reader.failed()) {
            stats.error = reader.error();
            return false;
        }
    }

    finish_stats(stats, lengths);
    stats.ok = true;
    return true;
}

void write_stats_tab(std::ostream& out, const std::vector<SequenceStats>& stats) {
    out << "# file\tformat\tnum_seqs\tsum_len\tmin_len\tavg_len\tmax_len\tN50\tavg_qual\n";
    for (const auto& s : stats) {
        if (!s.ok) continue;
        out << s.path << '\t'
            << format_name(s.format) << '\t'
            << s.num_records << '\t'
            << s.total_length << '\t'
            << s.min_length << '\t'
            << std::fixed << std::setprecision(1) << s.mean_length << '\t'
            << s.max_length << '\t'
            << s.n50 << '\t';
        if (s.format == FastxFormat::kFastq) {
            out << std::fixed << std::setprecision(2) << s.mean_quality;
        } else {
            out << '-';
        }
        out << '\n';
    }
}

void write_stats_json(std::ostream& out, const std::vector<SequenceStats>& stats) {
    Json::Value root;
    Json::Value files_arr(Json::arrayValue);
    for (const auto& s : stats) {
        Json::Value fobj;
        fobj["file"] = s.path;
        fobj["format"] = format_name(s.format);
        fobj["ok"] = s.ok;
        if (s.ok) {
            fobj["num_seqs"] = static_cast<Json::UInt64>(s.num_records);
            fobj["sum_len"] = static_cast<Json::UInt64>(s.total_length);
            fobj["min_len"] = static_cast<Json::UInt64>(s.min_length);
            fobj["max_len"] = static_cast<Json::UInt64>(s.max_length);
            fobj["avg_len"] = s.mean_length;
            fobj["n50"] = static_cast<Json::UInt64>(s.n50);
            if (s.format == FastxFormat::kFastq) {
                fobj["avg_qual"] = s.mean_quality;
            }
        } else {
            Json::Value eobj;
            eobj["kind"] = error_kind_name(s.error.kind);
            eobj["message"] = s.error.message;
            if (s.error.line > 0) {
                eobj["line"] = static_cast<Json::UInt64>(s.error.line);
            }
            fobj["error"] = std::move(eobj);
        }
        files_arr.append(std::move(fobj));
    }
    root["files"] = std::move(files_arr);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &out);
    out << '\n';
}

} // namespace fastxio
