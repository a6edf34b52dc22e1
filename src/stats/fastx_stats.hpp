#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace fastxio {

enum class FastxFormat { kAuto, kFasta, kFastq };

// Parse "auto", "fasta" or "fastq". Returns true on success.
// On failure, out is unchanged and error_msg is set.
bool parse_format(const std::string& str, FastxFormat& out, std::string& error_msg);

const char* format_name(FastxFormat fmt);

// Guess the format from the file name (.fa/.fasta/.fna/.ffn/.faa/.fas,
// .fq/.fastq, each optionally followed by .gz or .bz2). Unknown names,
// including "-", are treated as FASTA.
FastxFormat format_from_path(const std::string& path);

struct SequenceStats {
    std::string path;
    FastxFormat format = FastxFormat::kFasta;
    uint64_t num_records = 0;
    uint64_t total_length = 0;
    uint64_t min_length = 0;
    uint64_t max_length = 0;
    double mean_length = 0.0;
    uint64_t n50 = 0;
    double mean_quality = 0.0; // FASTQ only, Phred+33
    bool ok = false;
    ReadError error;
};

// Length at which the running sum over lengths sorted in decreasing order
// first reaches half of the total. 0 for an empty set. Reorders lengths.
uint64_t compute_n50(std::vector<uint64_t>& lengths);

// Stream path once and fill stats. kAuto resolves via format_from_path().
// Returns false on read failure (stats.error set, stats.ok false).
bool compute_stats(const std::string& path, FastxFormat format,
                   const ReaderConfig& config, SequenceStats& stats);

// Tab-delimited report, one line per input.
void write_stats_tab(std::ostream& out, const std::vector<SequenceStats>& stats);

// JSON report: {"files": [ {...}, ... ]}
void write_stats_json(std::ostream& out, const std::vector<SequenceStats>& stats);

} // namespace fastxio
