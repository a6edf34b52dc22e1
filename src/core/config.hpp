#pragma once

#include <cstddef>
#include <cstdint>

namespace fastxio {

// Default size hint for id/sequence/quality buffers (bytes).
// Smaller values suit short reads, larger values long sequences.
inline constexpr size_t DEFAULT_SIZE_HINT = 64 * 1024;

// Size hints below this are raised to it.
inline constexpr size_t MIN_SIZE_HINT = 64;

// Bytes requested from the underlying source per read.
inline constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

// Compression magic bytes
inline constexpr uint8_t GZIP_MAGIC[2] = {0x1F, 0x8B};
inline constexpr uint8_t BZIP2_MAGIC[3] = {'B', 'Z', 'h'};

// Longest magic prefix inspected by the sniffer
inline constexpr size_t MAX_MAGIC_LEN = 3;

// Record sigils
inline constexpr char FASTA_HEADER_CHAR = '>';
inline constexpr char FASTQ_HEADER_CHAR = '@';
inline constexpr char FASTQ_SEPARATOR_CHAR = '+';

// Phred quality offset (Sanger / Illumina 1.8+)
inline constexpr int PHRED_OFFSET = 33;

inline constexpr size_t clamp_size_hint(size_t hint) {
    return hint < MIN_SIZE_HINT ? MIN_SIZE_HINT : hint;
}

} // namespace fastxio
