#pragma once

#include <cstddef>
#include <cstdint>

namespace fastaseek {

// Upper bound on the scratch buffer used for indexed reads.
inline constexpr size_t MAX_FASTA_BUFFER_SIZE = 512;

// Index file suffix appended to the FASTA path (samtools faidx convention)
inline constexpr const char* FAI_SUFFIX = ".fai";

// Number of tab-separated fields per .fai row
inline constexpr int FAI_NUM_FIELDS = 5;

// Output line width of the fetch tool (0 = one line per record)
inline constexpr int DEFAULT_LINE_WIDTH = 70;

} // namespace fastaseek
