#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/status.hpp"
#include "io/region_parser.hpp"

namespace fastaseek {

class FaiIndex;
class IndexedFastaReader;
class Logger;

struct RegionFetchConfig {
    int threads = 1;                       // batch mode worker count
    size_t line_width = DEFAULT_LINE_WIDTH; // 0 = one line per record
    bool reverse_all = false;              // reverse complement every region
};

struct FetchStats {
    uint32_t retrieved = 0;
    uint32_t failed = 0;
};

// Fill in the coordinates a region left open (whole sequence, open end).
// Fails with kUnknownSequence if the name is not indexed. Range checks
// are left to the reader.
Status resolve_region(const FaiIndex& index, Region& r);

// Reverse complement in place. IUPAC codes are complemented, case is
// kept, anything else is left as-is.
void reverse_complement(std::string& seq);

// Retrieve all regions with eager reads on `threads` workers, each with
// its own reader on fasta_path, and write them as FASTA in input order.
// Failed regions are logged and skipped.
FetchStats fetch_regions(const std::string& fasta_path, const FaiIndex& index,
                         std::vector<Region> regions,
                         const RegionFetchConfig& config,
                         std::ostream& out, const Logger& logger);

// Retrieve regions one at a time through the lazy iterator, writing
// bases as they are produced. Reverse-complemented regions are
// materialized first.
FetchStats stream_regions(IndexedFastaReader& reader,
                          std::vector<Region> regions,
                          const RegionFetchConfig& config,
                          std::ostream& out, const Logger& logger);

} // namespace fastaseek
