#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace fastaseek {

class FaiIndex;

// A requested interval, 0-based half-open once resolved.
struct Region {
    std::string name;
    uint64_t start = 0;
    uint64_t stop = 0;
    bool to_end = true;       // stop is the sequence length (not yet known)
    bool whole = true;        // no coordinates were given
    bool reverse = false;     // reverse complement on output
    std::string label;        // output id override (BED name column)
};

// Parse a samtools-style region: "name", "name:start" or
// "name:start-end" with 1-based inclusive coordinates. Commas in
// numbers are ignored. If `index` is non-null and the whole string is a
// sequence name, it is taken as that name even if it contains ':'.
// Returns false and sets error_msg on a malformed string.
bool parse_region(const std::string& str, const FaiIndex* index,
                  Region& out, std::string& error_msg);

// Parse one region string per line; blank lines and '#' lines skipped.
bool parse_region_list(std::istream& in, const FaiIndex* index,
                       std::vector<Region>& out, std::string& error_msg);

// Parse BED rows: chrom, start, end (0-based half-open), optional name,
// score and strand ('-' = reverse). "track", "browser" and '#' lines
// are skipped.
bool parse_bed(std::istream& in, std::vector<Region>& out,
               std::string& error_msg);

// Output id for a region: label, "name", or "name:S-E" (1-based
// inclusive), with "/rc" appended when reversed. Call after the region
// has been resolved against the index.
std::string region_display_name(const Region& r);

} // namespace fastaseek
