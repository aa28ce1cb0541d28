#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "core/config.hpp"
#include "io/fai_index.hpp"

namespace fastaseek {

// Seek arithmetic for line-wrapped FASTA described by a .fai record.
// All functions are pure; callers validate start <= rec.len.

// Position of base `start` within its physical line.
inline uint64_t line_offset_of(const FaiRecord& rec, uint64_t start) {
    if (rec.line_bases == 0) return 0;  // only legal for empty sequences
    return start % rec.line_bases;
}

// Byte address of base `start` in the data file.
inline uint64_t seek_offset(const FaiRecord& rec, uint64_t start) {
    if (rec.line_bases == 0) return rec.offset;
    uint64_t line_start = start / rec.line_bases * rec.line_bytes;
    return rec.offset + line_start + start % rec.line_bases;
}

struct ChunkPlan {
    uint64_t bytes_to_read;
    uint64_t bytes_to_keep;  // leading bytes of the read that are bases
};

// Plan one read from the current line cursor. When the request runs past
// the end of the current line the read extends through the line
// terminator (bounded by capacity) but only the bases are kept.
inline ChunkPlan plan_chunk(const FaiRecord& rec, uint64_t line_offset,
                            uint64_t bases_left, size_t capacity) {
    uint64_t cap = static_cast<uint64_t>(capacity);
    uint64_t bases_on_line = rec.line_bases - std::min(rec.line_bases, line_offset);

    ChunkPlan plan;
    if (bases_on_line < bases_left) {
        plan.bytes_to_read = std::min(cap, rec.line_bytes - line_offset);
        plan.bytes_to_keep = std::min(plan.bytes_to_read, bases_on_line);
    } else {
        plan.bytes_to_read = std::min(cap, bases_left);
        plan.bytes_to_keep = plan.bytes_to_read;
    }
    return plan;
}

// Move the line cursor past bytes_read bytes, wrapping at line end.
inline uint64_t advance_line_offset(const FaiRecord& rec, uint64_t line_offset,
                                    uint64_t bytes_read) {
    line_offset += bytes_read;
    if (line_offset >= rec.line_bytes) line_offset = 0;
    return line_offset;
}

// Scratch buffer size for reading `length` bases starting at
// `line_offset`. Favors one read call per physical line; a request that
// ends inside the first line's terminator gets the whole remaining line
// so it can be read in one call.
inline size_t fasta_buffer_size(const FaiRecord& rec, uint64_t length,
                                uint64_t line_offset) {
    uint64_t size;
    if (length < rec.line_bytes) {
        if (length + line_offset > rec.line_bases &&
            length + line_offset < rec.line_bytes) {
            size = rec.line_bytes - line_offset;
        } else {
            size = length;
        }
    } else {
        size = rec.line_bytes;
    }
    return static_cast<size_t>(std::min<uint64_t>(MAX_FASTA_BUFFER_SIZE, size));
}

} // namespace fastaseek
