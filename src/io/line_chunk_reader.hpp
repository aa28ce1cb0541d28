#pragma once

#include <cstdint>
#include <istream>
#include <vector>

#include "core/status.hpp"
#include "io/fai_index.hpp"

namespace fastaseek {

// Read the remaining bases of the current physical line, but no more
// than bases_left nor buf.size() bytes, with exactly one read from the
// current stream position. Line terminator bytes may be consumed in the
// same read but are never counted in bases_kept: only buf[0, bases_kept)
// holds bases. bases_kept can be 0 when the cursor sits inside a line
// terminator; callers loop.
//
// line_offset is advanced (and wrapped to 0 at the end of a line).
// Fails with kUnexpectedEof if the stream ends before the planned read
// completes.
Status read_line_chunk(std::istream& in, const FaiRecord& rec,
                       uint64_t& line_offset, uint64_t bases_left,
                       std::vector<char>& buf, uint64_t& bases_kept);

} // namespace fastaseek
