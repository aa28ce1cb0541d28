#include "io/line_chunk_reader.hpp"
#include "io/seek_math.hpp"

#include <string>

namespace fastaseek {

Status read_line_chunk(std::istream& in, const FaiRecord& rec,
                       uint64_t& line_offset, uint64_t bases_left,
                       std::vector<char>& buf, uint64_t& bases_kept) {
    bases_kept = 0;
    ChunkPlan plan = plan_chunk(rec, line_offset, bases_left, buf.size());

    in.read(buf.data(), static_cast<std::streamsize>(plan.bytes_to_read));
    uint64_t got = static_cast<uint64_t>(in.gcount());
    if (got != plan.bytes_to_read) {
        if (in.bad()) {
            return make_status(FastaErrc::kIo, "read failed");
        }
        return make_status(FastaErrc::kUnexpectedEof,
                           "expected " + std::to_string(plan.bytes_to_read)
                           + " bytes, got " + std::to_string(got));
    }

    line_offset = advance_line_offset(rec, line_offset, plan.bytes_to_read);
    bases_kept = plan.bytes_to_keep;
    return {};
}

} // namespace fastaseek
