#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "core/status.hpp"
#include "io/fasta_reader.hpp"

namespace fastaseek {

// FASTA writer. With line_width == 0 each sequence is written on a
// single line; otherwise it is wrapped every line_width bases.
class FastaWriter {
public:
    explicit FastaWriter(std::ostream& out, size_t line_width = 0)
        : out_(out), line_width_(line_width) {}

    size_t line_width() const { return line_width_; }

    // Write a whole record. desc is omitted from the header when empty.
    Status write(const std::string& id, const std::string& desc,
                 const std::string& seq);

    Status write_record(const FastaRecord& rec);

    // Streaming form: begin_record, any number of append calls,
    // end_record.
    Status begin_record(const std::string& id, const std::string& desc = {});
    Status append(const char* data, size_t n);
    Status end_record();

    Status flush();

private:
    Status check_stream() const;

    std::ostream& out_;
    const size_t line_width_;
    size_t column_ = 0;
};

} // namespace fastaseek
