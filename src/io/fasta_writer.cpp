#include "io/fasta_writer.hpp"

#include <algorithm>

namespace fastaseek {

Status FastaWriter::check_stream() const {
    if (!out_) return make_status(FastaErrc::kIo, "write failed");
    return {};
}

Status FastaWriter::begin_record(const std::string& id, const std::string& desc) {
    out_ << '>' << id;
    if (!desc.empty()) out_ << ' ' << desc;
    out_ << '\n';
    column_ = 0;
    return check_stream();
}

Status FastaWriter::append(const char* data, size_t n) {
    if (line_width_ == 0) {
        out_.write(data, static_cast<std::streamsize>(n));
        column_ += n;
        return check_stream();
    }

    while (n > 0) {
        if (column_ >= line_width_) {
            out_.put('\n');
            column_ = 0;
        }
        size_t len = std::min(n, line_width_ - column_);
        out_.write(data, static_cast<std::streamsize>(len));
        data += len;
        n -= len;
        column_ += len;
    }
    return check_stream();
}

Status FastaWriter::end_record() {
    // An empty sequence still gets its own (empty) line.
    out_.put('\n');
    column_ = 0;
    return check_stream();
}

Status FastaWriter::write(const std::string& id, const std::string& desc,
                          const std::string& seq) {
    Status st = begin_record(id, desc);
    if (!st.ok()) return st;
    st = append(seq.data(), seq.size());
    if (!st.ok()) return st;
    return end_record();
}

Status FastaWriter::write_record(const FastaRecord& rec) {
    return write(rec.id(), rec.desc(), rec.seq);
}

Status FastaWriter::flush() {
    out_.flush();
    return check_stream();
}

} // namespace fastaseek
