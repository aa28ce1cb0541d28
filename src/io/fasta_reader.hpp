#pragma once

#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "core/status.hpp"

namespace fastaseek {

struct FastaRecord {
    std::string header;   // header line including '>', terminator stripped
    std::string seq;      // concatenated sequence lines

    // First whitespace-delimited word after '>'.
    std::string id() const;

    // Text after the id, or empty when there is none.
    std::string desc() const;
    bool has_desc() const;

    // Fails if the id is missing or the sequence is not plain ASCII.
    bool check(std::string& error_msg) const;

    bool empty() const { return header.empty() && seq.empty(); }
    void clear() { header.clear(); seq.clear(); }
};

// Sequential record-at-a-time FASTA parser. No index, no seeking.
class FastaReader {
public:
    // Read from a caller-owned stream.
    explicit FastaReader(std::istream& in) : in_(&in) {}

    // Read from a file; path can be "-" for stdin.
    explicit FastaReader(const std::string& path);

    bool is_open() const { return in_ != nullptr; }

    // Read the next record into rec. At end of input returns ok with
    // rec.empty(). Fails with kMalformedRecord when a record does not
    // start with '>'.
    Status read(FastaRecord& rec);

private:
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;
    std::string line_;       // look-ahead line (next header)
    bool have_line_ = false;
};

// Read all records from a FASTA file ("-" for stdin).
Status read_all_fasta(const std::string& path, std::vector<FastaRecord>& records);

} // namespace fastaseek
