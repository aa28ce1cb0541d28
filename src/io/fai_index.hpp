#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/status.hpp"

namespace fastaseek {

// One row of a samtools faidx (.fai) index.
struct FaiRecord {
    uint64_t len = 0;         // bases in the sequence
    uint64_t offset = 0;      // byte offset of the first base
    uint64_t line_bases = 0;  // bases per full line
    uint64_t line_bytes = 0;  // bytes per full line, terminator included
};

struct SequenceInfo {
    std::string name;
    uint64_t len;
};

// Name -> FaiRecord map that also keeps the file order of the rows.
// Immutable once loaded.
class FaiIndex {
public:
    // Parse .fai rows from a stream. Replaces any previous content;
    // on failure the index is left empty.
    Status load(std::istream& in);

    // Open and parse a .fai file.
    Status load_file(const std::string& fai_path);

    // Load "<fasta_path>.fai".
    Status load_for_fasta(const std::string& fasta_path);

    // e.g. "ref.fa" -> "ref.fa.fai"
    static std::string path_for_fasta(const std::string& fasta_path);

    // Returns nullptr if name is not in the index.
    const FaiRecord* lookup(const std::string& name) const;

    // {name, len} for every sequence, in file order.
    std::vector<SequenceInfo> sequences() const;

    const std::vector<std::string>& names() const { return names_; }
    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }
    uint64_t total_length() const;

    void clear();

private:
    std::unordered_map<std::string, FaiRecord> records_;
    std::vector<std::string> names_;
};

} // namespace fastaseek
