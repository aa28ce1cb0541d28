#include "io/fai_index.hpp"
#include "core/config.hpp"
#include "util/number_parser.hpp"

#include <fstream>

namespace fastaseek {

// Split a string by tab delimiter
static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string::size_type start = 0;
    while (true) {
        auto pos = line.find('\t', start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

static Status row_error(uint64_t row, const std::string& what) {
    return make_status(FastaErrc::kMalformedIndex,
                       "row " + std::to_string(row) + ": " + what);
}

Status FaiIndex::load(std::istream& in) {
    clear();

    static const char* field_names[FAI_NUM_FIELDS] = {
        "name", "length", "offset", "line bases", "line bytes"};

    std::string line;
    uint64_t row = 0;
    while (std::getline(in, line)) {
        row++;

        // Remove trailing \r (CRLF index files)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty()) continue;

        auto fields = split_tabs(line);
        if (fields.size() != static_cast<size_t>(FAI_NUM_FIELDS)) {
            Status st = row_error(row, "expected " + std::to_string(FAI_NUM_FIELDS)
                                  + " tab-separated fields, got "
                                  + std::to_string(fields.size()));
            clear();
            return st;
        }
        if (fields[0].empty()) {
            clear();
            return row_error(row, "empty sequence name");
        }

        uint64_t vals[FAI_NUM_FIELDS - 1];
        for (int i = 1; i < FAI_NUM_FIELDS; i++) {
            if (!parse_u64(fields[i], vals[i - 1])) {
                Status st = row_error(row, std::string("invalid ") + field_names[i]
                                      + " '" + fields[i] + "'");
                clear();
                return st;
            }
        }

        FaiRecord rec;
        rec.len = vals[0];
        rec.offset = vals[1];
        rec.line_bases = vals[2];
        rec.line_bytes = vals[3];

        if (rec.line_bytes < rec.line_bases) {
            clear();
            return row_error(row, "line bytes smaller than line bases");
        }
        if (rec.line_bases == 0 && rec.len > 0) {
            clear();
            return row_error(row, "zero line bases for a non-empty sequence");
        }

        // Duplicate names are rejected.
        if (!records_.emplace(fields[0], rec).second) {
            Status st = row_error(row, "duplicate sequence name '" + fields[0] + "'");
            clear();
            return st;
        }
        names_.push_back(fields[0]);
    }

    if (in.bad()) {
        clear();
        return make_status(FastaErrc::kIo, "read error while loading index");
    }
    return {};
}

Status FaiIndex::load_file(const std::string& fai_path) {
    std::ifstream file(fai_path);
    if (!file.is_open()) {
        clear();
        return make_status(FastaErrc::kIo, "cannot open index " + fai_path);
    }
    Status st = load(file);
    if (!st.ok()) st.message = fai_path + ": " + st.message;
    return st;
}

Status FaiIndex::load_for_fasta(const std::string& fasta_path) {
    return load_file(path_for_fasta(fasta_path));
}

std::string FaiIndex::path_for_fasta(const std::string& fasta_path) {
    return fasta_path + FAI_SUFFIX;
}

const FaiRecord* FaiIndex::lookup(const std::string& name) const {
    auto it = records_.find(name);
    if (it == records_.end()) return nullptr;
    return &it->second;
}

std::vector<SequenceInfo> FaiIndex::sequences() const {
    std::vector<SequenceInfo> result;
    result.reserve(names_.size());
    for (const auto& name : names_) {
        result.push_back({name, records_.at(name).len});
    }
    return result;
}

uint64_t FaiIndex::total_length() const {
    uint64_t total = 0;
    for (const auto& kv : records_)
        total += kv.second.len;
    return total;
}

void FaiIndex::clear() {
    records_.clear();
    names_.clear();
}

} // namespace fastaseek
