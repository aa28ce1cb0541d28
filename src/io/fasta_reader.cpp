#include "io/fasta_reader.hpp"

#include <cctype>
#include <iostream>

namespace fastaseek {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static void trim_right(std::string& s) {
    while (!s.empty() && is_space(s.back()))
        s.pop_back();
}

// --- FastaRecord ---

std::string FastaRecord::id() const {
    if (header.empty()) return {};
    size_t end = 1;
    while (end < header.size() && !is_space(header[end]))
        end++;
    return header.substr(1, end - 1);
}

std::string FastaRecord::desc() const {
    if (header.empty()) return {};
    size_t pos = 1;
    while (pos < header.size() && !is_space(header[pos]))
        pos++;
    if (pos >= header.size()) return {};
    return header.substr(pos + 1);
}

bool FastaRecord::has_desc() const {
    return !desc().empty();
}

bool FastaRecord::check(std::string& error_msg) const {
    if (id().empty()) {
        error_msg = "Expecting id for FASTA record";
        return false;
    }
    for (char c : seq) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            error_msg = "Non-ASCII character found in sequence";
            return false;
        }
    }
    return true;
}

// --- FastaReader ---

FastaReader::FastaReader(const std::string& path) {
    if (path == "-") {
        in_ = &std::cin;
        return;
    }
    file_ = std::make_unique<std::ifstream>(path);
    if (file_->is_open()) {
        in_ = file_.get();
    }
}

Status FastaReader::read(FastaRecord& rec) {
    rec.clear();
    if (!in_) {
        return make_status(FastaErrc::kIo, "FASTA input is not open");
    }

    if (!have_line_) {
        // Skip leading blank lines
        while (std::getline(*in_, line_)) {
            trim_right(line_);
            if (!line_.empty()) {
                have_line_ = true;
                break;
            }
        }
        if (!have_line_) {
            if (in_->bad()) return make_status(FastaErrc::kIo, "read error");
            return {};  // end of input
        }
    }

    if (line_[0] != '>') {
        have_line_ = false;
        return make_status(FastaErrc::kMalformedRecord,
                           "Expected '>' at record start");
    }
    rec.header = line_;
    have_line_ = false;

    while (std::getline(*in_, line_)) {
        trim_right(line_);
        if (!line_.empty() && line_[0] == '>') {
            have_line_ = true;
            break;
        }
        rec.seq += line_;
    }

    if (in_->bad()) return make_status(FastaErrc::kIo, "read error");
    return {};
}

Status read_all_fasta(const std::string& path, std::vector<FastaRecord>& records) {
    records.clear();
    FastaReader reader(path);
    if (!reader.is_open()) {
        return make_status(FastaErrc::kIo, "cannot open " + path);
    }

    FastaRecord rec;
    while (true) {
        Status st = reader.read(rec);
        if (!st.ok()) return st;
        if (rec.empty()) break;
        records.push_back(std::move(rec));
    }
    return {};
}

} // namespace fastaseek
