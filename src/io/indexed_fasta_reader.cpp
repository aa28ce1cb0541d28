#include "io/indexed_fasta_reader.hpp"
#include "io/line_chunk_reader.hpp"
#include "io/seek_math.hpp"

#include <fstream>
#include <utility>

namespace fastaseek {

// --- IndexedFastaReader ---

static Status busy_status() {
    return make_status(FastaErrc::kReaderBusy,
                       "reader is held by an active iterator");
}

IndexedFastaReader::~IndexedFastaReader() {
    if (lessee_) lessee_->detach();
}

Status IndexedFastaReader::open(const std::string& fasta_path) {
    return open(fasta_path, FaiIndex::path_for_fasta(fasta_path));
}

Status IndexedFastaReader::open(const std::string& fasta_path,
                                const std::string& fai_path) {
    if (lessee_) return busy_status();

    FaiIndex index;
    Status st = index.load_file(fai_path);
    if (!st.ok()) return st;

    auto file = std::make_unique<std::ifstream>(fasta_path, std::ios::binary);
    if (!file->is_open()) {
        return make_status(FastaErrc::kIo, "cannot open FASTA " + fasta_path);
    }
    return open(std::move(file), std::move(index));
}

Status IndexedFastaReader::open(std::unique_ptr<std::istream> fasta,
                                std::istream& fai) {
    if (lessee_) return busy_status();

    FaiIndex index;
    Status st = index.load(fai);
    if (!st.ok()) return st;
    return open(std::move(fasta), std::move(index));
}

Status IndexedFastaReader::open(std::unique_ptr<std::istream> fasta,
                                FaiIndex index) {
    if (lessee_) return busy_status();
    if (!fasta) {
        return make_status(FastaErrc::kIo, "null FASTA stream");
    }
    fasta_ = std::move(fasta);
    index_ = std::move(index);
    return {};
}

Status IndexedFastaReader::close() {
    if (lessee_) return busy_status();
    fasta_.reset();
    index_.clear();
    return {};
}

Status IndexedFastaReader::read(const std::string& name, uint64_t start,
                                uint64_t stop, std::string& seq) {
    FaiRecord rec;
    Status st = check_request(name, start, stop, rec);
    if (!st.ok()) return st;
    return read_into_buffer(rec, start, stop, seq);
}

Status IndexedFastaReader::read_all(const std::string& name, std::string& seq) {
    FaiRecord rec;
    Status st = check_request_all(name, rec);
    if (!st.ok()) return st;
    return read_into_buffer(rec, 0, rec.len, seq);
}

Status IndexedFastaReader::read_iter(const std::string& name, uint64_t start,
                                     uint64_t stop, IndexedFastaIterator& it) {
    it.release();
    FaiRecord rec;
    Status st = check_request(name, start, stop, rec);
    if (!st.ok()) return st;
    return read_into_iter(rec, start, stop, it);
}

Status IndexedFastaReader::read_iter_all(const std::string& name,
                                         IndexedFastaIterator& it) {
    it.release();
    FaiRecord rec;
    Status st = check_request_all(name, rec);
    if (!st.ok()) return st;
    return read_into_iter(rec, 0, rec.len, it);
}

Status IndexedFastaReader::check_request_all(const std::string& name,
                                             FaiRecord& rec) const {
    if (!fasta_) return make_status(FastaErrc::kNotOpen, name);
    if (lessee_) return busy_status();

    const FaiRecord* found = index_.lookup(name);
    if (!found) {
        return make_status(FastaErrc::kUnknownSequence, name);
    }
    rec = *found;
    return {};
}

Status IndexedFastaReader::check_request(const std::string& name, uint64_t start,
                                         uint64_t stop, FaiRecord& rec) const {
    Status st = check_request_all(name, rec);
    if (!st.ok()) return st;

    if (stop > rec.len) {
        return make_status(FastaErrc::kOutOfBounds,
                           name + ": stop " + std::to_string(stop)
                           + " exceeds length " + std::to_string(rec.len));
    }
    if (start > stop) {
        return make_status(FastaErrc::kInvalidRange,
                           name + ": start " + std::to_string(start)
                           + " > stop " + std::to_string(stop));
    }
    return {};
}

// Seek to base `start` of the record; line_offset receives the cursor
// position within the line the seek ended on.
Status IndexedFastaReader::seek_to(const FaiRecord& rec, uint64_t start,
                                   uint64_t& line_offset) {
    // A previous short read leaves failbit set; seekg would not clear it.
    fasta_->clear();
    fasta_->seekg(static_cast<std::streamoff>(seek_offset(rec, start)), std::ios::beg);
    if (!*fasta_) {
        return make_status(FastaErrc::kIo,
                           "seek to offset " + std::to_string(seek_offset(rec, start))
                           + " failed");
    }
    line_offset = line_offset_of(rec, start);
    return {};
}

Status IndexedFastaReader::read_into_buffer(const FaiRecord& rec, uint64_t start,
                                            uint64_t stop, std::string& seq) {
    seq.clear();
    uint64_t bases_left = stop - start;
    if (bases_left == 0) return {};

    uint64_t line_offset = 0;
    Status st = seek_to(rec, start, line_offset);
    if (!st.ok()) return st;

    std::vector<char> buf(fasta_buffer_size(rec, bases_left, line_offset));
    seq.reserve(static_cast<size_t>(bases_left));

    while (bases_left > 0) {
        uint64_t kept = 0;
        st = read_line_chunk(*fasta_, rec, line_offset, bases_left, buf, kept);
        if (!st.ok()) return st;

        seq.append(buf.data(), static_cast<size_t>(kept));
        bases_left -= kept;
    }
    return {};
}

Status IndexedFastaReader::read_into_iter(const FaiRecord& rec, uint64_t start,
                                          uint64_t stop, IndexedFastaIterator& it) {
    uint64_t bases_left = stop - start;
    uint64_t line_offset = 0;
    if (bases_left > 0) {
        Status st = seek_to(rec, start, line_offset);
        if (!st.ok()) return st;
    }

    it.reader_ = this;
    it.record_ = rec;
    it.bases_left_ = bases_left;
    it.line_offset_ = line_offset;
    it.buf_.assign(fasta_buffer_size(rec, bases_left, line_offset), 0);
    it.buf_idx_ = 0;
    it.buf_len_ = 0;
    it.status_ = Status();
    it.detached_ = false;
    lessee_ = &it;
    return {};
}

// --- IndexedFastaIterator ---

IndexedFastaIterator::~IndexedFastaIterator() {
    release();
}

IndexedFastaIterator::IndexedFastaIterator(IndexedFastaIterator&& other) noexcept
    : reader_(other.reader_),
      record_(other.record_),
      bases_left_(other.bases_left_),
      line_offset_(other.line_offset_),
      buf_(std::move(other.buf_)),
      buf_idx_(other.buf_idx_),
      buf_len_(other.buf_len_),
      status_(std::move(other.status_)),
      detached_(other.detached_) {
    if (reader_) reader_->lessee_ = this;
    other.reader_ = nullptr;
    other.detached_ = false;
    other.bases_left_ = 0;
    other.buf_idx_ = 0;
    other.buf_len_ = 0;
}

IndexedFastaIterator& IndexedFastaIterator::operator=(IndexedFastaIterator&& other) noexcept {
    if (this != &other) {
        release();
        reader_ = other.reader_;
        record_ = other.record_;
        bases_left_ = other.bases_left_;
        line_offset_ = other.line_offset_;
        buf_ = std::move(other.buf_);
        buf_idx_ = other.buf_idx_;
        buf_len_ = other.buf_len_;
        status_ = std::move(other.status_);
        detached_ = other.detached_;
        if (reader_) reader_->lessee_ = this;
        other.reader_ = nullptr;
        other.detached_ = false;
        other.bases_left_ = 0;
        other.buf_idx_ = 0;
        other.buf_len_ = 0;
    }
    return *this;
}

void IndexedFastaIterator::release() {
    if (reader_) {
        reader_->lessee_ = nullptr;
        reader_ = nullptr;
    }
    bases_left_ = 0;
    buf_idx_ = 0;
    buf_len_ = 0;
    detached_ = false;
}

void IndexedFastaIterator::detach() {
    reader_ = nullptr;
    bases_left_ = 0;
    buf_idx_ = 0;
    buf_len_ = 0;
    detached_ = true;
}

// Refill until at least one base is buffered or the range is done.
// A chunk that only consumes terminator bytes keeps zero bases.
Status IndexedFastaIterator::fill_buffer() {
    while (buf_idx_ == buf_len_ && bases_left_ > 0) {
        uint64_t kept = 0;
        Status st = read_line_chunk(*reader_->fasta_, record_, line_offset_,
                                    bases_left_, buf_, kept);
        if (!st.ok()) return st;

        buf_idx_ = 0;
        buf_len_ = static_cast<size_t>(kept);
        bases_left_ -= kept;
    }
    return {};
}

IndexedFastaIterator::NextResult IndexedFastaIterator::next(char& base) {
    if (detached_) {
        detached_ = false;
        status_ = make_status(FastaErrc::kNotOpen,
                              "reader destroyed during iteration");
        return NextResult::kError;
    }
    if (buf_idx_ < buf_len_) {
        base = buf_[buf_idx_++];
        return NextResult::kBase;
    }
    if (bases_left_ == 0 || !reader_) {
        return NextResult::kEnd;
    }

    Status st = fill_buffer();
    if (!st.ok()) {
        status_ = std::move(st);
        release();
        return NextResult::kError;
    }
    if (buf_idx_ == buf_len_) {
        return NextResult::kEnd;
    }
    base = buf_[buf_idx_++];
    return NextResult::kBase;
}

Status IndexedFastaIterator::read_to_end(std::string& out) {
    out.reserve(out.size() + static_cast<size_t>(remaining()));
    char base;
    while (true) {
        switch (next(base)) {
            case NextResult::kBase:
                out.push_back(base);
                break;
            case NextResult::kEnd:
                return {};
            case NextResult::kError:
                return status_;
        }
    }
}

} // namespace fastaseek
