#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "core/status.hpp"
#include "io/fai_index.hpp"

namespace fastaseek {

class IndexedFastaReader;

// Pull-based cursor over a range of one sequence. While active it holds
// an exclusive lease on its reader: any other read through that reader
// fails with kReaderBusy until the iterator is released or destroyed.
class IndexedFastaIterator {
public:
    enum class NextResult { kBase, kEnd, kError };

    IndexedFastaIterator() = default;
    ~IndexedFastaIterator();

    IndexedFastaIterator(const IndexedFastaIterator&) = delete;
    IndexedFastaIterator& operator=(const IndexedFastaIterator&) = delete;

    IndexedFastaIterator(IndexedFastaIterator&& other) noexcept;
    IndexedFastaIterator& operator=(IndexedFastaIterator&& other) noexcept;

    // Produce the next base. After kEnd, further calls return kEnd.
    // On kError the failure is in status() and the iterator is finished.
    // If the reader is destroyed first, the next call fails with
    // kNotOpen.
    NextResult next(char& base);

    // Append all remaining bases to out.
    Status read_to_end(std::string& out);

    // Bases not yet returned by next().
    uint64_t remaining() const {
        return bases_left_ + static_cast<uint64_t>(buf_len_ - buf_idx_);
    }

    // True while the iterator holds its reader.
    bool active() const { return reader_ != nullptr; }

    // Last error reported by next().
    const Status& status() const { return status_; }

    // Give the reader back. The read is abandoned where it stands.
    void release();

private:
    friend class IndexedFastaReader;

    Status fill_buffer();

    // Called by the reader's destructor while the lease is held.
    void detach();

    IndexedFastaReader* reader_ = nullptr;
    FaiRecord record_;
    uint64_t bases_left_ = 0;
    uint64_t line_offset_ = 0;
    std::vector<char> buf_;
    size_t buf_idx_ = 0;
    size_t buf_len_ = 0;
    Status status_;
    bool detached_ = false;
};

// Random access to a FASTA file through its .fai index.
// One read or iterator at a time: the underlying stream has a single
// position. Not copyable or movable, since live iterators point at it.
class IndexedFastaReader {
public:
    IndexedFastaReader() = default;
    ~IndexedFastaReader();

    IndexedFastaReader(const IndexedFastaReader&) = delete;
    IndexedFastaReader& operator=(const IndexedFastaReader&) = delete;
    IndexedFastaReader(IndexedFastaReader&&) = delete;
    IndexedFastaReader& operator=(IndexedFastaReader&&) = delete;

    // All open() overloads and close() fail with kReaderBusy while an
    // iterator holds the reader.

    // Open a FASTA file; the index is read from "<fasta_path>.fai".
    Status open(const std::string& fasta_path);

    // Open a FASTA file with an explicit index path.
    Status open(const std::string& fasta_path, const std::string& fai_path);

    // Open from a seekable stream and an index stream.
    Status open(std::unique_ptr<std::istream> fasta, std::istream& fai);

    // Open from a seekable stream and an already parsed index.
    Status open(std::unique_ptr<std::istream> fasta, FaiIndex index);

    Status close();
    bool is_open() const { return fasta_ != nullptr; }

    // True while an iterator holds the reader.
    bool busy() const { return lessee_ != nullptr; }

    const FaiIndex& index() const { return index_; }
    std::vector<SequenceInfo> sequences() const { return index_.sequences(); }

    // Read bases [start, stop) of a sequence into seq.
    // seq is untouched if the request is rejected before any I/O.
    Status read(const std::string& name, uint64_t start, uint64_t stop,
                std::string& seq);

    // Read a whole sequence into seq.
    Status read_all(const std::string& name, std::string& seq);

    // Start lazy iteration over [start, stop). On success `it` holds the
    // lease on this reader; whatever `it` held before is released first.
    Status read_iter(const std::string& name, uint64_t start, uint64_t stop,
                     IndexedFastaIterator& it);

    Status read_iter_all(const std::string& name, IndexedFastaIterator& it);

private:
    friend class IndexedFastaIterator;

    Status check_request(const std::string& name, uint64_t start, uint64_t stop,
                         FaiRecord& rec) const;
    Status check_request_all(const std::string& name, FaiRecord& rec) const;
    Status seek_to(const FaiRecord& rec, uint64_t start, uint64_t& line_offset);
    Status read_into_buffer(const FaiRecord& rec, uint64_t start, uint64_t stop,
                            std::string& seq);
    Status read_into_iter(const FaiRecord& rec, uint64_t start, uint64_t stop,
                          IndexedFastaIterator& it);

    std::unique_ptr<std::istream> fasta_;
    FaiIndex index_;
    IndexedFastaIterator* lessee_ = nullptr;  // iterator holding the lease
};

} // namespace fastaseek
