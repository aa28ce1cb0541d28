#include "fetch/region_fetcher.hpp"
#include "io/fai_index.hpp"
#include "io/fasta_writer.hpp"
#include "io/indexed_fasta_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <fstream>
#include <memory>

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace fastaseek {

static char complement(char c) {
    switch (c) {
        case 'A': return 'T'; case 'a': return 't';
        case 'C': return 'G'; case 'c': return 'g';
        case 'G': return 'C'; case 'g': return 'c';
        case 'T': return 'A'; case 't': return 'a';
        case 'U': return 'A'; case 'u': return 'a';
        case 'R': return 'Y'; case 'r': return 'y';
        case 'Y': return 'R'; case 'y': return 'r';
        case 'K': return 'M'; case 'k': return 'm';
        case 'M': return 'K'; case 'm': return 'k';
        case 'B': return 'V'; case 'b': return 'v';
        case 'V': return 'B'; case 'v': return 'b';
        case 'D': return 'H'; case 'd': return 'h';
        case 'H': return 'D'; case 'h': return 'd';
        // N, S, W and others stay as-is
        default:  return c;
    }
}

void reverse_complement(std::string& seq) {
    std::reverse(seq.begin(), seq.end());
    for (auto& c : seq)
        c = complement(c);
}

Status resolve_region(const FaiIndex& index, Region& r) {
    const FaiRecord* rec = index.lookup(r.name);
    if (!rec) {
        return make_status(FastaErrc::kUnknownSequence, r.name);
    }
    if (r.whole) {
        r.start = 0;
        r.stop = rec->len;
    } else if (r.to_end) {
        r.stop = rec->len;
    }
    r.to_end = false;
    return {};
}

FetchStats fetch_regions(const std::string& fasta_path, const FaiIndex& index,
                         std::vector<Region> regions,
                         const RegionFetchConfig& config,
                         std::ostream& out, const Logger& logger) {
    FetchStats stats;
    std::vector<std::string> seqs(regions.size());
    std::vector<Status> results(regions.size());

    for (size_t i = 0; i < regions.size(); i++) {
        if (config.reverse_all) regions[i].reverse = true;
        results[i] = resolve_region(index, regions[i]);
    }

    // One reader per worker thread: a reader serves one read at a time.
    tbb::enumerable_thread_specific<std::unique_ptr<IndexedFastaReader>> tls_readers;

    int threads = std::max(1, config.threads);
    logger.debug("Fetching %zu region(s) with %d thread(s)", regions.size(), threads);

    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, regions.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                auto& reader = tls_readers.local();
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    if (!results[i].ok()) continue;

                    if (!reader) {
                        auto file = std::make_unique<std::ifstream>(fasta_path, std::ios::binary);
                        if (!file->is_open()) {
                            results[i] = make_status(FastaErrc::kIo,
                                                     "cannot open FASTA " + fasta_path);
                            continue;
                        }
                        auto r = std::make_unique<IndexedFastaReader>();
                        Status st = r->open(std::move(file), index);
                        if (!st.ok()) {
                            results[i] = st;
                            continue;
                        }
                        reader = std::move(r);
                    }

                    const Region& reg = regions[i];
                    results[i] = reader->read(reg.name, reg.start, reg.stop, seqs[i]);
                    if (results[i].ok() && reg.reverse) {
                        reverse_complement(seqs[i]);
                    }
                }
            });
    });

    FastaWriter writer(out, config.line_width);
    for (size_t i = 0; i < regions.size(); i++) {
        if (!results[i].ok()) {
            logger.warn("Region '%s': %s", region_display_name(regions[i]).c_str(),
                        results[i].to_string().c_str());
            stats.failed++;
            continue;
        }
        Status st = writer.write(region_display_name(regions[i]), {}, seqs[i]);
        if (!st.ok()) {
            logger.error("Writing output: %s", st.to_string().c_str());
            stats.failed += static_cast<uint32_t>(regions.size() - i);
            return stats;
        }
        std::string().swap(seqs[i]);
        stats.retrieved++;
    }
    return stats;
}

// Copy one region from the iterator to the writer without materializing it.
static Status stream_one(IndexedFastaIterator& it, FastaWriter& writer) {
    char chunk[4096];
    size_t n = 0;
    char base;
    while (true) {
        auto res = it.next(base);
        if (res == IndexedFastaIterator::NextResult::kError) {
            // Bases produced before the failure are still written
            if (n > 0) {
                Status st = writer.append(chunk, n);
                if (!st.ok()) return st;
            }
            return it.status();
        }
        if (res == IndexedFastaIterator::NextResult::kEnd) break;

        chunk[n++] = base;
        if (n == sizeof(chunk)) {
            Status st = writer.append(chunk, n);
            if (!st.ok()) return st;
            n = 0;
        }
    }
    if (n > 0) return writer.append(chunk, n);
    return {};
}

FetchStats stream_regions(IndexedFastaReader& reader,
                          std::vector<Region> regions,
                          const RegionFetchConfig& config,
                          std::ostream& out, const Logger& logger) {
    FetchStats stats;
    FastaWriter writer(out, config.line_width);

    for (auto& reg : regions) {
        if (config.reverse_all) reg.reverse = true;

        Status st = resolve_region(reader.index(), reg);
        IndexedFastaIterator it;
        if (st.ok()) st = reader.read_iter(reg.name, reg.start, reg.stop, it);
        if (!st.ok()) {
            logger.warn("Region '%s': %s", region_display_name(reg).c_str(),
                        st.to_string().c_str());
            stats.failed++;
            continue;
        }
        logger.debug("Streaming %s (%llu bases)", region_display_name(reg).c_str(),
                     static_cast<unsigned long long>(it.remaining()));

        if (reg.reverse) {
            std::string seq;
            st = it.read_to_end(seq);
            if (st.ok()) {
                reverse_complement(seq);
                st = writer.write(region_display_name(reg), {}, seq);
            }
        } else {
            st = writer.begin_record(region_display_name(reg));
            if (st.ok()) st = stream_one(it, writer);
            // A failed record is still terminated so later output stays valid
            Status end_st = writer.end_record();
            if (st.ok()) st = end_st;
        }

        if (!st.ok()) {
            logger.warn("Region '%s': %s", region_display_name(reg).c_str(),
                        st.to_string().c_str());
            stats.failed++;
            continue;
        }
        stats.retrieved++;
    }
    return stats;
}

} // namespace fastaseek
