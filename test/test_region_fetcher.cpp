#include "test_util.hpp"
#include "fasta_fixture.hpp"
#include "fetch/region_fetcher.hpp"
#include "io/fai_index.hpp"
#include "io/indexed_fasta_reader.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace fastaseek;

static std::string g_test_dir;
static std::string g_fasta_path;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

static Region make_region(const std::string& spec) {
    Region r;
    std::string err;
    if (!parse_region(spec, nullptr, r, err))
        std::fprintf(stderr, "bad region in test: %s\n", err.c_str());
    return r;
}

static void test_reverse_complement() {
    std::fprintf(stderr, "-- test_reverse_complement\n");

    std::string s = "ACGTN";
    reverse_complement(s);
    CHECK_STR(s, "NACGT");

    s = "aaCCgtRYkmBVDH";
    reverse_complement(s);
    CHECK_STR(s, "DHBVkmRYacGGtt");

    s.clear();
    reverse_complement(s);
    CHECK(s.empty());
}

static void test_resolve_region() {
    std::fprintf(stderr, "-- test_resolve_region\n");

    FaiIndex index;
    CHECK_OK(index.load_for_fasta(g_fasta_path));

    Region whole = make_region("id2");
    CHECK_OK(resolve_region(index, whole));
    CHECK_EQ(whole.start, 0u);
    CHECK_EQ(whole.stop, 40u);
    CHECK_STR(region_display_name(whole), "id2");

    Region open_end = make_region("id:41");
    CHECK_OK(resolve_region(index, open_end));
    CHECK_EQ(open_end.start, 40u);
    CHECK_EQ(open_end.stop, 52u);
    CHECK_STR(region_display_name(open_end), "id:41-52");

    Region unknown = make_region("chrX:1-5");
    CHECK_ERRC(resolve_region(index, unknown), FastaErrc::kUnknownSequence);
}

static std::vector<Region> sample_regions() {
    return {
        make_region("id:1-12"),
        make_region("id2"),
        make_region("id:11-14"),
        make_region("missing:1-4"),
        make_region("id:50-60"),      // past the end
        make_region("id2:37"),
    };
}

static const char* kExpectedSample =
    ">id:1-12\nACCGTAGGCT\nGA\n"
    ">id2\nATTGTTGTTT\nTAATTGTTGT\nTTTAATTGTT\nGTTTTAGGGG\n"
    ">id:11-14\nGACC\n"
    ">id2:37-40\nGGGG\n";

static void test_fetch_batch() {
    std::fprintf(stderr, "-- test_fetch_batch\n");

    FaiIndex index;
    CHECK_OK(index.load_for_fasta(g_fasta_path));
    Logger logger(Logger::kError);

    for (int threads : {1, 4}) {
        RegionFetchConfig config;
        config.threads = threads;
        config.line_width = 10;

        std::ostringstream out;
        FetchStats stats = fetch_regions(g_fasta_path, index, sample_regions(),
                                         config, out, logger);
        CHECK_EQ(stats.retrieved, 4u);
        CHECK_EQ(stats.failed, 2u);
        CHECK_STR(out.str(), kExpectedSample);
    }
}

static void test_stream_matches_batch() {
    std::fprintf(stderr, "-- test_stream_matches_batch\n");

    IndexedFastaReader reader;
    CHECK_OK(reader.open(g_fasta_path));
    Logger logger(Logger::kError);

    RegionFetchConfig config;
    config.line_width = 10;

    std::ostringstream out;
    FetchStats stats = stream_regions(reader, sample_regions(), config, out, logger);
    CHECK_EQ(stats.retrieved, 4u);
    CHECK_EQ(stats.failed, 2u);
    CHECK_STR(out.str(), kExpectedSample);
    CHECK(!reader.busy());
}

static void test_reverse_output() {
    std::fprintf(stderr, "-- test_reverse_output\n");

    FaiIndex index;
    CHECK_OK(index.load_for_fasta(g_fasta_path));
    Logger logger(Logger::kError);

    std::vector<Region> regions = {make_region("id:1-6"), make_region("id2:35-40")};
    RegionFetchConfig config;
    config.line_width = 0;
    config.reverse_all = true;

    std::ostringstream batch;
    FetchStats stats = fetch_regions(g_fasta_path, index, regions, config, batch, logger);
    CHECK_EQ(stats.retrieved, 2u);
    CHECK_EQ(stats.failed, 0u);

    IndexedFastaReader reader;
    CHECK_OK(reader.open(g_fasta_path));
    std::ostringstream streamed;
    stats = stream_regions(reader, regions, config, streamed, logger);
    CHECK_EQ(stats.retrieved, 2u);

    // id:1-6 is ACCGTA -> TACGGT
    CHECK_STR(batch.str(), ">id:1-6/rc\nTACGGT\n>id2:35-40/rc\nCCCCTA\n");
    CHECK_STR(streamed.str(), batch.str());
}

static void test_stream_truncated_data() {
    std::fprintf(stderr, "-- test_stream_truncated_data\n");

    std::string fasta = g_test_dir + "/short.fa";
    std::string data = fasta_fixture::kFastaLf;
    data.resize(30);
    write_file(fasta, data);
    write_file(fasta + ".fai", fasta_fixture::kFaiLf);

    IndexedFastaReader reader;
    CHECK_OK(reader.open(fasta));
    Logger logger(Logger::kError);

    RegionFetchConfig config;
    config.line_width = 0;
    std::ostringstream out;
    std::vector<Region> regions = {make_region("id:1-4"), make_region("id"),
                                   make_region("id:5-8")};
    FetchStats stats = stream_regions(reader, regions, config, out, logger);
    CHECK_EQ(stats.retrieved, 2u);
    CHECK_EQ(stats.failed, 1u);

    // The failed record is cut short but still newline-terminated
    CHECK_STR(out.str(), ">id:1-4\nACCG\n>id\nACCGTAGGCTGA\n>id:5-8\nTAGG\n");
    CHECK(!reader.busy());
}

int main() {
    g_test_dir = "/tmp/fastaseek_region_fetcher_test";
    std::filesystem::create_directories(g_test_dir);
    g_fasta_path = g_test_dir + "/ref.fa";
    write_file(g_fasta_path, fasta_fixture::kFastaLf);
    write_file(g_fasta_path + ".fai", fasta_fixture::kFaiLf);

    test_reverse_complement();
    test_resolve_region();
    test_fetch_batch();
    test_stream_matches_batch();
    test_reverse_output();
    test_stream_truncated_data();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
