#include "test_util.hpp"
#include "io/fai_index.hpp"
#include "io/region_parser.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace fastaseek;

static FaiIndex make_index() {
    std::istringstream in("chr1\t1000\t6\t60\t61\n"
                          "HLA-A*01:01\t300\t1030\t60\t61\n"
                          "chr2\t500\t1350\t60\t61\n");
    FaiIndex index;
    Status st = index.load(in);
    if (!st.ok()) std::fprintf(stderr, "index setup failed: %s\n", st.to_string().c_str());
    return index;
}

static void test_name_only() {
    std::fprintf(stderr, "-- test_name_only\n");

    Region r;
    std::string err;
    CHECK(parse_region("chr1", nullptr, r, err));
    CHECK_STR(r.name, "chr1");
    CHECK(r.whole);
    CHECK(r.to_end);
    CHECK(!r.reverse);

    CHECK(parse_region("  chr2 \n", nullptr, r, err));
    CHECK_STR(r.name, "chr2");
}

static void test_coordinates() {
    std::fprintf(stderr, "-- test_coordinates\n");

    Region r;
    std::string err;
    CHECK(parse_region("chr1:11-20", nullptr, r, err));
    CHECK_STR(r.name, "chr1");
    CHECK_EQ(r.start, 10u);    // 1-based inclusive -> 0-based half-open
    CHECK_EQ(r.stop, 20u);
    CHECK(!r.whole);
    CHECK(!r.to_end);

    CHECK(parse_region("chr1:1,001-2,000", nullptr, r, err));
    CHECK_EQ(r.start, 1000u);
    CHECK_EQ(r.stop, 2000u);

    CHECK(parse_region("chr1:100", nullptr, r, err));
    CHECK_EQ(r.start, 99u);
    CHECK(r.to_end);
    CHECK(!r.whole);

    CHECK(parse_region("chr1:100-", nullptr, r, err));
    CHECK_EQ(r.start, 99u);
    CHECK(r.to_end);

    // Single base
    CHECK(parse_region("chr2:5-5", nullptr, r, err));
    CHECK_EQ(r.start, 4u);
    CHECK_EQ(r.stop, 5u);
}

static void test_name_with_colon() {
    std::fprintf(stderr, "-- test_name_with_colon\n");

    FaiIndex index = make_index();
    Region r;
    std::string err;

    // Exact name wins
    CHECK(parse_region("HLA-A*01:01", &index, r, err));
    CHECK_STR(r.name, "HLA-A*01:01");
    CHECK(r.whole);

    // Coordinates after the last colon
    CHECK(parse_region("HLA-A*01:01:5-10", &index, r, err));
    CHECK_STR(r.name, "HLA-A*01:01");
    CHECK_EQ(r.start, 4u);
    CHECK_EQ(r.stop, 10u);

    // Without an index the last colon splits
    CHECK(parse_region("HLA-A*01:01", nullptr, r, err));
    CHECK_STR(r.name, "HLA-A*01");
    CHECK_EQ(r.start, 0u);
    CHECK(r.to_end);
}

static void test_bad_regions() {
    std::fprintf(stderr, "-- test_bad_regions\n");

    const char* bad[] = {
        "",
        "   ",
        ":1-10",
        "chr1:0-10",
        "chr1:x-10",
        "chr1:10-y",
        "chr1:-10",
        "chr1:1-2-3",
    };
    for (const char* s : bad) {
        Region r;
        std::string err;
        CHECK(!parse_region(s, nullptr, r, err));
        CHECK(!err.empty());
    }
}

static void test_region_list() {
    std::fprintf(stderr, "-- test_region_list\n");

    FaiIndex index = make_index();
    std::istringstream in("# comment\n"
                          "chr1:1-10\n"
                          "\n"
                          "HLA-A*01:01\n"
                          "  chr2  \n");
    std::vector<Region> regions;
    std::string err;
    CHECK(parse_region_list(in, &index, regions, err));
    CHECK_EQ(regions.size(), 3u);
    if (regions.size() == 3) {
        CHECK_STR(regions[0].name, "chr1");
        CHECK_EQ(regions[0].stop, 10u);
        CHECK_STR(regions[1].name, "HLA-A*01:01");
        CHECK_STR(regions[2].name, "chr2");
    }

    std::istringstream bad("chr1:1-10\nchr1:zero\n");
    regions.clear();
    CHECK(!parse_region_list(bad, &index, regions, err));
    CHECK(err.find("chr1:zero") != std::string::npos);
}

static void test_bed() {
    std::fprintf(stderr, "-- test_bed\n");

    std::istringstream in("track name=test\n"
                          "browser position chr1:1-100\n"
                          "# comment\n"
                          "chr1\t0\t10\n"
                          "chr1\t20\t30\tfeat1\t0\t-\r\n"
                          "chr2 5 8 . 0 +\n");
    std::vector<Region> regions;
    std::string err;
    CHECK(parse_bed(in, regions, err));
    CHECK_EQ(regions.size(), 3u);
    if (regions.size() == 3) {
        CHECK_STR(regions[0].name, "chr1");
        CHECK_EQ(regions[0].start, 0u);
        CHECK_EQ(regions[0].stop, 10u);
        CHECK(!regions[0].whole);
        CHECK(!regions[0].to_end);
        CHECK(!regions[0].reverse);

        CHECK_STR(regions[1].label, "feat1");
        CHECK(regions[1].reverse);

        CHECK_STR(regions[2].name, "chr2");
        CHECK(regions[2].label.empty());
        CHECK(!regions[2].reverse);
    }
}

static void test_bed_errors() {
    std::fprintf(stderr, "-- test_bed_errors\n");

    std::vector<Region> regions;
    std::string err;

    std::istringstream short_row("chr1\t0\t10\nchr1\t5\n");
    CHECK(!parse_bed(short_row, regions, err));
    CHECK(err.find("line 2") != std::string::npos);

    std::istringstream bad_coord("chr1\tzero\t10\n");
    CHECK(!parse_bed(bad_coord, regions, err));
    CHECK(err.find("coordinates") != std::string::npos);
}

static void test_display_name() {
    std::fprintf(stderr, "-- test_display_name\n");

    Region r;
    r.name = "chr1";
    CHECK_STR(region_display_name(r), "chr1");

    r.whole = false;
    r.to_end = false;
    r.start = 10;
    r.stop = 20;
    CHECK_STR(region_display_name(r), "chr1:11-20");

    r.reverse = true;
    CHECK_STR(region_display_name(r), "chr1:11-20/rc");

    r.label = "feat";
    CHECK_STR(region_display_name(r), "feat/rc");
}

int main() {
    test_name_only();
    test_coordinates();
    test_name_with_colon();
    test_bad_regions();
    test_region_list();
    test_bed();
    test_bed_errors();
    test_display_name();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
