#include "core/config.hpp"
#include "core/version.hpp"
#include "fetch/region_fetcher.hpp"
#include "io/fai_index.hpp"
#include "io/indexed_fasta_reader.hpp"
#include "io/region_parser.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace fastaseek;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -fasta <path> [options] [region ...]\n"
        "\n"
        "Required:\n"
        "  -fasta <path>           FASTA file (indexed with samtools faidx)\n"
        "\n"
        "Regions (at least one):\n"
        "  region ...              name, name:start or name:start-end (1-based, inclusive)\n"
        "  -region <str>           Same as a positional region; may be repeated\n"
        "  -regions <path>         File with one region per line\n"
        "  -bed <path>             BED file (0-based half-open; strand '-' reverses)\n"
        "\n"
        "Options:\n"
        "  -fai <path>             Index file (default: <fasta>.fai)\n"
        "  -o <path>               Output FASTA file (default: stdout)\n"
        "  -line_width <int>       Output line width, 0 = unwrapped (default: %d)\n"
        "  -threads <int>          Worker threads (default: all cores)\n"
        "  -stream                 Stream regions one at a time without buffering them\n"
        "  -rc                     Reverse complement every region\n"
        "  -v, --verbose           Verbose logging\n"
        "  -q, --quiet             Errors only\n"
        "  --version               Print version\n"
        "  -h, --help              Show this help\n",
        prog, DEFAULT_LINE_WIDTH);
}

int main(int argc, char* argv[]) {
    auto flags = common_flags();
    flags.insert("-stream");
    flags.insert("-rc");
    CliParser cli(argc, argv, flags);

    if (check_version(cli, "fastaseekfetch")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-fasta")) {
        std::fprintf(stderr, "Error: -fasta is required\n");
        print_usage(argv[0]);
        return 1;
    }

    Logger logger = make_logger(cli);

    std::string fasta_path = cli.get_string("-fasta");
    std::string fai_path = cli.get_string("-fai", FaiIndex::path_for_fasta(fasta_path));

    FaiIndex index;
    Status st = index.load_file(fai_path);
    if (!st.ok()) {
        std::fprintf(stderr, "Error: %s\n", st.to_string().c_str());
        return 1;
    }
    logger.debug("Loaded %zu sequence(s) from %s", index.size(), fai_path.c_str());

    // Collect regions: positional and -region first, then -regions, then -bed
    std::vector<Region> regions;
    std::string err;
    std::vector<std::string> region_strs = cli.positional();
    for (const auto& s : cli.get_strings("-region"))
        region_strs.push_back(s);
    for (const auto& s : region_strs) {
        Region r;
        if (!parse_region(s, &index, r, err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
        regions.push_back(std::move(r));
    }

    if (cli.has("-regions")) {
        std::string path = cli.get_string("-regions");
        std::ifstream in(path);
        if (!in.is_open()) {
            std::fprintf(stderr, "Error: cannot open region file %s\n", path.c_str());
            return 1;
        }
        if (!parse_region_list(in, &index, regions, err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
    }

    if (cli.has("-bed")) {
        std::string path = cli.get_string("-bed");
        std::ifstream in(path);
        if (!in.is_open()) {
            std::fprintf(stderr, "Error: cannot open BED file %s\n", path.c_str());
            return 1;
        }
        if (!parse_bed(in, regions, err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
    }

    if (regions.empty()) {
        std::fprintf(stderr, "Error: no regions given\n");
        print_usage(argv[0]);
        return 1;
    }

    RegionFetchConfig config;
    config.threads = resolve_threads(cli);
    config.reverse_all = cli.has("-rc");
    int line_width = cli.get_int("-line_width", DEFAULT_LINE_WIDTH);
    if (line_width < 0) {
        std::fprintf(stderr, "Error: -line_width must be >= 0\n");
        return 1;
    }
    config.line_width = static_cast<size_t>(line_width);

    // Open output
    std::string output_path = cli.get_string("-o");
    std::ofstream out_file;
    std::ostream* out_ptr = &std::cout;
    if (!output_path.empty()) {
        out_file.open(output_path);
        if (!out_file.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
            return 1;
        }
        out_ptr = &out_file;
    }

    logger.info("Fetching %zu region(s) from %s", regions.size(), fasta_path.c_str());

    FetchStats stats;
    if (cli.has("-stream")) {
        IndexedFastaReader reader;
        auto file = std::make_unique<std::ifstream>(fasta_path, std::ios::binary);
        if (!file->is_open()) {
            std::fprintf(stderr, "Error: cannot open FASTA %s\n", fasta_path.c_str());
            return 1;
        }
        st = reader.open(std::move(file), std::move(index));
        if (!st.ok()) {
            std::fprintf(stderr, "Error: %s\n", st.to_string().c_str());
            return 1;
        }
        stats = stream_regions(reader, std::move(regions), config, *out_ptr, logger);
    } else {
        stats = fetch_regions(fasta_path, index, std::move(regions), config,
                              *out_ptr, logger);
    }

    out_ptr->flush();
    if (!*out_ptr) {
        std::fprintf(stderr, "Error: failed writing output\n");
        return 1;
    }

    logger.info("Done. %u region(s) retrieved, %u failed.", stats.retrieved, stats.failed);
    return stats.failed > 0 ? 1 : 0;
}
