#include "core/version.hpp"
#include "io/fai_index.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

using namespace fastaseek;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -fasta <path> [options]\n"
        "\n"
        "Lists the sequences of an indexed FASTA file (name<TAB>length).\n"
        "\n"
        "Options:\n"
        "  -fai <path>              Index file (default: <fasta>.fai)\n"
        "  -v, --verbose            Also print layout and totals\n"
        "  --version                Print version\n"
        "  -h, --help               Show this help\n",
        prog);
}

static std::string format_size(uint64_t bytes) {
    if (bytes >= uint64_t(1) << 30) {
        return std::to_string(bytes / (uint64_t(1) << 30)) + "."
             + std::to_string((bytes % (uint64_t(1) << 30)) * 10 / (uint64_t(1) << 30))
             + " GiB";
    } else if (bytes >= uint64_t(1) << 20) {
        return std::to_string(bytes / (uint64_t(1) << 20)) + "."
             + std::to_string((bytes % (uint64_t(1) << 20)) * 10 / (uint64_t(1) << 20))
             + " MiB";
    } else if (bytes >= uint64_t(1) << 10) {
        return std::to_string(bytes / (uint64_t(1) << 10)) + "."
             + std::to_string((bytes % (uint64_t(1) << 10)) * 10 / (uint64_t(1) << 10))
             + " KiB";
    }
    return std::to_string(bytes) + " B";
}

static const char* terminator_name(const FaiRecord& rec) {
    switch (rec.line_bytes - rec.line_bases) {
        case 0: return "none";
        case 1: return "LF";
        case 2: return "CRLF";
        default: return "other";
    }
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, common_flags());

    if (check_version(cli, "fastaseekinfo")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    std::string fasta_path = cli.get_string("-fasta");
    if (fasta_path.empty() && !cli.positional().empty())
        fasta_path = cli.positional()[0];
    if (fasta_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Logger logger = make_logger(cli);
    bool verbose = logger.verbose();

    std::string fai_path = cli.get_string("-fai", FaiIndex::path_for_fasta(fasta_path));
    FaiIndex index;
    Status st = index.load_file(fai_path);
    if (!st.ok()) {
        std::fprintf(stderr, "Error: %s\n", st.to_string().c_str());
        return 1;
    }
    logger.debug("Loaded %s", fai_path.c_str());

    if (!verbose) {
        for (const auto& si : index.sequences()) {
            std::printf("%s\t%lu\n", si.name.c_str(), static_cast<unsigned long>(si.len));
        }
        return 0;
    }

    std::printf("#name\tlength\toffset\tline_bases\tline_bytes\tterminator\n");
    for (const auto& name : index.names()) {
        const FaiRecord* rec = index.lookup(name);
        std::printf("%s\t%lu\t%lu\t%lu\t%lu\t%s\n",
                    name.c_str(),
                    static_cast<unsigned long>(rec->len),
                    static_cast<unsigned long>(rec->offset),
                    static_cast<unsigned long>(rec->line_bases),
                    static_cast<unsigned long>(rec->line_bytes),
                    terminator_name(*rec));
    }

    std::printf("\n--- Summary ---\n\n");
    std::printf("FASTA file:        %s\n", fasta_path.c_str());
    std::printf("Index file:        %s\n", fai_path.c_str());
    std::printf("Sequences:         %zu\n", index.size());
    std::printf("Total bases:       %lu\n",
                static_cast<unsigned long>(index.total_length()));

    std::error_code ec;
    auto sz = std::filesystem::file_size(fasta_path, ec);
    if (ec) {
        logger.warn("cannot stat FASTA file '%s': %s", fasta_path.c_str(),
                    ec.message().c_str());
    } else {
        std::printf("FASTA size:        %s (%lu bytes)\n",
                    format_size(static_cast<uint64_t>(sz)).c_str(),
                    static_cast<unsigned long>(sz));
    }
    return 0;
}
