#include "core/config.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "stats/fastx_stats.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

using namespace fastxio;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] <file> [<file> ...]\n"
        "\n"
        "Summarize FASTA/FASTQ files (plain, gzip or bzip2). Use '-' for stdin.\n"
        "\n"
        "Options:\n"
        "  -format <auto|fasta|fastq>  Input format (default: auto, from file name)\n"
        "  -size_hint <size>           Expected sequence length, K/M/G suffixes\n"
        "                              (default: %zu)\n"
        "  -outfmt <tab|json>          Output format (default: tab)\n"
        "  -o <path>                   Output file (default: stdout)\n"
        "  -threads <int>              Number of threads (default: all cores)\n"
        "  -v, --verbose               Verbose output\n"
        "  --version                   Print version\n"
        "  -h, --help                  Show this help\n",
        prog, DEFAULT_SIZE_HINT);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, common_flags());

    if (check_version(cli, "fastxstats")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    const std::vector<std::string>& inputs = cli.positional();
    if (inputs.empty()) {
        std::fprintf(stderr, "Error: no input files\n");
        print_usage(argv[0]);
        return 1;
    }
    if (std::count(inputs.begin(), inputs.end(), "-") > 1) {
        std::fprintf(stderr, "Error: stdin ('-') can be given only once\n");
        return 1;
    }

    std::string err;
    FastxFormat format = FastxFormat::kAuto;
    if (cli.has("-format") && !parse_format(cli.get_string("-format"), format, err)) {
        std::fprintf(stderr, "Error: -format: %s\n", err.c_str());
        return 1;
    }

    ReaderConfig config;
    if (cli.has("-size_hint")) {
        uint64_t hint = 0;
        if (!parse_size_string(cli.get_string("-size_hint"), hint, err)) {
            std::fprintf(stderr, "Error: -size_hint: %s\n", err.c_str());
            return 1;
        }
        config.size_hint = static_cast<size_t>(hint);
    }

    std::string outfmt = cli.get_string("-outfmt", "tab");
    if (outfmt != "tab" && outfmt != "json") {
        std::fprintf(stderr, "Error: -outfmt must be tab or json\n");
        return 1;
    }

    Logger logger = make_logger(cli, "fastxstats");
    int threads = resolve_threads(cli);

    logger.debug("Inputs: %zu, format=%s, size_hint=%zu, threads=%d",
                 inputs.size(), format_name(format), config.size_hint, threads);

    // One reader per input; each task owns its reader exclusively.
    std::vector<SequenceStats> results(inputs.size());
    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, inputs.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); i++) {
                    if (compute_stats(inputs[i], format, config, results[i])) {
                        logger.debug("%s: %llu record(s), %llu bp",
                                     inputs[i].c_str(),
                                     static_cast<unsigned long long>(results[i].num_records),
                                     static_cast<unsigned long long>(results[i].total_length));
                    }
                }
            });
    });

    int failures = 0;
    for (const auto& s : results) {
        if (!s.ok) {
            logger.error("%s: %s: %s", s.path.c_str(),
                         error_kind_name(s.error.kind), s.error.message.c_str());
            failures++;
        }
    }

    std::string output_path = cli.get_string("-o");
    std::ofstream out_file;
    if (!output_path.empty()) {
        out_file.open(output_path);
        if (!out_file.is_open()) {
            logger.error("cannot open output file %s", output_path.c_str());
            return 1;
        }
    }
    std::ostream& out = output_path.empty() ? std::cout : out_file;

    if (outfmt == "json") {
        write_stats_json(out, results);
    } else {
        write_stats_tab(out, results);
    }
    out.flush();

    if (failures > 0) {
        logger.info("%d of %zu input(s) failed", failures, inputs.size());
        return 1;
    }
    return 0;
}
