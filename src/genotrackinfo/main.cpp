#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/version.hpp"
#include "io/bigwig_sniffer.hpp"
#include "io/fasta_reader.hpp"
#include "io/line_filter.hpp"
#include "io/stream_handle.hpp"
#include "track/accumulate.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

using namespace genotrack;

static const char* const kCmdName = "genotrackinfo";

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] <file>...\n"
        "\n"
        "Report the format of each input file. Record files ('>' framed,\n"
        "optionally .gz compressed; '-' for stdin) are parsed and summarized.\n"
        "\n"
        "Options:\n"
        "  -threads <int>           Number of threads (default: all cores)\n"
        "  -strict                  Fail on record files with no records\n"
        "  -comments                Skip '#' comment lines\n"
        "  -v, --verbose            Verbose output\n"
        "  -h, --help               Show this help\n"
        "  --version                Show version\n",
        prog);
}

struct FileSummary {
    std::string format;
    size_t records = 0;
    uint64_t bases = 0;
    int64_t min_len = 0;
    int64_t max_len = 0;
    std::string error;
};

struct InspectOptions {
    bool strict = false;
    bool skip_comments = false;
};

// Pipes and FIFOs cannot be reopened after sniffing, so only regular files
// are probed. Missing paths fail later, on open.
static bool may_be_bigwig(const std::string& path) {
    if (path == "-" || has_gz_suffix(path)) return false;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return false;
    auto sz = std::filesystem::file_size(path, ec);
    return !ec && sz >= BIGWIG_SIGNATURE_SIZE;
}

static void summarize_records(StreamHandle& in, const InspectOptions& opts,
                              FileSummary& summary, const Logger& logger) {
    std::unique_ptr<CommentFilter> filter;
    StreamHandle* src = &in;
    if (opts.skip_comments) {
        filter = std::make_unique<CommentFilter>(in);
        src = filter.get();
    }

    FastaReader reader(*src);
    TrackAccumulator<int64_t> lengths;
    FastaRecord rec;
    while (reader.read_next(rec)) {
        auto len = static_cast<int64_t>(rec.body.size());
        lengths.add(NdArray<int64_t>({1, 1}, {len}));
        summary.bases += rec.body.size();
        logger.debug("%s: record '%s' (%zu bp)", in.path().c_str(),
                     rec.label.c_str(), rec.body.size());
    }
    summary.records = reader.records_read();

    if (filter) {
        logger.debug("%s: skipped %zu comment lines", in.path().c_str(),
                     filter->skipped());
    }

    if (summary.records == 0) {
        if (opts.strict) {
            throw MalformedInputError("no '>' records found in '" + in.path() + "'");
        }
        logger.warn("%s: no records", in.path().c_str());
        return;
    }
    summary.min_len = (*lengths.mins)[0];
    summary.max_len = (*lengths.maxs)[0];
}

static FileSummary inspect_file(const std::string& path, const InspectOptions& opts,
                                const Logger& logger) {
    FileSummary summary;

    if (may_be_bigwig(path) && is_bigwig(path)) {
        summary.format = "bigwig";
        return summary;
    }

    if (path == "-") {
        summary.format = "fasta";
        auto in = make_istream_handle(std::cin, "<stdin>");
        summarize_records(*in, opts, summary, logger);
        return summary;
    }

    summary.format = has_gz_suffix(path) ? "fasta.gz" : "fasta";
    auto in = open_maybe_gzip(path, OpenMode::kRead);
    summarize_records(*in, opts, summary, logger);
    in->close();
    return summary;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, {"-strict", "-comments", "-v", "--verbose",
                               "-h", "--help", "--version"});

    if (check_version(cli, kCmdName)) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(cli.program().c_str());
        return 0;
    }
    if (cli.positional().empty()) {
        print_usage(cli.program().c_str());
        return 1;
    }

    Logger logger = make_logger(cli, kCmdName);
    int threads = resolve_threads(cli);

    InspectOptions opts;
    opts.strict = cli.has("-strict");
    opts.skip_comments = cli.has("-comments");

    const auto& files = cli.positional();
    if (std::count(files.begin(), files.end(), "-") > 1) {
        return report_fatal(kCmdName, "stdin ('-') given more than once");
    }
    std::vector<FileSummary> summaries(files.size());

    logger.debug("inspecting %zu files with %d threads", files.size(), threads);

    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), files.size(), [&](size_t i) {
            try {
                summaries[i] = inspect_file(files[i], opts, logger);
            } catch (const Error& e) {
                summaries[i].error = e.what();
            } catch (const std::exception& e) {
                summaries[i].error = files[i] + ": " + e.what();
            }
        });
    });

    for (size_t i = 0; i < files.size(); i++) {
        const auto& s = summaries[i];
        if (!s.error.empty()) {
            return report_fatal(kCmdName, s.error.c_str());
        }
        std::printf("%s\t%s\t%zu\t%llu\t%lld\t%lld\n",
                    files[i].c_str(), s.format.c_str(), s.records,
                    static_cast<unsigned long long>(s.bases),
                    static_cast<long long>(s.min_len),
                    static_cast<long long>(s.max_len));
    }
    return 0;
}
