// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <chunker.hpp>

#include <fmt/core.h>

#include <getopt.h>

#include <cerrno>
#include <cstdlib>

using namespace chunkpdf;

namespace {

void print_usage(const char *prog) {
    fmt::print(stderr,
               "Usage: {} [options] <input.pdf> [output_dir]\n"
               "\n"
               "Split a PDF into chunks that each fit under a size limit.\n"
               "\n"
               "  -s, --max-size <MiB>       size limit per chunk (default 4.0)\n"
               "  -q, --quality <1-100>      JPEG quality for oversized pages (default 75)\n"
               "  -d, --max-dimension <px>   longest image edge for oversized pages "
               "(default 1500)\n"
               "  -v, --verbose              print per image and per font details\n"
               "  -h, --help                 show this message\n",
               prog);
}

bool parse_double(const char *text, double &out) {
    char *end = nullptr;
    errno = 0;
    out = strtod(text, &end);
    return errno == 0 && end != text && *end == '\0';
}

bool parse_int(const char *text, long &out) {
    char *end = nullptr;
    errno = 0;
    out = strtol(text, &end, 10);
    return errno == 0 && end != text && *end == '\0';
}

} // namespace

int main(int argc, char **argv) {
    const option long_options[] = {{"max-size", required_argument, nullptr, 's'},
                                   {"quality", required_argument, nullptr, 'q'},
                                   {"max-dimension", required_argument, nullptr, 'd'},
                                   {"verbose", no_argument, nullptr, 'v'},
                                   {"help", no_argument, nullptr, 'h'},
                                   {nullptr, 0, nullptr, 0}};
    SplitOptions opts;
    int c;
    while((c = getopt_long(argc, argv, "s:q:d:vh", long_options, nullptr)) != -1) {
        switch(c) {
        case 's': {
            double mib;
            if(!parse_double(optarg, mib)) {
                fmt::print(stderr, "Invalid size limit: {}\n", optarg);
                print_usage(argv[0]);
                return 2;
            }
            auto budget = budget_from_mib(mib);
            if(!budget) {
                fmt::print(stderr,
                           "Invalid size limit: {} (must be above 0 and at most {} MiB)\n",
                           optarg,
                           MAX_BUDGET_MIB);
                print_usage(argv[0]);
                return 2;
            }
            opts.budget = *budget;
            break;
        }
        case 'q': {
            long q;
            if(!parse_int(optarg, q) || q < 1 || q > 100) {
                fmt::print(stderr, "Invalid quality: {}\n", optarg);
                print_usage(argv[0]);
                return 2;
            }
            opts.image_options.quality = int32_t(q);
            break;
        }
        case 'd': {
            long d;
            if(!parse_int(optarg, d) || d < 1 || d > 65535) {
                fmt::print(stderr, "Invalid maximum dimension: {}\n", optarg);
                print_usage(argv[0]);
                return 2;
            }
            opts.image_options.max_dimension = int32_t(d);
            break;
        }
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 2;
        }
    }
    const int num_positional = argc - optind;
    if(num_positional < 1 || num_positional > 2) {
        print_usage(argv[0]);
        return 2;
    }
    const std::filesystem::path input{argv[optind]};
    std::optional<std::filesystem::path> outdir;
    if(num_positional == 2) {
        outdir = argv[optind + 1];
    }

    auto rc = split_pdf(input, outdir, opts);
    if(!rc) {
        if(rc.error() != ErrorCode::InputNotFound &&
           rc.error() != ErrorCode::BudgetExceededAfterCompression) {
            fmt::print(stderr, "Error: {}\n", error_text(rc.error()));
        }
        return 1;
    }
    return 0;
}
