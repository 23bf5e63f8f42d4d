// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <chunker.hpp>
#include <pdfbackend.hpp>
#include <pdfreader.hpp>

#include <fmt/core.h>

#include <cmath>
#include <system_error>

namespace chunkpdf {

rvoe<uint64_t> budget_from_mib(double mib) {
    if(!std::isfinite(mib) || mib <= 0 || mib > MAX_BUDGET_MIB) {
        RETERR(InvalidSizeLimit);
    }
    const auto bytes = uint64_t(mib * 1024 * 1024);
    if(bytes == 0) {
        RETERR(InvalidSizeLimit);
    }
    return bytes;
}

std::filesystem::path resolve_output_dir(const std::filesystem::path &input,
                                         const std::optional<std::filesystem::path> &outdir) {
    if(outdir && !outdir->empty()) {
        return *outdir;
    }
    auto parent = input.parent_path();
    if(parent.empty()) {
        return ".";
    }
    return parent;
}

rvoe<SplitResult> split_pdf(const std::filesystem::path &input,
                            const std::optional<std::filesystem::path> &outdir,
                            const SplitOptions &opts) {
    std::error_code ec;
    if(!std::filesystem::exists(input, ec)) {
        fmt::print(stderr, "Error: File not found: {}\n", input.string());
        RETERR(InputNotFound);
    }
    const auto output_dir = resolve_output_dir(input, outdir);
    std::filesystem::create_directories(output_dir, ec);
    if(ec) {
        fmt::print(stderr,
                   "Error: Could not create output directory {}: {}\n",
                   output_dir.string(),
                   ec.message());
        RETERR(FileWriteError);
    }

    ERC(reader, PdfReader::open(input));
    if(reader->was_repaired()) {
        fmt::print(stderr, "  ! Input file is damaged, it was repaired while reading.\n");
    }
    fmt::print("Processing: {} ({} pages)\n", input.string(), reader->num_pages());

    PlannerOptions popts;
    popts.budget = opts.budget;
    popts.output_dir = output_dir;
    popts.base_name = input.stem().string();
    popts.extension = input.extension().string();
    popts.image_options = opts.image_options;
    popts.verbose = opts.verbose;

    PdfChunkBackend backend(*reader);
    ChunkPlanner planner(backend, std::move(popts));
    ERCV(planner.run());
    return SplitResult{reader->num_pages(), planner.saved_chunks()};
}

} // namespace chunkpdf
