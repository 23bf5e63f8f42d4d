// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <chunkplanner.hpp>
#include <errorhandling.hpp>
#include <imageoptimizer.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace chunkpdf {

// 1 TiB.
const double MAX_BUDGET_MIB = 1024.0 * 1024.0;

// Converts a size limit in MiB to bytes. Must be positive, finite and at
// most MAX_BUDGET_MIB.
rvoe<uint64_t> budget_from_mib(double mib);

struct SplitOptions {
    uint64_t budget = DEFAULT_BUDGET;
    ImageOptimizerOptions image_options{75, 1500, true};
    bool verbose = false;
};

struct SplitResult {
    size_t num_pages;
    std::vector<SavedChunk> chunks;
};

// The explicit directory if given, otherwise the directory of the input
// file, or the current directory when the input has no directory part.
std::filesystem::path resolve_output_dir(const std::filesystem::path &input,
                                         const std::optional<std::filesystem::path> &outdir);

rvoe<SplitResult> split_pdf(const std::filesystem::path &input,
                            const std::optional<std::filesystem::path> &outdir,
                            const SplitOptions &opts);

} // namespace chunkpdf
