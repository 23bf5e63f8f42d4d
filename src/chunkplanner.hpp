// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <fontsanitizer.hpp>
#include <imageoptimizer.hpp>
#include <imageresource.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chunkpdf {

const uint64_t DEFAULT_BUDGET = 4 * 1024 * 1024;

// The document side of chunking. Pages of the chunk being built are
// addressed by their index within the chunk.
class ChunkBackend {
public:
    virtual ~ChunkBackend() = default;

    virtual size_t source_page_count() const = 0;

    virtual rvoe<NoReturnValue> append_page(size_t source_index) = 0;
    virtual rvoe<NoReturnValue> remove_last_page() = 0;
    virtual size_t chunk_page_count() const = 0;
    // Must not change the chunk.
    virtual rvoe<uint64_t> serialized_size() = 0;
    // Returns the number of bytes written.
    virtual rvoe<uint64_t> save_chunk(const std::filesystem::path &ofname) = 0;
    virtual void start_new_chunk() = 0;

    virtual rvoe<std::vector<ImageResource>> page_images(size_t chunk_page) = 0;
    virtual rvoe<NoReturnValue>
    replace_image(size_t chunk_page, const std::string &name, const OptimizedImage &image) = 0;
    virtual rvoe<FontTable> page_fonts(size_t chunk_page) = 0;
    virtual rvoe<size_t> remove_fonts(size_t chunk_page,
                                      const std::vector<std::string> &names) = 0;
};

struct PlannerOptions {
    uint64_t budget = DEFAULT_BUDGET;
    std::filesystem::path output_dir = ".";
    std::string base_name = "output";
    std::string extension = ".pdf";
    // The fallback always re-encodes.
    ImageOptimizerOptions image_options{75, 1500, true};
    bool verbose = false;
};

enum class PlannerState { Accumulating, OverLimitMulti, OverLimitSingle, Done, Failed };

enum class ChunkKind { Regular, Compressed, Final };

struct SavedChunk {
    std::filesystem::path path;
    int32_t number;
    // Zero based source page indices, inclusive.
    size_t first_page;
    size_t last_page;
    uint64_t size;
    ChunkKind kind;
};

struct FallbackReport {
    size_t images_replaced = 0;
    size_t images_skipped = 0;
    size_t images_failed = 0;
    size_t fonts_removed = 0;
};

std::string chunk_file_name(std::string_view base_name, std::string_view extension, int32_t number);

class ChunkPlanner {
public:
    ChunkPlanner(ChunkBackend &backend, PlannerOptions opts);

    rvoe<NoReturnValue> run();

    PlannerState state() const { return state_; }
    // Kept after a failed run, those files stay on disk.
    const std::vector<SavedChunk> &saved_chunks() const { return saved; }
    const std::vector<FallbackReport> &fallback_reports() const { return reports; }

private:
    rvoe<NoReturnValue> place_pages();
    rvoe<NoReturnValue> flush_chunk(ChunkKind kind);
    FallbackReport compress_single_page();
    void optimize_images(FallbackReport &report);
    void repair_fonts(FallbackReport &report);

    ChunkBackend &backend;
    PlannerOptions opts;
    PlannerState state_ = PlannerState::Accumulating;
    size_t cursor = 0;
    size_t chunk_first_page = 0;
    int32_t next_chunk_number = 1;
    std::vector<SavedChunk> saved;
    std::vector<FallbackReport> reports;
};

} // namespace chunkpdf
