// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <chunkplanner.hpp>
#include <jpegmarkers.hpp>
#include <utils.hpp>

#include <fmt/core.h>

namespace chunkpdf {

namespace {

double as_mib(uint64_t bytes) { return double(bytes) / 1024 / 1024; }

const char *saved_label(ChunkKind kind) {
    switch(kind) {
    case ChunkKind::Regular:
        return "Saved";
    case ChunkKind::Compressed:
        return "Saved (Compressed)";
    case ChunkKind::Final:
        return "Saved (Final)";
    }
    return "Saved";
}

} // namespace

std::string
chunk_file_name(std::string_view base_name, std::string_view extension, int32_t number) {
    return fmt::format("{}_part{:02}{}", base_name, number, extension);
}

ChunkPlanner::ChunkPlanner(ChunkBackend &backend_, PlannerOptions opts_)
    : backend{backend_}, opts{std::move(opts_)} {}

rvoe<NoReturnValue> ChunkPlanner::run() {
    state_ = PlannerState::Accumulating;
    cursor = 0;
    chunk_first_page = 0;
    saved.clear();
    reports.clear();
    backend.start_new_chunk();
    auto rc = place_pages();
    if(!rc) {
        state_ = PlannerState::Failed;
        return rc;
    }
    state_ = PlannerState::Done;
    RETOK;
}

rvoe<NoReturnValue> ChunkPlanner::place_pages() {
    const size_t total = backend.source_page_count();
    while(cursor < total) {
        ERCV(backend.append_page(cursor));
        ERC(size, backend.serialized_size());
        if(size <= opts.budget) {
            state_ = PlannerState::Accumulating;
            ++cursor;
            continue;
        }
        fmt::print("  [Limit Reached] Chunk size: {:.2f}MB at Page {}\n", as_mib(size), cursor + 1);
        if(backend.chunk_page_count() > 1) {
            state_ = PlannerState::OverLimitMulti;
            ERCV(backend.remove_last_page());
            // The same page seeds the next chunk, so the cursor stays put.
            ERCV(flush_chunk(ChunkKind::Regular));
            continue;
        }
        state_ = PlannerState::OverLimitSingle;
        fmt::print("  [Compressing] Page {} is single & huge. Downsampling images...\n",
                   cursor + 1);
        reports.push_back(compress_single_page());
        ERC(compressed_size, backend.serialized_size());
        fmt::print("  -> Compressed size: {:.2f}MB\n", as_mib(compressed_size));
        if(compressed_size > opts.budget) {
            fmt::print(stderr,
                       "  [Error] Failed to compress the page under the size limit ({:.2f}MB).\n",
                       as_mib(opts.budget));
            fmt::print(stderr, "  Aborting process for this file.\n");
            RETERR(BudgetExceededAfterCompression);
        }
        ERCV(flush_chunk(ChunkKind::Compressed));
        ++cursor;
    }
    if(backend.chunk_page_count() > 0) {
        ERCV(flush_chunk(ChunkKind::Final));
    }
    RETOK;
}

rvoe<NoReturnValue> ChunkPlanner::flush_chunk(ChunkKind kind) {
    const auto num_pages = backend.chunk_page_count();
    if(num_pages == 0) {
        RETERR(Unreachable);
    }
    const auto ofname = opts.output_dir / chunk_file_name(opts.base_name, opts.extension,
                                                          next_chunk_number);
    ERC(written, backend.save_chunk(ofname));
    fmt::print("  -> {}: {}\n", saved_label(kind), ofname.string());
    saved.push_back(SavedChunk{ofname,
                               next_chunk_number,
                               chunk_first_page,
                               chunk_first_page + num_pages - 1,
                               written,
                               kind});
    ++next_chunk_number;
    chunk_first_page += num_pages;
    backend.start_new_chunk();
    RETOK;
}

FallbackReport ChunkPlanner::compress_single_page() {
    FallbackReport report;
    optimize_images(report);
    repair_fonts(report);
    return report;
}

void ChunkPlanner::optimize_images(FallbackReport &report) {
    auto images = backend.page_images(0);
    if(!images) {
        fmt::print(stderr, "  ! Could not read page images: {}\n", error_text(images.error()));
        return;
    }
    for(const auto &image : *images) {
        if(opts.verbose) {
            fmt::print("    {}: {} {}x{}, {} bytes\n",
                       image.name,
                       compression_name(image.compression),
                       image.w,
                       image.h,
                       image.data.size());
            if(image.compression == ImageCompression::Dct) {
                const auto marker = find_adobe_marker(image.data);
                fmt::print("    Adobe APP14: {}, transform: {}\n",
                           marker.has_value(),
                           marker ? fmt::format("{}", marker->transform) : std::string("none"));
            }
        }
        auto outcome = optimize_image(image, opts.image_options);
        if(!outcome) {
            fmt::print("  ! Failed to compress {}: {}\n", image.name, error_text(outcome.error()));
            ++report.images_failed;
            continue;
        }
        if(const auto *skipped = std::get_if<SkippedImage>(&*outcome)) {
            fmt::print("  ! Skipping image {}: {}\n", image.name, skipped->reason);
            ++report.images_skipped;
            continue;
        }
        const auto &optimized = std::get<OptimizedImage>(*outcome);
        if(!optimized.reencoded) {
            fmt::print("  ! Skipping image {}: already a small RGB JPEG\n", image.name);
            ++report.images_skipped;
            continue;
        }
        fmt::print("  - Compressing image: {} ({}x{})\n", image.name, image.w, image.h);
        auto rc = backend.replace_image(0, image.name, optimized);
        if(!rc) {
            fmt::print("  ! Failed to compress {}: {}\n", image.name, error_text(rc.error()));
            ++report.images_failed;
            continue;
        }
        if(opts.verbose) {
            fmt::print("    {} bytes -> {} bytes, {}x{} {}\n",
                       image.data.size(),
                       optimized.data.size(),
                       optimized.w,
                       optimized.h,
                       mode_name(optimized.mode));
        }
        ++report.images_replaced;
    }
}

void ChunkPlanner::repair_fonts(FallbackReport &report) {
    auto fonts = backend.page_fonts(0);
    if(!fonts) {
        fmt::print(stderr, "  ! Could not read page fonts: {}\n", error_text(fonts.error()));
        return;
    }
    const auto broken = find_broken_fonts(*fonts);
    if(broken.empty()) {
        return;
    }
    if(opts.verbose) {
        for(const auto &name : broken) {
            fmt::print("    Broken font: {}\n", name);
        }
    }
    auto removed = backend.remove_fonts(0, broken);
    if(!removed) {
        fmt::print(stderr, "  ! Could not remove broken fonts: {}\n", error_text(removed.error()));
        return;
    }
    report.fonts_removed = *removed;
    fmt::print("  - Removed {} broken font(s)\n", *removed);
}

} // namespace chunkpdf
