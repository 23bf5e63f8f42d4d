// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include "fakebackend.hpp"

#include <chunkplanner.hpp>

#include <stdio.h>
#include <string>

using namespace chunkpdf;

namespace {

std::vector<FakePage> pages_of_size(const std::vector<uint64_t> &sizes) {
    std::vector<FakePage> pages;
    for(const auto s : sizes) {
        FakePage p;
        p.size = s;
        pages.push_back(std::move(p));
    }
    return pages;
}

PlannerOptions options_with_budget(uint64_t budget) {
    PlannerOptions opts;
    opts.budget = budget;
    opts.output_dir = "outdir";
    opts.base_name = "report";
    opts.extension = ".pdf";
    return opts;
}

bool indices_are(const std::vector<size_t> &got, size_t first, size_t last) {
    if(got.size() != last - first + 1) {
        return false;
    }
    for(size_t i = 0; i < got.size(); ++i) {
        if(got[i] != first + i) {
            return false;
        }
    }
    return true;
}

int test_ten_pages() {
    FakeBackend backend(pages_of_size(std::vector<uint64_t>(10, 100)), 50);
    // Eight pages take 850 bytes, the ninth pushes it to 950.
    ChunkPlanner planner(backend, options_with_budget(900));
    auto rc = planner.run();
    if(!rc) {
        fprintf(stderr, "Planner failed: %s\n", error_text(rc.error()));
        return 1;
    }
    if(planner.state() != PlannerState::Done) {
        fprintf(stderr, "Planner not in done state.\n");
        return 1;
    }
    if(backend.saves.size() != 2) {
        fprintf(stderr, "Expected 2 chunks, got %d.\n", (int)backend.saves.size());
        return 1;
    }
    if(!indices_are(backend.saved_indices(0), 0, 7) ||
       !indices_are(backend.saved_indices(1), 8, 9)) {
        fprintf(stderr, "Wrong page split.\n");
        return 1;
    }
    const auto &chunks = planner.saved_chunks();
    if(chunks.size() != 2 || chunks[0].kind != ChunkKind::Regular ||
       chunks[1].kind != ChunkKind::Final) {
        fprintf(stderr, "Wrong chunk kinds.\n");
        return 1;
    }
    if(chunks[0].first_page != 0 || chunks[0].last_page != 7 || chunks[1].first_page != 8 ||
       chunks[1].last_page != 9) {
        fprintf(stderr, "Wrong chunk page ranges.\n");
        return 1;
    }
    if(chunks[0].size != 850 || chunks[1].size != 250) {
        fprintf(stderr, "Wrong chunk sizes.\n");
        return 1;
    }
    if(backend.saves[0].path != std::filesystem::path("outdir") / "report_part01.pdf" ||
       backend.saves[1].path != std::filesystem::path("outdir") / "report_part02.pdf") {
        fprintf(stderr, "Wrong chunk file names.\n");
        return 1;
    }
    return 0;
}

int test_order_and_budget() {
    const std::vector<uint64_t> sizes{300, 120, 700, 20, 20, 650, 1000, 1, 999, 400, 400, 200};
    const uint64_t budget = 1000;
    FakeBackend backend(pages_of_size(sizes));
    ChunkPlanner planner(backend, options_with_budget(budget));
    auto rc = planner.run();
    if(!rc) {
        fprintf(stderr, "Planner failed: %s\n", error_text(rc.error()));
        return 1;
    }
    std::vector<size_t> all;
    for(size_t i = 0; i < backend.saves.size(); ++i) {
        if(backend.saves[i].size > budget) {
            fprintf(stderr, "Chunk %d over budget.\n", (int)i + 1);
            return 1;
        }
        const auto indices = backend.saved_indices(i);
        all.insert(all.end(), indices.begin(), indices.end());
    }
    if(!indices_are(all, 0, sizes.size() - 1)) {
        fprintf(stderr, "Pages reordered, dropped or duplicated.\n");
        return 1;
    }
    // A page exactly at the budget fits.
    if(!indices_are(backend.saved_indices(3), 6, 6)) {
        fprintf(stderr, "Page filling the whole budget not placed alone.\n");
        return 1;
    }
    return 0;
}

int test_oversized_page_fails() {
    auto pages = pages_of_size({100, 100, 5000, 100});
    FontDescriptor broken;
    broken.subtype = SubtypeTag::Type0;
    broken.descendants = MissingDescendants{};
    FontDescriptor fine;
    fine.subtype = SubtypeTag::TrueType;
    fine.has_base_font = true;
    pages[2].fonts.emplace_back("F1", fine);
    pages[2].fonts.emplace_back("F2", broken);
    FakeBackend backend(std::move(pages));
    ChunkPlanner planner(backend, options_with_budget(1000));
    auto rc = planner.run();
    if(rc || rc.error() != ErrorCode::BudgetExceededAfterCompression) {
        fprintf(stderr, "Oversized page did not fail the run.\n");
        return 1;
    }
    if(planner.state() != PlannerState::Failed) {
        fprintf(stderr, "Planner not in failed state.\n");
        return 1;
    }
    // The chunk before the offending page is kept, nothing after it is written.
    if(backend.saves.size() != 1 || !indices_are(backend.saved_indices(0), 0, 1)) {
        fprintf(stderr, "Wrong chunks saved before the failure.\n");
        return 1;
    }
    const auto &reports = planner.fallback_reports();
    if(reports.size() != 1 || reports[0].fonts_removed != 1) {
        fprintf(stderr, "Broken font not removed during the fallback.\n");
        return 1;
    }
    return 0;
}

int test_first_page_oversized() {
    FakeBackend backend(pages_of_size({2000}));
    ChunkPlanner planner(backend, options_with_budget(1000));
    auto rc = planner.run();
    if(rc || !backend.saves.empty()) {
        fprintf(stderr, "Oversized single page document produced output.\n");
        return 1;
    }
    return 0;
}

int test_many_chunks() {
    if(chunk_file_name("doc", ".pdf", 7) != "doc_part07.pdf" ||
       chunk_file_name("doc", ".pdf", 100) != "doc_part100.pdf" ||
       chunk_file_name("a.b", "", 3) != "a.b_part03") {
        fprintf(stderr, "Chunk file name formatting is wrong.\n");
        return 1;
    }
    FakeBackend backend(pages_of_size(std::vector<uint64_t>(120, 600)));
    ChunkPlanner planner(backend, options_with_budget(1000));
    auto rc = planner.run();
    if(!rc) {
        fprintf(stderr, "Planner failed: %s\n", error_text(rc.error()));
        return 1;
    }
    if(backend.saves.size() != 120) {
        fprintf(stderr, "Expected one chunk per page.\n");
        return 1;
    }
    if(backend.saves.back().path.filename() != "report_part120.pdf" ||
       backend.saves[98].path.filename() != "report_part99.pdf") {
        fprintf(stderr, "Numbering past 99 is wrong.\n");
        return 1;
    }
    return 0;
}

int test_empty_document() {
    FakeBackend backend(std::vector<FakePage>{});
    ChunkPlanner planner(backend, options_with_budget(1000));
    auto rc = planner.run();
    if(!rc || !backend.saves.empty()) {
        fprintf(stderr, "Empty document should produce no chunks.\n");
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    if(test_ten_pages() != 0) {
        return 1;
    }
    if(test_order_and_budget() != 0) {
        return 1;
    }
    if(test_oversized_page_fails() != 0) {
        return 1;
    }
    if(test_first_page_oversized() != 0) {
        return 1;
    }
    if(test_many_chunks() != 0) {
        return 1;
    }
    if(test_empty_document() != 0) {
        return 1;
    }
    return 0;
}
