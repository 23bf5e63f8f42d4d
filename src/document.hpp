// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <pdfreader.hpp>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkpdf {

// A standalone document being assembled from pages of a source document.
// Appended pages are copies, so edits here never touch the source. References
// to pages that are not in the chunk end up as null.
class ChunkDocument {
public:
    explicit ChunkDocument(PdfReader &source);

    ChunkDocument(const ChunkDocument &) = delete;
    ChunkDocument &operator=(const ChunkDocument &) = delete;
    ChunkDocument(ChunkDocument &&) = default;
    ChunkDocument &operator=(ChunkDocument &&) = default;

    rvoe<NoReturnValue> append_page(size_t source_index);
    // Rebuilds the chunk from the remaining pages, so nothing copied in
    // with the removed page is left behind.
    rvoe<NoReturnValue> remove_last_page();

    size_t num_pages() const { return pages.size(); }
    rvoe<QPDFPageObjectHelper> page(size_t i) const;

    QPDF &document() { return *pdf; }

    // Only objects reachable from the catalog are written. The output has
    // no timestamps and a deterministic ID, so equal chunks give equal bytes.
    rvoe<std::string> serialize();
    rvoe<uint64_t> serialized_size();

private:
    rvoe<NoReturnValue> copy_page(size_t source_index);

    PdfReader *source;
    std::unique_ptr<QPDF> pdf;
    std::vector<QPDFPageObjectHelper> pages;
    std::vector<size_t> source_indices;
};

} // namespace chunkpdf
