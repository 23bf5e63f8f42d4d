// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#include <document.hpp>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace chunkpdf {

namespace {

std::unique_ptr<QPDF> new_empty_pdf() {
    auto pdf = std::make_unique<QPDF>();
    pdf->setSuppressWarnings(true);
    pdf->emptyPDF();
    return pdf;
}

} // namespace

ChunkDocument::ChunkDocument(PdfReader &source_) : source{&source_}, pdf{new_empty_pdf()} {}

rvoe<NoReturnValue> ChunkDocument::copy_page(size_t source_index) {
    try {
        QPDFPageDocumentHelper helper(*pdf);
        helper.addPage(source->page(source_index), false);
        pages = helper.getAllPages();
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
    RETOK;
}

rvoe<NoReturnValue> ChunkDocument::append_page(size_t source_index) {
    if(source_index >= source->num_pages()) {
        RETERR(IndexOutOfBounds);
    }
    ERCV(copy_page(source_index));
    source_indices.push_back(source_index);
    RETOK;
}

rvoe<NoReturnValue> ChunkDocument::remove_last_page() {
    if(pages.empty()) {
        RETERR(NoPages);
    }
    source_indices.pop_back();
    pdf = new_empty_pdf();
    pages.clear();
    for(const auto i : source_indices) {
        ERCV(copy_page(i));
    }
    RETOK;
}

rvoe<QPDFPageObjectHelper> ChunkDocument::page(size_t i) const {
    CHECK_INDEXNESS(i, pages);
    return pages[i];
}

rvoe<std::string> ChunkDocument::serialize() {
    if(pages.empty()) {
        RETERR(NoPages);
    }
    try {
        QPDFWriter w(*pdf);
        w.setOutputMemory();
        w.setDeterministicID(true);
        w.write();
        auto buf = w.getBufferSharedPointer();
        return std::string((const char *)buf->getBuffer(), buf->getSize());
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
}

rvoe<uint64_t> ChunkDocument::serialized_size() {
    ERC(bytes, serialize());
    return uint64_t(bytes.size());
}

} // namespace chunkpdf
