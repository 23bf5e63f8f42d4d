// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunkpdf {

// Prints a qpdf exception to stderr and maps it to an error code. Wrong
// password exceptions always map to EncryptedDocument.
ErrorCode qpdf_error(const std::exception &e, ErrorCode code);

// The document being split. Encrypted files open when the user password is empty.
class PdfReader {
public:
    static rvoe<std::unique_ptr<PdfReader>> open(const std::filesystem::path &fname);
    static rvoe<std::unique_ptr<PdfReader>> open_from_memory(std::string contents);

    PdfReader(const PdfReader &) = delete;
    PdfReader &operator=(const PdfReader &) = delete;

    size_t num_pages() const { return pages.size(); }
    const QPDFPageObjectHelper &page(size_t i) const { return pages.at(i); }

    QPDF &document() { return *pdf; }
    // qpdf warned while opening, usually because the cross reference
    // table had to be rebuilt.
    bool was_repaired() const { return repaired; }

private:
    explicit PdfReader(std::string contents);

    rvoe<NoReturnValue> load(const std::filesystem::path *fname);

    // Backs a memory input, so it must outlive pdf.
    std::string contents;
    std::unique_ptr<QPDF> pdf;
    std::vector<QPDFPageObjectHelper> pages;
    bool repaired = false;
};

} // namespace chunkpdf
