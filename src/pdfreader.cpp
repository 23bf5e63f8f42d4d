// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <pdfreader.hpp>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <fmt/core.h>

namespace chunkpdf {

ErrorCode qpdf_error(const std::exception &e, ErrorCode code) {
    if(const auto *qe = dynamic_cast<const QPDFExc *>(&e)) {
        if(qe->getErrorCode() == qpdf_e_password) {
            code = ErrorCode::EncryptedDocument;
        }
    } else {
        code = ErrorCode::DynamicError;
    }
    fmt::print(stderr, "  ! {}\n", e.what());
    return code;
}

PdfReader::PdfReader(std::string contents_)
    : contents{std::move(contents_)}, pdf{std::make_unique<QPDF>()} {
    pdf->setSuppressWarnings(true);
}

rvoe<std::unique_ptr<PdfReader>> PdfReader::open(const std::filesystem::path &fname) {
    std::unique_ptr<PdfReader> reader(new PdfReader(std::string{}));
    ERCV(reader->load(&fname));
    return reader;
}

rvoe<std::unique_ptr<PdfReader>> PdfReader::open_from_memory(std::string contents) {
    std::unique_ptr<PdfReader> reader(new PdfReader(std::move(contents)));
    ERCV(reader->load(nullptr));
    return reader;
}

rvoe<NoReturnValue> PdfReader::load(const std::filesystem::path *fname) {
    try {
        if(fname) {
            pdf->processFile(fname->string().c_str());
        } else {
            pdf->processMemoryFile("memory input", contents.data(), contents.size());
        }
        pages = QPDFPageDocumentHelper(*pdf).getAllPages();
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
    repaired = pdf->anyWarnings();
    RETOK;
}

} // namespace chunkpdf
