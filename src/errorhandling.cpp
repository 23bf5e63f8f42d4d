// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>

namespace chunkpdf {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Unexpected error, the real error message should be in stdout or stderr.",
"Input file not found.",
"Could not open file.",
"Writing to file failed.",
"Malformed PDF data.",
"Document is encrypted and can not be opened without a password.",
"Document has no pages.",
"Index out of bounds.",
"Invalid size limit.",
"Decompression failure.",
"Unsupported format.",
"JPEG decoding failed.",
"JPEG encoding failed.",
"Missing pixel data.",
"Invalid image size.",
"Image is too large to process.",
"Unusable ICC profile.",
"Image processing failed.",
"Page does not fit in the size budget even after compression.",
"No such resource on page.",
"Unreachable code.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace chunkpdf
