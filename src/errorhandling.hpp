// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <expected>

namespace chunkpdf {

enum class ErrorCode : int32_t {
    NoError,
    DynamicError,
    InputNotFound,
    CouldNotOpenFile,
    FileWriteError,
    MalformedPdf,
    EncryptedDocument,
    NoPages,
    IndexOutOfBounds,
    InvalidSizeLimit,

    DecompressionFailure,
    UnsupportedFormat,
    JpegDecodeFailure,
    JpegEncodeFailure,
    MissingPixels,
    InvalidImageSize,
    ImageTooLarge,
    InvalidIccProfile,
    ImageProcessingFailure,
    BudgetExceededAfterCompression,

    NoSuchResource,
    Unreachable,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

const char *error_text(ErrorCode ec) noexcept;

// All errors are returned as std::unexpecteds and propagated manually.

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<ErrorCode> create_error(ErrorCode code) { return std::unexpected(code); }

#define RETERR(code) return create_error(ErrorCode::code)

#define RETOK                                                                                      \
    return NoReturnValue {}

// Return value or error.
template<typename T> using rvoe = std::expected<T, ErrorCode>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(varname##_variant.error());                                         \
    }                                                                                              \
    auto &varname = varname##_variant.value();

// For void.

#define ERCV(func)                                                                                 \
    {                                                                                              \
        auto placeholder_name_variant = func;                                                      \
        if(!(placeholder_name_variant)) {                                                          \
            return std::unexpected(placeholder_name_variant.error());                              \
        }                                                                                          \
    }

struct NoReturnValue {};

} // namespace chunkpdf

#define CHECK_INDEXNESS(ind, container)                                                            \
    if((ind) >= (container).size()) {                                                              \
        RETERR(IndexOutOfBounds);                                                                  \
    }
