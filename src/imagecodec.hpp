// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <imageops.hpp>
#include <imageresource.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace chunkpdf {

enum class ChromaSubsampling : uint8_t { LibraryDefault, Disabled };

rvoe<PixelBuffer> decode_jpeg(std::string_view jpeg_data);

// Unpacks the already decoded samples to 8 bits.
rvoe<PixelBuffer> decode_flate_image(const ImageResource &image);

rvoe<PixelBuffer> decode_image(const ImageResource &image);

// Baseline JPEG. Accepts gray, RGB and CMYK buffers without alpha.
rvoe<std::string> encode_jpeg(const PixelBuffer &image,
                              int32_t quality,
                              ChromaSubsampling subsampling,
                              const std::optional<std::string> &icc_profile);

} // namespace chunkpdf
