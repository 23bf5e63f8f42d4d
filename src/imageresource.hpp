// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkpdf {

enum class ImageCompression : uint8_t { Dct, Flate, Unsupported };

enum class ImageColorSpace : uint8_t { Gray, Rgb, Cmyk, Indexed, Unknown };

struct ImagePalette {
    ImageColorSpace base = ImageColorSpace::Rgb;
    int32_t hival = 0;
    // Packed base colour space samples, (hival + 1) entries.
    std::string lookup;
};

// An image XObject as read from a page, with the stream still encoded.
struct ImageResource {
    std::string name;
    ImageCompression compression = ImageCompression::Unsupported;
    std::string filter_name;
    ImageColorSpace colorspace = ImageColorSpace::Unknown;
    int32_t bits_per_component = 8;
    int32_t w = 0;
    int32_t h = 0;
    std::string data;
    // Flate images only, the stream with all filters and predictors undone.
    std::optional<std::string> samples;
    std::optional<std::string> icc_profile;
    std::optional<ImagePalette> palette;
    bool is_mask = false;
};

const char *compression_name(ImageCompression c);

int32_t num_components(ImageColorSpace cs);

} // namespace chunkpdf
