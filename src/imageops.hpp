// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chunkpdf {

// Decoding refuses anything larger before allocating pixel memory.
const int64_t MAX_IMAGE_PIXELS = 178956970;

enum class PixelMode : uint8_t { Gray, Rgb, Cmyk, Palette };

// Samples are 8 bits, interleaved. In palette mode pixels holds one index per
// pixel and palette holds RGB triples.
struct PixelBuffer {
    PixelMode mode = PixelMode::Rgb;
    int32_t w = 0;
    int32_t h = 0;
    std::string pixels;
    std::optional<std::string> alpha;
    std::string palette;
    std::optional<std::string> icc_profile;
};

struct ImageSize {
    int32_t w;
    int32_t h;
};

struct RgbColor {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

int32_t num_channels(PixelMode mode);
const char *mode_name(PixelMode mode);

bool has_transparency(const PixelBuffer &image);

// Checks that the sample buffers match the dimensions.
rvoe<NoReturnValue> validate_buffer(const PixelBuffer &image);

void invert_samples(PixelBuffer &image);

rvoe<PixelBuffer> convert_to_rgb(const PixelBuffer &image);

// Alpha is used as the mask, the result is opaque RGB.
rvoe<PixelBuffer> composite_over_background(const PixelBuffer &image, RgbColor background);

// Catmull-Rom resampling. Palette images use point sampling.
rvoe<PixelBuffer> resize_image(const PixelBuffer &image, int32_t new_w, int32_t new_h);

rvoe<NoReturnValue> check_image_dimensions(int64_t w, int64_t h);

// Scales so that the longer edge is max_dimension. Sizes already within
// the limit are returned as is.
ImageSize fit_within(int32_t w, int32_t h, int32_t max_dimension);

} // namespace chunkpdf
