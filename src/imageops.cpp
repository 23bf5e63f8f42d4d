// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <imageops.hpp>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>

#include <algorithm>
#include <cmath>

namespace chunkpdf {

namespace {

uint8_t muldiv255(int a, int b) {
    const int tmp = a * b + 128;
    return uint8_t(((tmp >> 8) + tmp) >> 8);
}

stbir_pixel_layout layout_for(int32_t channels) {
    switch(channels) {
    case 1:
        return STBIR_1CHANNEL;
    case 3:
        return STBIR_RGB;
    default:
        return STBIR_4CHANNEL;
    }
}

rvoe<std::string> resample(const std::string &src,
                           int32_t w,
                           int32_t h,
                           int32_t channels,
                           int32_t new_w,
                           int32_t new_h,
                           stbir_filter filter) {
    std::string out(size_t(new_w) * new_h * channels, '\0');
    if(!stbir_resize(src.data(),
                     w,
                     h,
                     w * channels,
                     out.data(),
                     new_w,
                     new_h,
                     new_w * channels,
                     layout_for(channels),
                     STBIR_TYPE_UINT8,
                     STBIR_EDGE_CLAMP,
                     filter)) {
        RETERR(ImageProcessingFailure);
    }
    return out;
}

} // namespace

int32_t num_channels(PixelMode mode) {
    switch(mode) {
    case PixelMode::Gray:
    case PixelMode::Palette:
        return 1;
    case PixelMode::Rgb:
        return 3;
    case PixelMode::Cmyk:
        return 4;
    }
    return 0;
}

const char *mode_name(PixelMode mode) {
    switch(mode) {
    case PixelMode::Gray:
        return "L";
    case PixelMode::Rgb:
        return "RGB";
    case PixelMode::Cmyk:
        return "CMYK";
    case PixelMode::Palette:
        return "P";
    }
    return "?";
}

bool has_transparency(const PixelBuffer &image) {
    return image.alpha.has_value() || image.mode == PixelMode::Palette;
}

rvoe<NoReturnValue> validate_buffer(const PixelBuffer &image) {
    if(image.w <= 0 || image.h <= 0) {
        RETERR(InvalidImageSize);
    }
    const size_t num_pixels = size_t(image.w) * image.h;
    if(image.pixels.size() != num_pixels * num_channels(image.mode)) {
        RETERR(MissingPixels);
    }
    if(image.alpha && image.alpha->size() != num_pixels) {
        RETERR(MissingPixels);
    }
    if(image.mode == PixelMode::Palette && (image.palette.empty() || image.palette.size() % 3)) {
        RETERR(MissingPixels);
    }
    RETOK;
}

void invert_samples(PixelBuffer &image) {
    for(auto &c : image.pixels) {
        c = char(255 - (uint8_t)c);
    }
}

rvoe<PixelBuffer> convert_to_rgb(const PixelBuffer &image) {
    ERCV(validate_buffer(image));
    PixelBuffer result;
    result.mode = PixelMode::Rgb;
    result.w = image.w;
    result.h = image.h;
    result.alpha = image.alpha;
    const size_t num_pixels = size_t(image.w) * image.h;
    result.pixels.reserve(num_pixels * 3);
    const auto *in = (const uint8_t *)image.pixels.data();
    switch(image.mode) {
    case PixelMode::Rgb:
        result.pixels = image.pixels;
        result.icc_profile = image.icc_profile;
        break;
    case PixelMode::Gray:
        for(size_t i = 0; i < num_pixels; ++i) {
            result.pixels.append(3, char(in[i]));
        }
        break;
    case PixelMode::Cmyk:
        for(size_t i = 0; i < num_pixels; ++i) {
            const int k = 255 - in[4 * i + 3];
            result.pixels.push_back(char(muldiv255(255 - in[4 * i], k)));
            result.pixels.push_back(char(muldiv255(255 - in[4 * i + 1], k)));
            result.pixels.push_back(char(muldiv255(255 - in[4 * i + 2], k)));
        }
        break;
    case PixelMode::Palette: {
        const size_t entries = image.palette.size() / 3;
        for(size_t i = 0; i < num_pixels; ++i) {
            const size_t idx = std::min<size_t>(in[i], entries - 1);
            result.pixels.append(image.palette, idx * 3, 3);
        }
        break;
    }
    }
    return result;
}

rvoe<PixelBuffer> composite_over_background(const PixelBuffer &image, RgbColor background) {
    ERC(rgb, convert_to_rgb(image));
    if(!rgb.alpha) {
        return std::move(rgb);
    }
    const uint8_t bg[3] = {background.r, background.g, background.b};
    const auto &mask = *rgb.alpha;
    auto *px = (uint8_t *)rgb.pixels.data();
    for(size_t i = 0; i < mask.size(); ++i) {
        const int a = (uint8_t)mask[i];
        for(int ch = 0; ch < 3; ++ch) {
            const int v = muldiv255(px[3 * i + ch], a) + muldiv255(bg[ch], 255 - a);
            px[3 * i + ch] = uint8_t(std::min(v, 255));
        }
    }
    rgb.alpha.reset();
    return std::move(rgb);
}

rvoe<PixelBuffer> resize_image(const PixelBuffer &image, int32_t new_w, int32_t new_h) {
    ERCV(validate_buffer(image));
    if(new_w <= 0 || new_h <= 0) {
        RETERR(InvalidImageSize);
    }
    PixelBuffer result;
    result.mode = image.mode;
    result.w = new_w;
    result.h = new_h;
    result.palette = image.palette;
    result.icc_profile = image.icc_profile;
    const auto channels = num_channels(image.mode);
    // Palette indices can not be blended.
    const auto filter = image.mode == PixelMode::Palette ? STBIR_FILTER_POINT_SAMPLE
                                                         : STBIR_FILTER_CATMULLROM;
    ERC(pixels, resample(image.pixels, image.w, image.h, channels, new_w, new_h, filter));
    result.pixels = std::move(pixels);
    if(image.alpha) {
        ERC(alpha,
            resample(*image.alpha, image.w, image.h, 1, new_w, new_h, STBIR_FILTER_CATMULLROM));
        result.alpha = std::move(alpha);
    }
    return result;
}

rvoe<NoReturnValue> check_image_dimensions(int64_t w, int64_t h) {
    if(w <= 0 || h <= 0) {
        RETERR(InvalidImageSize);
    }
    if(w * h > MAX_IMAGE_PIXELS) {
        RETERR(ImageTooLarge);
    }
    RETOK;
}

ImageSize fit_within(int32_t w, int32_t h, int32_t max_dimension) {
    const auto longer = std::max(w, h);
    if(longer <= max_dimension || max_dimension <= 0) {
        return ImageSize{w, h};
    }
    const double ratio = double(max_dimension) / longer;
    if(w >= h) {
        return ImageSize{max_dimension, std::max(int32_t(std::lround(h * ratio)), 1)};
    }
    return ImageSize{std::max(int32_t(std::lround(w * ratio)), 1), max_dimension};
}

} // namespace chunkpdf
