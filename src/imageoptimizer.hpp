// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <imageops.hpp>
#include <imageresource.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace chunkpdf {

struct ImageOptimizerOptions {
    int32_t quality = 75;
    int32_t max_dimension = 1500;
    // Re-encode even when the image is already a small RGB JPEG.
    bool force_reencode = false;
};

struct OptimizedImage {
    std::string data;
    int32_t w;
    int32_t h;
    PixelMode mode;
    // False when data is the original stream, untouched.
    bool reencoded;
};

struct SkippedImage {
    std::string reason;
};

typedef std::variant<SkippedImage, OptimizedImage> ImageOutcome;

rvoe<ImageOutcome> optimize_image(const ImageResource &image, const ImageOptimizerOptions &opts);

} // namespace chunkpdf
