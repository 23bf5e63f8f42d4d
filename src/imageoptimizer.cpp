// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <imageoptimizer.hpp>
#include <colorconverter.hpp>
#include <imagecodec.hpp>
#include <jpegmarkers.hpp>

#include <fmt/core.h>

namespace chunkpdf {

namespace {

const RgbColor WHITE{255, 255, 255};

} // namespace

rvoe<ImageOutcome> optimize_image(const ImageResource &image, const ImageOptimizerOptions &opts) {
    if(image.compression == ImageCompression::Unsupported) {
        return SkippedImage{fmt::format("unsupported filter {}",
                                        image.filter_name.empty() ? "(none)" : image.filter_name)};
    }
    if(image.is_mask) {
        return SkippedImage{"stencil mask"};
    }
    ERC(decoded, decode_image(image));
    PixelBuffer buffer = std::move(decoded);
    bool modified = false;

    if(buffer.mode == PixelMode::Cmyk) {
        if(needs_inversion(image.compression, image.data)) {
            invert_samples(buffer);
        }
        if(buffer.icc_profile && icc_matches_mode(*buffer.icc_profile, PixelMode::Cmyk)) {
            ERC(rgb, cmyk_to_srgb(buffer, *buffer.icc_profile));
            buffer = std::move(rgb);
        } else {
            ERC(rgb, convert_to_rgb(buffer));
            buffer = std::move(rgb);
        }
        modified = true;
    }

    const auto target = fit_within(buffer.w, buffer.h, opts.max_dimension);
    if(target.w != buffer.w || target.h != buffer.h) {
        ERC(resized, resize_image(buffer, target.w, target.h));
        buffer = std::move(resized);
        modified = true;
    }

    if(has_transparency(buffer)) {
        ERC(flattened, composite_over_background(buffer, WHITE));
        buffer = std::move(flattened);
        modified = true;
    } else if(buffer.mode != PixelMode::Rgb) {
        ERC(rgb, convert_to_rgb(buffer));
        buffer = std::move(rgb);
        modified = true;
    }

    if(!modified && image.compression == ImageCompression::Dct && !opts.force_reencode) {
        return OptimizedImage{image.data, image.w, image.h, buffer.mode, false};
    }

    std::optional<std::string> profile;
    if(buffer.icc_profile && icc_matches_mode(*buffer.icc_profile, buffer.mode)) {
        profile = buffer.icc_profile;
    }
    const auto subsampling = buffer.mode == PixelMode::Cmyk ? ChromaSubsampling::Disabled
                                                            : ChromaSubsampling::LibraryDefault;
    ERC(encoded, encode_jpeg(buffer, opts.quality, subsampling, profile));
    return OptimizedImage{std::move(encoded), buffer.w, buffer.h, buffer.mode, true};
}

} // namespace chunkpdf
