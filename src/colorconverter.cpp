// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <colorconverter.hpp>
#include <lcms2.h>

namespace chunkpdf {

LcmsHolder::~LcmsHolder() {
    if(h) {
        cmsCloseProfile(h);
    }
}

TransformHolder::~TransformHolder() {
    if(h) {
        cmsDeleteTransform(h);
    }
}

bool icc_matches_mode(std::string_view profile, PixelMode mode) {
    // Bytes 16-19 of an ICC header.
    if(profile.size() < 20) {
        return false;
    }
    const auto signature = profile.substr(16, 4);
    switch(mode) {
    case PixelMode::Gray:
        return signature == "GRAY";
    case PixelMode::Rgb:
        return signature == "RGB ";
    case PixelMode::Cmyk:
        return signature == "CMYK";
    case PixelMode::Palette:
        return false;
    }
    return false;
}

rvoe<PixelBuffer> cmyk_to_srgb(const PixelBuffer &image, std::string_view icc_profile) {
    ERCV(validate_buffer(image));
    if(image.mode != PixelMode::Cmyk) {
        RETERR(UnsupportedFormat);
    }
    LcmsHolder input(
        cmsOpenProfileFromMem(icc_profile.data(), (cmsUInt32Number)icc_profile.size()));
    if(!input.h || cmsGetColorSpace(input.h) != cmsSigCmykData) {
        RETERR(InvalidIccProfile);
    }
    LcmsHolder srgb(cmsCreate_sRGBProfile());
    if(!srgb.h) {
        RETERR(InvalidIccProfile);
    }
    TransformHolder transform(cmsCreateTransform(
        input.h, TYPE_CMYK_8, srgb.h, TYPE_RGB_8, INTENT_RELATIVE_COLORIMETRIC, 0));
    if(!transform.h) {
        RETERR(InvalidIccProfile);
    }
    PixelBuffer result;
    result.mode = PixelMode::Rgb;
    result.w = image.w;
    result.h = image.h;
    result.alpha = image.alpha;
    result.pixels.resize(size_t(image.w) * image.h * 3);
    for(int32_t y = 0; y < image.h; ++y) {
        cmsDoTransform(transform.h,
                       image.pixels.data() + size_t(y) * image.w * 4,
                       result.pixels.data() + size_t(y) * image.w * 3,
                       (cmsUInt32Number)image.w);
    }
    return result;
}

} // namespace chunkpdf
