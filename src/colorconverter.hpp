// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <imageops.hpp>

#include <string_view>

// To avoid pulling all of LittleCMS in this file.
typedef void *cmsHPROFILE;
typedef void *cmsHTRANSFORM;

namespace chunkpdf {

struct LcmsHolder {
    cmsHPROFILE h;

    explicit LcmsHolder(cmsHPROFILE h) : h(h) {}
    ~LcmsHolder();

    LcmsHolder(const LcmsHolder &) = delete;
    LcmsHolder &operator=(const LcmsHolder &) = delete;
};

struct TransformHolder {
    cmsHTRANSFORM h;

    explicit TransformHolder(cmsHTRANSFORM h) : h(h) {}
    ~TransformHolder();

    TransformHolder(const TransformHolder &) = delete;
    TransformHolder &operator=(const TransformHolder &) = delete;
};

// Checks the data colour space signature in the profile header.
bool icc_matches_mode(std::string_view profile, PixelMode mode);

// Converts CMYK samples to sRGB with the embedded CMYK profile as the source.
// The samples must already be in the normal sense, zero meaning no ink.
rvoe<PixelBuffer> cmyk_to_srgb(const PixelBuffer &image, std::string_view icc_profile);

} // namespace chunkpdf
