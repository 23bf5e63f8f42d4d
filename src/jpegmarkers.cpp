// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <jpegmarkers.hpp>

namespace chunkpdf {

namespace {

const std::string_view APP14_MARKER{"\xFF\xEE", 2};
const std::string_view ADOBE_SIGNATURE{"Adobe"};

// FF EE and the two segment length bytes precede the signature.
const size_t SIGNATURE_OFFSET = 4;
// DCTEncodeVersion, APP14Flags0 and APP14Flags1 sit between the signature and the transform.
const size_t TRANSFORM_OFFSET = 11;

} // namespace

std::optional<AdobeMarker> find_adobe_marker(std::string_view jpeg_data) {
    const auto idx = jpeg_data.find(APP14_MARKER);
    if(idx == std::string_view::npos) {
        return {};
    }
    const size_t sig_start = idx + SIGNATURE_OFFSET;
    if(jpeg_data.size() < sig_start + ADOBE_SIGNATURE.size()) {
        return {};
    }
    if(jpeg_data.substr(sig_start, ADOBE_SIGNATURE.size()) != ADOBE_SIGNATURE) {
        return {};
    }
    const size_t transform_pos = sig_start + TRANSFORM_OFFSET;
    if(transform_pos >= jpeg_data.size()) {
        return {};
    }
    return AdobeMarker{(uint8_t)jpeg_data[transform_pos]};
}

bool needs_inversion(ImageCompression compression, std::string_view raw_data) {
    if(compression != ImageCompression::Dct) {
        return false;
    }
    const auto marker = find_adobe_marker(raw_data);
    return marker && (marker->transform == 0 || marker->transform == 2);
}

} // namespace chunkpdf
