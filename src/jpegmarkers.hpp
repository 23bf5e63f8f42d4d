// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <imageresource.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkpdf {

// Adobe APP14 segment. Transforms 0 and 2 mean the CMYK samples are stored inverted.
struct AdobeMarker {
    uint8_t transform;
};

// Only the first APP14 marker is looked at. Truncated segments count as absent.
std::optional<AdobeMarker> find_adobe_marker(std::string_view jpeg_data);

bool needs_inversion(ImageCompression compression, std::string_view raw_data);

} // namespace chunkpdf
