// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <imageresource.hpp>

namespace chunkpdf {

const char *compression_name(ImageCompression c) {
    switch(c) {
    case ImageCompression::Dct:
        return "DCT";
    case ImageCompression::Flate:
        return "Flate";
    case ImageCompression::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

int32_t num_components(ImageColorSpace cs) {
    switch(cs) {
    case ImageColorSpace::Gray:
    case ImageColorSpace::Indexed:
        return 1;
    case ImageColorSpace::Rgb:
        return 3;
    case ImageColorSpace::Cmyk:
        return 4;
    case ImageColorSpace::Unknown:
        return 0;
    }
    return 0;
}

} // namespace chunkpdf
