// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <imagecodec.hpp>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <jpeglib.h>

namespace chunkpdf {

namespace {

struct JpegError {
    struct jpeg_error_mgr jmgr;
    jmp_buf buf;
};

void jpeg_error_exit(j_common_ptr cinfo) {
    JpegError *e = (JpegError *)cinfo->err;
    longjmp(e->buf, 1);
}

// Corrupt data warnings would otherwise be printed to stderr by the library.
void jpeg_silent_message(j_common_ptr) {}

struct JpegDecompressCloser {
    void operator()(jpeg_decompress_struct *j) const {
        if(j) {
            jpeg_destroy_decompress(j);
        }
    }
};

struct JpegCompressCloser {
    void operator()(jpeg_compress_struct *j) const {
        if(j) {
            jpeg_destroy_compress(j);
        }
    }
};

J_COLOR_SPACE libjpeg_colorspace(PixelMode mode) {
    switch(mode) {
    case PixelMode::Gray:
        return JCS_GRAYSCALE;
    case PixelMode::Cmyk:
        return JCS_CMYK;
    default:
        return JCS_RGB;
    }
}

uint8_t unpack_sample(const uint8_t *row, size_t index, int32_t bpc, bool scale) {
    if(bpc == 8) {
        return row[index];
    }
    if(bpc == 16) {
        return row[2 * index];
    }
    const size_t bitpos = index * bpc;
    const int shift = 8 - bpc - int(bitpos % 8);
    const uint32_t maxval = (1u << bpc) - 1;
    const uint32_t v = (row[bitpos / 8] >> shift) & maxval;
    return scale ? uint8_t(v * 255 / maxval) : uint8_t(v);
}

rvoe<std::string> expand_palette(const ImagePalette &palette) {
    PixelBuffer entries;
    switch(palette.base) {
    case ImageColorSpace::Gray:
        entries.mode = PixelMode::Gray;
        break;
    case ImageColorSpace::Rgb:
        entries.mode = PixelMode::Rgb;
        break;
    case ImageColorSpace::Cmyk:
        entries.mode = PixelMode::Cmyk;
        break;
    default:
        RETERR(UnsupportedFormat);
    }
    if(palette.hival < 0 || palette.hival > 255) {
        RETERR(UnsupportedFormat);
    }
    entries.w = palette.hival + 1;
    entries.h = 1;
    // Short lookup tables are padded with zeros.
    entries.pixels = palette.lookup;
    entries.pixels.resize(size_t(entries.w) * num_channels(entries.mode), '\0');
    ERC(rgb, convert_to_rgb(entries));
    return std::move(rgb.pixels);
}

} // namespace

rvoe<PixelBuffer> decode_jpeg(std::string_view jpeg_data) {
    if(jpeg_data.empty()) {
        RETERR(JpegDecodeFailure);
    }
    PixelBuffer result;
    // Libjpeg kills the process on invalid input.
    // Changing the behaviour requires mucking about
    // with setjmp/longjmp.
    struct jpeg_decompress_struct cinfo;
    memset(&cinfo, 0, sizeof(cinfo));
    JpegError jerr;
    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jerr.jmgr.error_exit = jpeg_error_exit;
    jerr.jmgr.output_message = jpeg_silent_message;
    std::unique_ptr<jpeg_decompress_struct, JpegDecompressCloser> jpgcloser(&cinfo);
    if(setjmp(jerr.buf)) {
        RETERR(JpegDecodeFailure);
    }
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, (const unsigned char *)jpeg_data.data(), (unsigned long)jpeg_data.size());
    // Required for ICC profile reading to work.
    jpeg_save_markers(&cinfo, JPEG_APP0 + 2, 0xFFFF);
    if(jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        RETERR(JpegDecodeFailure);
    }
    if(cinfo.data_precision != 8) {
        RETERR(UnsupportedFormat);
    }
    ERCV(check_image_dimensions(cinfo.image_width, cinfo.image_height));
    switch(cinfo.jpeg_color_space) {
    case JCS_GRAYSCALE:
        cinfo.out_color_space = JCS_GRAYSCALE;
        result.mode = PixelMode::Gray;
        break;
    case JCS_CMYK:
    case JCS_YCCK:
        // Samples come out as stored, inversion is decided by the caller.
        cinfo.out_color_space = JCS_CMYK;
        result.mode = PixelMode::Cmyk;
        break;
    default:
        cinfo.out_color_space = JCS_RGB;
        result.mode = PixelMode::Rgb;
        break;
    }
    JOCTET *icc_buf = nullptr;
    unsigned int icc_len = 0;
    if(jpeg_read_icc_profile(&cinfo, &icc_buf, &icc_len)) {
        result.icc_profile = std::string((const char *)icc_buf, icc_len);
        free(icc_buf);
    }
    jpeg_start_decompress(&cinfo);
    result.w = int32_t(cinfo.output_width);
    result.h = int32_t(cinfo.output_height);
    if(cinfo.output_components != num_channels(result.mode)) {
        RETERR(JpegDecodeFailure);
    }
    const size_t stride = size_t(result.w) * cinfo.output_components;
    result.pixels.resize(stride * result.h);
    while(cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = (JSAMPROW)(result.pixels.data() + stride * cinfo.output_scanline);
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    return result;
}

rvoe<PixelBuffer> decode_flate_image(const ImageResource &image) {
    ERCV(check_image_dimensions(image.w, image.h));
    const int32_t comps = num_components(image.colorspace);
    if(comps == 0) {
        RETERR(UnsupportedFormat);
    }
    const int32_t bpc = image.bits_per_component;
    if(bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8 && bpc != 16) {
        RETERR(UnsupportedFormat);
    }
    const bool indexed = image.colorspace == ImageColorSpace::Indexed;
    if(indexed && (!image.palette || bpc == 16)) {
        RETERR(UnsupportedFormat);
    }
    if(!image.samples) {
        RETERR(DecompressionFailure);
    }
    const auto &raw = *image.samples;
    const size_t row_bytes = (size_t(image.w) * comps * bpc + 7) / 8;
    if(raw.size() < row_bytes * image.h) {
        RETERR(MissingPixels);
    }
    PixelBuffer result;
    result.w = image.w;
    result.h = image.h;
    switch(image.colorspace) {
    case ImageColorSpace::Gray:
        result.mode = PixelMode::Gray;
        break;
    case ImageColorSpace::Rgb:
        result.mode = PixelMode::Rgb;
        break;
    case ImageColorSpace::Cmyk:
        result.mode = PixelMode::Cmyk;
        break;
    case ImageColorSpace::Indexed:
        result.mode = PixelMode::Palette;
        break;
    case ImageColorSpace::Unknown:
        RETERR(UnsupportedFormat);
    }
    if(indexed) {
        ERC(palette, expand_palette(*image.palette));
        result.palette = std::move(palette);
    } else {
        result.icc_profile = image.icc_profile;
    }
    const size_t samples_per_row = size_t(image.w) * comps;
    result.pixels.resize(samples_per_row * image.h);
    auto *out = (uint8_t *)result.pixels.data();
    for(int32_t y = 0; y < image.h; ++y) {
        const auto *row = (const uint8_t *)raw.data() + y * row_bytes;
        for(size_t s = 0; s < samples_per_row; ++s) {
            *out++ = unpack_sample(row, s, bpc, !indexed);
        }
    }
    return result;
}

rvoe<PixelBuffer> decode_image(const ImageResource &image) {
    switch(image.compression) {
    case ImageCompression::Dct: {
        ERC(decoded, decode_jpeg(image.data));
        if(!decoded.icc_profile && image.icc_profile) {
            decoded.icc_profile = image.icc_profile;
        }
        return std::move(decoded);
    }
    case ImageCompression::Flate:
        return decode_flate_image(image);
    case ImageCompression::Unsupported:
        break;
    }
    RETERR(UnsupportedFormat);
}

rvoe<std::string> encode_jpeg(const PixelBuffer &image,
                              int32_t quality,
                              ChromaSubsampling subsampling,
                              const std::optional<std::string> &icc_profile) {
    ERCV(validate_buffer(image));
    if(image.alpha || image.mode == PixelMode::Palette) {
        RETERR(UnsupportedFormat);
    }
    quality = std::clamp(quality, 1, 100);
    struct jpeg_compress_struct cinfo;
    memset(&cinfo, 0, sizeof(cinfo));
    JpegError jerr;
    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jerr.jmgr.error_exit = jpeg_error_exit;
    jerr.jmgr.output_message = jpeg_silent_message;
    unsigned char *outbuf = nullptr;
    unsigned long outsize = 0;
    std::unique_ptr<jpeg_compress_struct, JpegCompressCloser> jpgcloser(&cinfo);
    if(setjmp(jerr.buf)) {
        free(outbuf);
        RETERR(JpegEncodeFailure);
    }
    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &outbuf, &outsize);
    cinfo.image_width = JDIMENSION(image.w);
    cinfo.image_height = JDIMENSION(image.h);
    cinfo.input_components = num_channels(image.mode);
    cinfo.in_color_space = libjpeg_colorspace(image.mode);
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    if(subsampling == ChromaSubsampling::Disabled) {
        for(int i = 0; i < cinfo.num_components; ++i) {
            cinfo.comp_info[i].h_samp_factor = 1;
            cinfo.comp_info[i].v_samp_factor = 1;
        }
    }
    jpeg_start_compress(&cinfo, TRUE);
    if(icc_profile && !icc_profile->empty()) {
        jpeg_write_icc_profile(
            &cinfo, (const JOCTET *)icc_profile->data(), (unsigned int)icc_profile->size());
    }
    const size_t stride = size_t(image.w) * cinfo.input_components;
    while(cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = (JSAMPROW)(image.pixels.data() + stride * cinfo.next_scanline);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    std::string result((const char *)outbuf, outsize);
    free(outbuf);
    return result;
}

} // namespace chunkpdf
