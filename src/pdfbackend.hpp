// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <chunkplanner.hpp>
#include <document.hpp>
#include <fontsanitizer.hpp>
#include <imageresource.hpp>
#include <pdfreader.hpp>

#include <qpdf/QPDFObjectHandle.hh>

#include <string_view>

namespace chunkpdf {

ImageResource read_image_resource(std::string_view name, QPDFObjectHandle image);

FontDescriptor describe_font(QPDFObjectHandle font);

class PdfChunkBackend : public ChunkBackend {
public:
    explicit PdfChunkBackend(PdfReader &source);

    size_t source_page_count() const override;

    rvoe<NoReturnValue> append_page(size_t source_index) override;
    rvoe<NoReturnValue> remove_last_page() override;
    size_t chunk_page_count() const override;
    rvoe<uint64_t> serialized_size() override;
    rvoe<uint64_t> save_chunk(const std::filesystem::path &ofname) override;
    void start_new_chunk() override;

    rvoe<std::vector<ImageResource>> page_images(size_t chunk_page) override;
    rvoe<NoReturnValue> replace_image(size_t chunk_page,
                                      const std::string &name,
                                      const OptimizedImage &image) override;
    rvoe<FontTable> page_fonts(size_t chunk_page) override;
    rvoe<size_t> remove_fonts(size_t chunk_page, const std::vector<std::string> &names) override;

    ChunkDocument &current_chunk() { return chunk; }

private:
    rvoe<QPDFObjectHandle> font_dict(size_t chunk_page);

    PdfReader &source;
    ChunkDocument chunk;
};

} // namespace chunkpdf
