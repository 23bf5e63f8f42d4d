// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <chunkplanner.hpp>

#include <algorithm>
#include <filesystem>
#include <vector>

namespace chunkpdf {

struct FakePage {
    size_t source_index = 0;
    // Bytes the page costs besides its images.
    uint64_t size = 0;
    std::vector<ImageResource> images;
    FontTable fonts;
};

struct FakeSave {
    std::filesystem::path path;
    std::vector<FakePage> pages;
    uint64_t size;
};

// Serialized size is overhead plus page sizes plus image stream sizes.
class FakeBackend : public ChunkBackend {
public:
    explicit FakeBackend(std::vector<FakePage> pages_, uint64_t overhead_ = 0)
        : source{std::move(pages_)}, overhead{overhead_} {
        for(size_t i = 0; i < source.size(); ++i) {
            source[i].source_index = i;
        }
    }

    size_t source_page_count() const override { return source.size(); }

    rvoe<NoReturnValue> append_page(size_t source_index) override {
        if(source_index >= source.size()) {
            RETERR(IndexOutOfBounds);
        }
        chunk.push_back(source[source_index]);
        RETOK;
    }

    rvoe<NoReturnValue> remove_last_page() override {
        if(chunk.empty()) {
            RETERR(NoPages);
        }
        chunk.pop_back();
        RETOK;
    }

    size_t chunk_page_count() const override { return chunk.size(); }

    rvoe<uint64_t> serialized_size() override {
        ++size_measurements;
        uint64_t total = overhead;
        for(const auto &p : chunk) {
            total += p.size;
            for(const auto &image : p.images) {
                total += image.data.size();
            }
        }
        return total;
    }

    rvoe<uint64_t> save_chunk(const std::filesystem::path &ofname) override {
        if(chunk.empty()) {
            RETERR(NoPages);
        }
        ERC(size, serialized_size());
        saves.push_back(FakeSave{ofname, chunk, size});
        return size;
    }

    void start_new_chunk() override { chunk.clear(); }

    rvoe<std::vector<ImageResource>> page_images(size_t chunk_page) override {
        if(chunk_page >= chunk.size()) {
            RETERR(IndexOutOfBounds);
        }
        return chunk[chunk_page].images;
    }

    rvoe<NoReturnValue> replace_image(size_t chunk_page,
                                      const std::string &name,
                                      const OptimizedImage &image) override {
        if(chunk_page >= chunk.size()) {
            RETERR(IndexOutOfBounds);
        }
        for(auto &res : chunk[chunk_page].images) {
            if(res.name == name) {
                res.data = image.data;
                res.w = image.w;
                res.h = image.h;
                res.compression = ImageCompression::Dct;
                res.filter_name = "DCTDecode";
                res.colorspace = ImageColorSpace::Rgb;
                res.bits_per_component = 8;
                res.icc_profile.reset();
                RETOK;
            }
        }
        RETERR(NoSuchResource);
    }

    rvoe<FontTable> page_fonts(size_t chunk_page) override {
        if(chunk_page >= chunk.size()) {
            RETERR(IndexOutOfBounds);
        }
        return chunk[chunk_page].fonts;
    }

    rvoe<size_t> remove_fonts(size_t chunk_page, const std::vector<std::string> &names) override {
        if(chunk_page >= chunk.size()) {
            RETERR(IndexOutOfBounds);
        }
        auto &fonts = chunk[chunk_page].fonts;
        const auto before = fonts.size();
        std::erase_if(fonts, [&names](const auto &entry) {
            return std::find(names.begin(), names.end(), entry.first) != names.end();
        });
        return before - fonts.size();
    }

    std::vector<size_t> saved_indices(size_t save) const {
        std::vector<size_t> indices;
        for(const auto &p : saves.at(save).pages) {
            indices.push_back(p.source_index);
        }
        return indices;
    }

    std::vector<FakeSave> saves;
    size_t size_measurements = 0;

private:
    std::vector<FakePage> source;
    std::vector<FakePage> chunk;
    uint64_t overhead;
};

} // namespace chunkpdf
