// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <pdfbackend.hpp>
#include <utils.hpp>

#include <qpdf/Buffer.hh>

#include <optional>

namespace chunkpdf {

namespace {

// qpdf keeps the leading slash of names.
std::string plain_name(const std::string &name) {
    return name.empty() || name[0] != '/' ? name : name.substr(1);
}

std::optional<std::string> name_entry(QPDFObjectHandle dict, const char *key) {
    auto v = dict.getKey(key);
    if(!v.isName()) {
        return {};
    }
    return plain_name(v.getName());
}

// Unreadable streams give nothing, the caller decides what that means.
std::optional<std::string> stream_bytes(QPDFObjectHandle stream, bool decoded) {
    try {
        auto buf = decoded ? stream.getStreamData(qpdf_dl_generalized) : stream.getRawStreamData();
        return std::string((const char *)buf->getBuffer(), buf->getSize());
    } catch(const std::exception &) {
        return {};
    }
}

ImageCompression compression_of(std::string_view filter) {
    if(filter == "DCTDecode" || filter == "DCT") {
        return ImageCompression::Dct;
    }
    if(filter == "FlateDecode" || filter == "Fl") {
        return ImageCompression::Flate;
    }
    return ImageCompression::Unsupported;
}

ImageColorSpace colorspace_from_components(long long n) {
    switch(n) {
    case 1:
        return ImageColorSpace::Gray;
    case 3:
        return ImageColorSpace::Rgb;
    case 4:
        return ImageColorSpace::Cmyk;
    default:
        return ImageColorSpace::Unknown;
    }
}

ImageColorSpace read_colorspace(QPDFObjectHandle cs,
                                std::optional<std::string> *icc,
                                std::optional<ImagePalette> *palette) {
    if(cs.isName()) {
        const auto n = plain_name(cs.getName());
        if(n == "DeviceGray" || n == "G" || n == "CalGray") {
            return ImageColorSpace::Gray;
        }
        if(n == "DeviceRGB" || n == "RGB" || n == "CalRGB") {
            return ImageColorSpace::Rgb;
        }
        if(n == "DeviceCMYK" || n == "CMYK") {
            return ImageColorSpace::Cmyk;
        }
        return ImageColorSpace::Unknown;
    }
    if(!cs.isArray() || cs.getArrayNItems() == 0 || !cs.getArrayItem(0).isName()) {
        return ImageColorSpace::Unknown;
    }
    const auto family = plain_name(cs.getArrayItem(0).getName());
    const int num_items = cs.getArrayNItems();
    if(family == "CalGray") {
        return ImageColorSpace::Gray;
    }
    if(family == "CalRGB") {
        return ImageColorSpace::Rgb;
    }
    if(family == "ICCBased" && num_items >= 2) {
        auto stream = cs.getArrayItem(1);
        if(!stream.isStream()) {
            return ImageColorSpace::Unknown;
        }
        auto n = stream.getDict().getKey("/N");
        if(!n.isInteger()) {
            return ImageColorSpace::Unknown;
        }
        if(icc) {
            *icc = stream_bytes(stream, true);
        }
        return colorspace_from_components(n.getIntValue());
    }
    if((family == "Indexed" || family == "I") && num_items >= 4 && palette) {
        ImagePalette pal;
        pal.base = read_colorspace(cs.getArrayItem(1), nullptr, nullptr);
        auto hival = cs.getArrayItem(2);
        if(!hival.isInteger()) {
            return ImageColorSpace::Unknown;
        }
        pal.hival = hival.getIntValueAsInt();
        auto lookup = cs.getArrayItem(3);
        if(lookup.isStream()) {
            auto bytes = stream_bytes(lookup, true);
            if(!bytes) {
                return ImageColorSpace::Unknown;
            }
            pal.lookup = std::move(*bytes);
        } else if(lookup.isString()) {
            pal.lookup = lookup.getStringValue();
        }
        *palette = std::move(pal);
        return ImageColorSpace::Indexed;
    }
    return ImageColorSpace::Unknown;
}

DescendantEntry describe_descendant(QPDFObjectHandle entry) {
    if(entry.isNull()) {
        return NullDescendant{};
    }
    if(entry.isStream()) {
        entry = entry.getDict();
    }
    if(!entry.isDictionary()) {
        return NonRecordDescendant{};
    }
    DescendantRecord r;
    if(entry.hasKey("/Subtype")) {
        const auto s = name_entry(entry, "/Subtype");
        r.subtype = s ? subtype_tag(*s) : SubtypeTag::Unknown;
    }
    if(entry.hasKey("/Type")) {
        const auto t = name_entry(entry, "/Type");
        r.type = t ? type_tag(*t) : TypeTag::Unknown;
    }
    r.has_base_font = entry.hasKey("/BaseFont");
    r.has_info_keys =
        entry.hasKey("/CreationDate") || entry.hasKey("/ModDate") || entry.hasKey("/Producer");
    r.has_filter = entry.hasKey("/Filter");
    r.has_length = entry.hasKey("/Length");
    r.has_descendants = entry.hasKey("/DescendantFonts");
    r.has_cid_system_info = entry.hasKey("/CIDSystemInfo");
    r.has_widths = entry.hasKey("/W");
    return r;
}

} // namespace

ImageResource read_image_resource(std::string_view name, QPDFObjectHandle image) {
    ImageResource r;
    r.name = name;
    if(!image.isStream()) {
        return r;
    }
    r.data = stream_bytes(image, false).value_or(std::string{});
    auto d = image.getDict();
    auto filter = d.getKey("/Filter");
    if(filter.isName()) {
        r.filter_name = plain_name(filter.getName());
        r.compression = compression_of(r.filter_name);
    } else if(filter.isArray()) {
        // Only a bare filter name is supported, arrays are kept for the log.
        for(const auto &item : filter.getArrayAsVector()) {
            if(!r.filter_name.empty()) {
                r.filter_name += ' ';
            }
            r.filter_name += item.isName() ? plain_name(item.getName()) : std::string("?");
        }
    }
    if(r.compression == ImageCompression::Flate) {
        r.samples = stream_bytes(image, true);
    }
    if(auto w = d.getKey("/Width"); w.isInteger()) {
        r.w = w.getIntValueAsInt();
    }
    if(auto h = d.getKey("/Height"); h.isInteger()) {
        r.h = h.getIntValueAsInt();
    }
    if(auto b = d.getKey("/BitsPerComponent"); b.isInteger()) {
        r.bits_per_component = b.getIntValueAsInt();
    }
    if(auto m = d.getKey("/ImageMask"); m.isBool()) {
        r.is_mask = m.getBoolValue();
    }
    if(d.hasKey("/ColorSpace")) {
        r.colorspace = read_colorspace(d.getKey("/ColorSpace"), &r.icc_profile, &r.palette);
    }
    return r;
}

FontDescriptor describe_font(QPDFObjectHandle font) {
    FontDescriptor fd;
    if(!font.isDictionary()) {
        fd.subtype = SubtypeTag::Unknown;
        return fd;
    }
    if(font.hasKey("/Subtype")) {
        const auto s = name_entry(font, "/Subtype");
        fd.subtype = s ? subtype_tag(*s) : SubtypeTag::Unknown;
    }
    if(font.hasKey("/Type")) {
        const auto t = name_entry(font, "/Type");
        fd.type = t ? type_tag(*t) : TypeTag::Unknown;
    }
    fd.has_base_font = font.hasKey("/BaseFont");
    auto descendants = font.getKey("/DescendantFonts");
    if(descendants.isNull()) {
        fd.descendants = MissingDescendants{};
    } else if(descendants.isArray()) {
        std::vector<DescendantEntry> entries;
        for(const auto &item : descendants.getArrayAsVector()) {
            entries.push_back(describe_descendant(item));
        }
        fd.descendants = std::move(entries);
    } else {
        fd.descendants = MalformedDescendants{};
    }
    return fd;
}

PdfChunkBackend::PdfChunkBackend(PdfReader &source_) : source{source_}, chunk{source_} {}

size_t PdfChunkBackend::source_page_count() const { return source.num_pages(); }

rvoe<NoReturnValue> PdfChunkBackend::append_page(size_t source_index) {
    return chunk.append_page(source_index);
}

rvoe<NoReturnValue> PdfChunkBackend::remove_last_page() { return chunk.remove_last_page(); }

size_t PdfChunkBackend::chunk_page_count() const { return chunk.num_pages(); }

rvoe<uint64_t> PdfChunkBackend::serialized_size() { return chunk.serialized_size(); }

rvoe<uint64_t> PdfChunkBackend::save_chunk(const std::filesystem::path &ofname) {
    ERC(bytes, chunk.serialize());
    ERCV(write_file(ofname, bytes));
    return uint64_t(bytes.size());
}

void PdfChunkBackend::start_new_chunk() { chunk = ChunkDocument(source); }

rvoe<std::vector<ImageResource>> PdfChunkBackend::page_images(size_t chunk_page) {
    ERC(page, chunk.page(chunk_page));
    std::vector<ImageResource> images;
    try {
        for(const auto &[key, obj] : page.getImages()) {
            images.push_back(read_image_resource(plain_name(key), obj));
        }
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
    return images;
}

rvoe<NoReturnValue> PdfChunkBackend::replace_image(size_t chunk_page,
                                                   const std::string &name,
                                                   const OptimizedImage &image) {
    ERC(page, chunk.page(chunk_page));
    try {
        auto images = page.getImages();
        auto it = images.find("/" + name);
        if(it == images.end() || !it->second.isStream()) {
            RETERR(NoSuchResource);
        }
        auto &obj = it->second;
        obj.replaceStreamData(
            image.data, QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
        auto d = obj.getDict();
        d.replaceKey("/Width", QPDFObjectHandle::newInteger(image.w));
        d.replaceKey("/Height", QPDFObjectHandle::newInteger(image.h));
        switch(image.mode) {
        case PixelMode::Gray:
            d.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceGray"));
            break;
        case PixelMode::Cmyk:
            d.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceCMYK"));
            break;
        default:
            d.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
            break;
        }
        d.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
        d.removeKey("/Decode");
        d.removeKey("/DecodeParms");
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
    RETOK;
}

rvoe<QPDFObjectHandle> PdfChunkBackend::font_dict(size_t chunk_page) {
    ERC(page, chunk.page(chunk_page));
    try {
        auto resources = page.getAttribute("/Resources", false);
        if(!resources.isDictionary()) {
            return QPDFObjectHandle::newNull();
        }
        return resources.getKey("/Font");
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
}

rvoe<FontTable> PdfChunkBackend::page_fonts(size_t chunk_page) {
    ERC(fonts, font_dict(chunk_page));
    FontTable table;
    if(!fonts.isDictionary()) {
        return table;
    }
    try {
        for(const auto &key : fonts.getKeys()) {
            table.emplace_back(plain_name(key), describe_font(fonts.getKey(key)));
        }
    } catch(const std::exception &e) {
        return create_error(qpdf_error(e, ErrorCode::MalformedPdf));
    }
    return table;
}

rvoe<size_t> PdfChunkBackend::remove_fonts(size_t chunk_page,
                                           const std::vector<std::string> &names) {
    ERC(fonts, font_dict(chunk_page));
    if(!fonts.isDictionary()) {
        return size_t(0);
    }
    size_t removed = 0;
    for(const auto &name : names) {
        const auto key = "/" + name;
        if(fonts.hasKey(key)) {
            fonts.removeKey(key);
            ++removed;
        }
    }
    return removed;
}

} // namespace chunkpdf
