// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <fontsanitizer.hpp>
#include <utils.hpp>

namespace chunkpdf {

SubtypeTag subtype_tag(std::string_view subtype) {
    if(subtype == "Type0") {
        return SubtypeTag::Type0;
    }
    if(subtype == "CIDFontType0") {
        return SubtypeTag::CIDFontType0;
    }
    if(subtype == "CIDFontType2") {
        return SubtypeTag::CIDFontType2;
    }
    if(subtype == "Type1") {
        return SubtypeTag::Type1;
    }
    if(subtype == "MMType1") {
        return SubtypeTag::MMType1;
    }
    if(subtype == "TrueType") {
        return SubtypeTag::TrueType;
    }
    if(subtype == "Type3") {
        return SubtypeTag::Type3;
    }
    if(subtype == "Type1C" || subtype == "CIDFontType0C" || subtype == "OpenType") {
        return SubtypeTag::FontProgram;
    }
    if(subtype == "Image") {
        return SubtypeTag::Image;
    }
    if(subtype == "Form") {
        return SubtypeTag::Form;
    }
    return SubtypeTag::Unknown;
}

TypeTag type_tag(std::string_view type) {
    if(type == "Font") {
        return TypeTag::Font;
    }
    if(type == "FontDescriptor") {
        return TypeTag::FontDescriptor;
    }
    if(type == "Page") {
        return TypeTag::Page;
    }
    if(type == "XObject") {
        return TypeTag::XObject;
    }
    return TypeTag::Unknown;
}

bool is_broken_descendant(const DescendantRecord &r) {
    switch(r.subtype) {
    case SubtypeTag::CIDFontType0:
    case SubtypeTag::CIDFontType2:
        // A proper CIDFont. Without a base font it can not be used.
        return !r.has_base_font;
    case SubtypeTag::FontProgram:
    case SubtypeTag::Image:
    case SubtypeTag::Type1:
    case SubtypeTag::MMType1:
    case SubtypeTag::TrueType:
    case SubtypeTag::Type3:
    case SubtypeTag::Type0:
        return true;
    case SubtypeTag::Absent:
    case SubtypeTag::Form:
    case SubtypeTag::Unknown:
        break;
    }
    if(r.type == TypeTag::Page || r.type == TypeTag::XObject) {
        return true;
    }
    if(r.has_info_keys) {
        return true;
    }
    if(r.has_filter && r.has_length && !r.has_base_font) {
        return true;
    }
    if(r.has_descendants) {
        return true;
    }
    if(r.subtype == SubtypeTag::Absent && !r.has_cid_system_info && !r.has_widths &&
       !r.has_base_font) {
        return true;
    }
    return false;
}

bool is_broken_font(const FontDescriptor &font) {
    if(font.subtype != SubtypeTag::Type0) {
        return false;
    }
    return std::visit(
        overloaded{
            [](const MissingDescendants &) { return true; },
            [](const MalformedDescendants &) { return true; },
            [](const std::vector<DescendantEntry> &entries) {
                for(const auto &entry : entries) {
                    const bool broken = std::visit(
                        overloaded{
                            [](const NullDescendant &) { return true; },
                            [](const NonRecordDescendant &) { return true; },
                            [](const DescendantRecord &r) { return is_broken_descendant(r); },
                        },
                        entry);
                    if(broken) {
                        return true;
                    }
                }
                return false;
            },
        },
        font.descendants);
}

std::vector<std::string> find_broken_fonts(const FontTable &fonts) {
    std::vector<std::string> broken;
    for(const auto &[name, font] : fonts) {
        if(is_broken_font(font)) {
            broken.push_back(name);
        }
    }
    return broken;
}

} // namespace chunkpdf
