// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <fontsanitizer.hpp>

#include <stdio.h>

using namespace chunkpdf;

namespace {

DescendantRecord cid_font() {
    DescendantRecord r;
    r.subtype = SubtypeTag::CIDFontType2;
    r.type = TypeTag::Font;
    r.has_base_font = true;
    r.has_cid_system_info = true;
    r.has_widths = true;
    return r;
}

FontDescriptor type0_with(std::vector<DescendantEntry> entries) {
    FontDescriptor fd;
    fd.subtype = SubtypeTag::Type0;
    fd.type = TypeTag::Font;
    fd.has_base_font = true;
    fd.descendants = std::move(entries);
    return fd;
}

int test_cid_base_font() {
    auto good = cid_font();
    if(is_broken_descendant(good)) {
        fprintf(stderr, "Proper CIDFontType2 classified broken.\n");
        return 1;
    }
    auto no_base = good;
    no_base.has_base_font = false;
    if(!is_broken_descendant(no_base)) {
        fprintf(stderr, "CIDFontType2 without base font classified fine.\n");
        return 1;
    }
    if(is_broken_font(type0_with({good})) || !is_broken_font(type0_with({no_base}))) {
        fprintf(stderr, "Font classification does not follow its descendant.\n");
        return 1;
    }
    return 0;
}

int test_page_as_descendant() {
    DescendantRecord page;
    page.type = TypeTag::Page;
    if(!is_broken_descendant(page)) {
        fprintf(stderr, "Page object as descendant not detected.\n");
        return 1;
    }
    // Even with keys that would make it look like a font.
    page.has_base_font = true;
    page.has_cid_system_info = true;
    page.has_widths = true;
    if(!is_broken_descendant(page)) {
        fprintf(stderr, "Page object with font keys not detected.\n");
        return 1;
    }
    DescendantRecord image;
    image.subtype = SubtypeTag::Image;
    image.type = TypeTag::XObject;
    image.has_filter = true;
    image.has_length = true;
    if(!is_broken_descendant(image)) {
        fprintf(stderr, "Image as descendant not detected.\n");
        return 1;
    }
    return 0;
}

int test_descendant_shapes() {
    FontDescriptor missing;
    missing.subtype = SubtypeTag::Type0;
    missing.descendants = MissingDescendants{};
    FontDescriptor malformed;
    malformed.subtype = SubtypeTag::Type0;
    malformed.descendants = MalformedDescendants{};
    if(!is_broken_font(missing) || !is_broken_font(malformed)) {
        fprintf(stderr, "Type0 without a descendant list classified fine.\n");
        return 1;
    }
    if(!is_broken_font(type0_with({NullDescendant{}})) ||
       !is_broken_font(type0_with({NonRecordDescendant{}}))) {
        fprintf(stderr, "Null or non dictionary descendant classified fine.\n");
        return 1;
    }
    if(!is_broken_font(type0_with({cid_font(), NullDescendant{}}))) {
        fprintf(stderr, "A single bad descendant must break the font.\n");
        return 1;
    }
    // Empty list has nothing wrong in it.
    if(is_broken_font(type0_with({}))) {
        fprintf(stderr, "Empty descendant list classified broken.\n");
        return 1;
    }
    return 0;
}

int test_heuristics() {
    DescendantRecord info;
    info.has_info_keys = true;
    info.has_cid_system_info = true;
    DescendantRecord stream;
    stream.has_filter = true;
    stream.has_length = true;
    stream.has_cid_system_info = true;
    DescendantRecord nested;
    nested.has_descendants = true;
    nested.has_base_font = true;
    DescendantRecord empty;
    DescendantRecord program;
    program.subtype = SubtypeTag::FontProgram;
    program.has_base_font = true;
    for(const auto &r : {info, stream, nested, empty, program}) {
        if(!is_broken_descendant(r)) {
            fprintf(stderr, "Broken descendant shape not detected.\n");
            return 1;
        }
    }
    // A CIDFont missing its Subtype but still carrying CID keys is kept.
    DescendantRecord untyped;
    untyped.has_cid_system_info = true;
    untyped.has_widths = true;
    if(is_broken_descendant(untyped)) {
        fprintf(stderr, "Descendant with CID keys classified broken.\n");
        return 1;
    }
    return 0;
}

int test_find_broken() {
    FontDescriptor simple;
    simple.subtype = SubtypeTag::Type1;
    simple.has_base_font = true;
    FontDescriptor type0_missing;
    type0_missing.subtype = SubtypeTag::Type0;
    FontTable table;
    table.emplace_back("F1", simple);
    table.emplace_back("F2", type0_with({cid_font()}));
    table.emplace_back("F3", type0_missing);
    table.emplace_back("F4", type0_with({NullDescendant{}}));
    const auto broken = find_broken_fonts(table);
    if(broken.size() != 2 || broken[0] != "F3" || broken[1] != "F4") {
        fprintf(stderr, "Wrong set of broken fonts.\n");
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    if(test_cid_base_font() != 0) {
        return 1;
    }
    if(test_page_as_descendant() != 0) {
        return 1;
    }
    if(test_descendant_shapes() != 0) {
        return 1;
    }
    if(test_heuristics() != 0) {
        return 1;
    }
    if(test_find_broken() != 0) {
        return 1;
    }
    return 0;
}
