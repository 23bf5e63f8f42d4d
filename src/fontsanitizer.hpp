// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace chunkpdf {

enum class SubtypeTag {
    Absent,
    Type0,
    CIDFontType0,
    CIDFontType2,
    Type1,
    MMType1,
    TrueType,
    Type3,
    FontProgram, // Type1C, CIDFontType0C, OpenType
    Image,
    Form,
    Unknown,
};

enum class TypeTag {
    Absent,
    Font,
    FontDescriptor,
    Page,
    XObject,
    Unknown,
};

SubtypeTag subtype_tag(std::string_view subtype);
TypeTag type_tag(std::string_view type);

struct DescendantRecord {
    SubtypeTag subtype = SubtypeTag::Absent;
    TypeTag type = TypeTag::Absent;
    bool has_base_font = false;
    // CreationDate, ModDate or Producer.
    bool has_info_keys = false;
    bool has_filter = false;
    bool has_length = false;
    bool has_descendants = false;
    bool has_cid_system_info = false;
    bool has_widths = false;
};

struct NullDescendant {};

struct NonRecordDescendant {};

typedef std::variant<NullDescendant, NonRecordDescendant, DescendantRecord> DescendantEntry;

struct MissingDescendants {};

struct MalformedDescendants {};

typedef std::variant<MissingDescendants, MalformedDescendants, std::vector<DescendantEntry>>
    DescendantList;

struct FontDescriptor {
    SubtypeTag subtype = SubtypeTag::Absent;
    TypeTag type = TypeTag::Absent;
    bool has_base_font = false;
    DescendantList descendants = MissingDescendants{};
};

// Resource name to descriptor, in page resource order.
typedef std::vector<std::pair<std::string, FontDescriptor>> FontTable;

bool is_broken_descendant(const DescendantRecord &record);
bool is_broken_font(const FontDescriptor &font);

std::vector<std::string> find_broken_fonts(const FontTable &fonts);

} // namespace chunkpdf
