/// @file rules.cpp
/// @brief Implementation of the nesting rule table
///
/// The table is an exhaustive switch over Kind: adding an enumerator without
/// giving it a rule fails the build (-Werror=switch).
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "rules.h"
#include "errors.h"

#include <cstddef>
#include <vector>

namespace markdown_strings_cpp {

namespace {

constexpr KindSet kBoldAccepts{
    Kind::Text, Kind::Italic, Kind::Code, Kind::Strikethrough, Kind::Link, Kind::Bold};

constexpr KindSet kItalicAccepts{
    Kind::Text, Kind::Bold, Kind::Code, Kind::Strikethrough, Kind::Link, Kind::Italic};

// Strikethrough cannot contain strikethrough.
constexpr KindSet kStrikethroughAccepts{
    Kind::Text, Kind::Bold, Kind::Italic, Kind::Code, Kind::Link};

constexpr KindSet kListItemAccepts =
    kParagraphAccepts | KindSet{Kind::Link, Kind::ReferenceLink, Kind::Paragraph};

constexpr KindSet kTableCellAccepts =
    kLinkTextAccepts | KindSet{Kind::Link, Kind::ReferenceLink, Kind::Image};

constexpr KindSet kDocumentAccepts = kBlockKinds | KindSet{Kind::Empty};

} // namespace

std::vector<Kind> KindSet::kinds() const {
    std::vector<Kind> result;
    for (std::size_t i = 0; i < kKindCount; ++i) {
        Kind kind = static_cast<Kind>(i);
        if (contains(kind)) {
            result.push_back(kind);
        }
    }
    return result;
}

KindSet acceptedChildren(Kind parent) noexcept {
    switch (parent) {
        case Kind::Bold: return kBoldAccepts;
        case Kind::Italic: return kItalicAccepts;
        case Kind::Strikethrough: return kStrikethroughAccepts;
        case Kind::Link:
        case Kind::ReferenceLink:
        case Kind::Heading:
            return kLinkTextAccepts;
        // Blockquote reuses the paragraph set: no nested quotes or lists.
        case Kind::Paragraph:
        case Kind::Blockquote:
            return kParagraphAccepts;
        case Kind::BulletList:
        case Kind::OrderedList:
        case Kind::Checklist:
            return kListItemAccepts;
        case Kind::Table: return kTableCellAccepts;
        case Kind::Document: return kDocumentAccepts;
        case Kind::Text:
        case Kind::Code:
        case Kind::Image:
        case Kind::LineBreak:
        case Kind::CodeBlock:
        case Kind::HorizontalRule:
        case Kind::LinkReference:
        case Kind::Empty:
            return KindSet{};
    }
    return KindSet{};
}

void ensureAccepted(Kind parent, KindSet accepts, Kind child) {
    if (!accepts.contains(child)) {
        throw InvalidNestingError(parent, child);
    }
}

void ensureAccepted(Kind parent, Kind child) {
    ensureAccepted(parent, acceptedChildren(parent), child);
}

} // namespace markdown_strings_cpp
