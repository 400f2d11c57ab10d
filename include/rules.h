/// @file rules.h
/// @brief Nesting rules: which child kinds each node kind may contain
///
/// Every composite constructor validates its children against a static
/// allow-list keyed by its own kind. Validation happens when the parent is
/// constructed, never later, so a Node always sits in a place its kind is
/// permitted.
///
/// @par Rule Table
/// | Parent | Accepted children |
/// |---|---|
/// | Bold | Text, Italic, Code, Strikethrough, Link, Bold |
/// | Italic | Text, Bold, Code, Strikethrough, Link, Italic |
/// | Strikethrough | Text, Bold, Italic, Code, Link |
/// | Link, ReferenceLink, Heading | Text, Bold, Italic, Code, Strikethrough |
/// | Paragraph, Blockquote | link text kinds + Image, LineBreak |
/// | BulletList, OrderedList, Checklist | paragraph kinds + Link, ReferenceLink, Paragraph |
/// | Table | link text kinds + Link, ReferenceLink, Image |
/// | Document | block kinds + LinkReference, Empty |
/// | everything else | nothing (raw text only) |
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_RULES_H
#define MARKDOWN_STRINGS_RULES_H

#include "node.h"

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace markdown_strings_cpp {

/// @class KindSet
/// @brief Compile-time set of node kinds
class KindSet {
public:
    constexpr KindSet() = default;

    constexpr KindSet(std::initializer_list<Kind> kinds) {
        for (Kind kind : kinds) {
            bits_ |= bit(kind);
        }
    }

    /// @brief Check membership
    constexpr bool contains(Kind kind) const noexcept {
        return (bits_ & bit(kind)) != 0;
    }

    /// @brief Set union
    constexpr KindSet operator|(KindSet other) const noexcept {
        KindSet result;
        result.bits_ = bits_ | other.bits_;
        return result;
    }

    constexpr bool empty() const noexcept { return bits_ == 0; }

    constexpr bool operator==(KindSet const& other) const = default;

    /// @brief Members in enumeration order
    std::vector<Kind> kinds() const;

private:
    static constexpr std::uint32_t bit(Kind kind) noexcept {
        return std::uint32_t{1} << static_cast<unsigned>(kind);
    }

    std::uint32_t bits_ = 0;
};

static_assert(kKindCount <= 32, "KindSet stores one bit per Kind");

/// @brief Kinds allowed inside link text, headings and reference-link text
inline constexpr KindSet kLinkTextAccepts{
    Kind::Text, Kind::Bold, Kind::Italic, Kind::Code, Kind::Strikethrough};

/// @brief Kinds allowed inside a paragraph
inline constexpr KindSet kParagraphAccepts =
    kLinkTextAccepts | KindSet{Kind::Image, Kind::LineBreak};

/// @brief Kinds a document accepts as top-level blocks
inline constexpr KindSet kBlockKinds{
    Kind::Paragraph, Kind::Heading, Kind::BulletList, Kind::OrderedList, Kind::Checklist,
    Kind::Table, Kind::Blockquote, Kind::CodeBlock, Kind::HorizontalRule, Kind::LinkReference};

/// @brief Permitted child kinds of a parent kind
///
/// @param[in] parent The kind of the node under construction
/// @return The allow-list; empty for kinds that only take raw text
KindSet acceptedChildren(Kind parent) noexcept;

/// @brief Require a child kind to be in an allow-list
///
/// @param[in] parent Kind of the node under construction (for the message)
/// @param[in] accepts Allow-list to check against
/// @param[in] child Kind of the candidate child
/// @throws InvalidNestingError if @p child is not in @p accepts
void ensureAccepted(Kind parent, KindSet accepts, Kind child);

/// @brief Require a child kind to be permitted by the rule table
/// @throws InvalidNestingError if acceptedChildren(parent) lacks @p child
void ensureAccepted(Kind parent, Kind child);

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_RULES_H
