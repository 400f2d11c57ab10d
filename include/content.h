/// @file content.h
/// @brief Heterogeneous content accepted by the node constructors
///
/// Constructors take their body as a Content value, which is exactly one of:
///
/// - a literal string, escaped by the receiving constructor
/// - a previously built Node, validated against the constructor's nesting
///   rules and spliced verbatim
/// - a sequence of Content values, processed in order
///
/// Implicit conversions keep call sites close to the Markdown they describe:
///
/// @code{.cpp}
/// Node p = paragraph({"Read ", bold("this"), " first."});
/// Node l = bulletList({"one", "two", {"nested a", "nested b"}});
/// @endcode
///
/// Only list constructors give a sequence nested inside a sequence a meaning
/// (a sub-list); everywhere else it is rejected with TypeMismatchError.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_CONTENT_H
#define MARKDOWN_STRINGS_CONTENT_H

#include "node.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace markdown_strings_cpp {

/// @class Content
/// @brief Literal text, a child Node, or an ordered sequence of either
class Content {
public:
    /// @typedef Sequence
    /// @brief Ordered list of content items
    using Sequence = std::vector<Content>;

    /// @brief Absent content, equivalent to an empty literal
    Content();

    Content(std::string text);
    Content(std::string_view text);
    Content(char const* text);
    Content(Node node);
    Content(Sequence items);
    Content(std::initializer_list<Content> items);

    /// @brief Build a sequence of literals
    Content(std::vector<std::string> const& items);

    /// @brief Build a sequence of child nodes
    Content(std::vector<Node> const& items);

    bool isLiteral() const noexcept;
    bool isNode() const noexcept;
    bool isSequence() const noexcept;

    /// @brief The literal text
    /// @pre isLiteral()
    std::string const& literal() const;

    /// @brief The child node
    /// @pre isNode()
    Node const& node() const;

    /// @brief The sequence items
    /// @pre isSequence()
    Sequence const& sequence() const;

    /// @brief Underlying variant, for std::visit
    std::variant<std::string, Node, Sequence> const& value() const noexcept { return value_; }

private:
    std::variant<std::string, Node, Sequence> value_;
};

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_CONTENT_H
