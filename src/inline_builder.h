/// @file inline_builder.h
/// @brief Shared combinator behind the delimiter-wrapped constructors
///
/// Bold, italic, strikethrough, links, headings, paragraphs and code all follow
/// the same recipe: normalise the content, escape literal pieces or validate
/// child nodes, concatenate, optionally post-process, wrap with delimiters.
/// They differ only in the InlineSpec they pass to buildInline().
///
/// Internal to the library: this header is not installed, so NodeFactory is
/// out of reach of callers and every Node comes from a constructor.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_INLINE_BUILDER_H
#define MARKDOWN_STRINGS_INLINE_BUILDER_H

#include "content.h"
#include "node.h"
#include "rules.h"
#include "utilities.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace markdown_strings_cpp {

/// @class NodeFactory
/// @brief The only way to create a Node
///
/// Used by the constructors of this library only. A node built here carries
/// whatever taint flag it is given.
class NodeFactory {
public:
    static Node make(Kind kind, std::string text, bool escaped);
};

/// @struct Fragment
/// @brief Rendered text together with its taint flag
struct Fragment {
    std::string text;
    bool escaped = true;
};

/// @struct InlineSpec
/// @brief Parameters of one buildInline() use
///
/// @code{.cpp}
/// InlineSpec strike{Kind::Strikethrough, "~~", "~~", acceptedChildren(Kind::Strikethrough)};
/// Node n = buildInline(strike, "gone", true, false); // "~~gone~~"
/// @endcode
struct InlineSpec {
    InlineSpec(Kind kind, std::string left, std::string right, KindSet accepts,
               EscapeContext context = EscapeContext::Plain,
               std::function<std::string(std::string const&)> postProcess = {}) :
        kind(kind),
        left(std::move(left)),
        right(std::move(right)),
        accepts(accepts),
        context(context),
        postProcess(std::move(postProcess))
    {}

    Kind kind;                     ///< Kind of the resulting node
    std::string left;              ///< Prepended to the body
    std::string right;             ///< Appended to the body
    KindSet accepts;               ///< Child kinds allowed in the content
    EscapeContext context;         ///< Context for literal pieces

    /// @brief Optional transform of the concatenated body
    ///
    /// Runs before the delimiters are added. Used by code spans and fenced
    /// blocks, whose fence depends on the body.
    std::function<std::string(std::string const&)> postProcess;
};

/// @brief Reject an unescaped request when safe mode is active
/// @throws SafeModeError if @p escape is false and @p safeMode is true
void ensureEscapeAllowed(bool escape, bool safeMode);

/// @brief Flatten content into its ordered items
///
/// A literal or node becomes a one-item list, a sequence is returned in order.
///
/// @param[in] content The content to normalise
/// @param[in] owner Kind under construction (for the error message)
/// @return The items, none of which is a sequence
/// @throws TypeMismatchError if a sequence contains a sequence
std::vector<Content> normalizeContent(Content const& content, Kind owner);

/// @brief Render one literal or node item
///
/// Literals are escaped under @p context when @p escape is true and passed
/// through otherwise. Nodes are validated against @p accepts and spliced
/// verbatim, contributing their own flag.
///
/// @throws InvalidNestingError if a node's kind is not in @p accepts
/// @throws TypeMismatchError if @p item is a sequence
Fragment renderItem(Content const& item, Kind owner, KindSet accepts, EscapeContext context, bool escape);

/// @brief Render and concatenate every item of some content
///
/// The resulting flag starts as @p escape and is ANDed with each child's.
Fragment renderContent(Content const& content, Kind owner, KindSet accepts, EscapeContext context, bool escape);

/// @brief Build a delimiter-wrapped node
///
/// @param[in] spec Kind, delimiters, allow-list, context and post-processing
/// @param[in] content Body of the node
/// @param[in] escape Whether literal pieces are escaped
/// @param[in] safeMode Whether unescaped requests are forbidden
/// @return The new node
/// @throws SafeModeError, InvalidNestingError, TypeMismatchError
Node buildInline(InlineSpec const& spec, Content const& content, bool escape, bool safeMode);

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_INLINE_BUILDER_H
