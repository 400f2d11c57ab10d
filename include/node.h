/// @file node.h
/// @brief Immutable Markdown fragment produced by the node constructors
///
/// A Node is the terminal value of every constructor call. It carries:
///
/// - the kind of construct it represents (bold, paragraph, table...)
/// - the fully rendered Markdown of itself and all of its descendants
/// - the `escaped` taint flag
///
/// Composition copies rendered text: a parent never holds a reference to its
/// children, and a child's text is never escaped a second time. The taint flag
/// is true only if every piece of literal input reachable in the subtree went
/// through the escaping engine (or is fixed boilerplate such as `---`). It is
/// the logical AND of the node's own escaping decision and all of its
/// children's flags, so a single unescaped leaf makes every ancestor unescaped.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_NODE_H
#define MARKDOWN_STRINGS_NODE_H

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace markdown_strings_cpp {

/// @enum Kind
/// @brief Closed set of Markdown constructs a Node can represent
enum class Kind {
    Text,           ///< Plain text fragment
    Bold,           ///< `**strong**`
    Italic,         ///< `*emphasis*`
    Code,           ///< Inline code span
    Strikethrough,  ///< `~~deleted~~`
    Link,           ///< `[text](url)`
    Image,          ///< `![alt](url)`
    LineBreak,      ///< Hard line break (two spaces + newline)
    ReferenceLink,  ///< `[text][id]`
    Paragraph,      ///< Paragraph block
    Heading,        ///< ATX heading block
    Blockquote,     ///< `> quoted` block
    CodeBlock,      ///< Fenced code block
    Document,       ///< Sequence of blocks
    BulletList,     ///< `- item` list
    OrderedList,    ///< `1. item` list
    Checklist,      ///< `- [ ] task` list
    Table,          ///< GFM table
    HorizontalRule, ///< Thematic break
    LinkReference,  ///< `[id]: url` definition
    Empty           ///< Empty fragment
};

/// @brief Number of enumerators in Kind
inline constexpr std::size_t kKindCount = static_cast<std::size_t>(Kind::Empty) + 1;

/// @brief Symbolic snake_case name of a kind (e.g. "line_break")
/// @param[in] kind The kind to name
/// @return Name used in error messages and debug output
std::string_view kindName(Kind kind) noexcept;

/// @brief Check if a kind is a block-level construct
///
/// Block kinds are those a Document accepts: paragraph, heading, the three
/// lists, table, blockquote, code block, horizontal rule and link reference.
///
/// @param[in] kind The kind to classify
/// @retval true if the kind renders as a block
/// @retval false for inline kinds and Empty
bool isBlockKind(Kind kind) noexcept;

class NodeFactory;

/// @class Node
/// @brief Rendered Markdown fragment with its kind and taint flag
///
/// Nodes can only be created by the library's constructors, so a node that
/// reports `escaped() == true` was really built from escaped input. They are
/// cheap to copy and safe to share between threads once built.
///
/// @code{.cpp}
/// Node title = heading(1, "Title");
/// title.kind();    // Kind::Heading
/// title.text();    // "# Title\n\n"
/// title.escaped(); // true
/// @endcode
class Node {
public:
    /// @brief The construct this node represents
    Kind kind() const noexcept { return kind_; }

    /// @brief Rendered Markdown of this node and its descendants
    std::string const& text() const noexcept { return text_; }

    /// @brief True if no literal content in this subtree bypassed escaping
    bool escaped() const noexcept { return escaped_; }

    bool operator==(Node const& other) const = default;

private:
    friend class NodeFactory;

    Node(Kind kind, std::string text, bool escaped);

    Kind kind_;
    std::string text_;
    bool escaped_;
};

/// @brief Write a debug representation of a node
///
/// Format: `Node(kind=bold, escaped=true, text="**x**")`, with newlines in
/// the text shown as `\n`.
std::ostream& operator<<(std::ostream& os, Node const& node);

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_NODE_H
