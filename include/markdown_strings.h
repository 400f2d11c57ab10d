/// @file markdown_strings.h
/// @brief Build GitHub-flavoured Markdown from typed, composable nodes
///
/// markdown_strings.cpp generates Markdown text fragments that are safe by
/// construction. Literal input is always escaped unless a caller explicitly
/// asks otherwise with `escape = false`, and every node records whether its
/// subtree contains such unescaped input.
///
/// Nodes compose upward: inline nodes are built from strings and other inline
/// nodes, blocks from inline nodes, a document from blocks. Each composite
/// checks its children's kinds against the nesting rules (see rules.h) when it
/// is built.
///
/// @code{.cpp}
/// using namespace markdown_strings_cpp;
///
/// Node doc = document({
///     h1("Release notes"),
///     paragraph({"Fixed ", bold("2_000"), " bugs"}),
///     table({"Name", "Value"}, {{"a|b", "1"}}),
/// });
/// // doc.text():
/// // # Release notes
/// // Fixed **2\_000** bugs
/// // Name | Value
/// // --- | ---
/// // a\|b | 1
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_H
#define MARKDOWN_STRINGS_H

#include "content.h"
#include "errors.h"
#include "node.h"
#include "rules.h"
#include "utilities.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace markdown_strings_cpp {

/// @struct MarkdownOptions
/// @brief Configuration options for a MarkdownBuilder
///
/// The defaults produce the canonical output documented for every
/// constructor. They are validated when passed to a builder.
///
/// @code{.cpp}
/// MarkdownOptions options;
/// options.emDelimiter = "_";
/// options.safeMode = true;
/// MarkdownBuilder builder(options);
/// builder.italic("note").text(); // "_note_"
/// @endcode
struct MarkdownOptions {
    /// @brief Strong (bold) delimiter
    ///
    /// Either "**" or "__"
    std::string strongDelimiter;

    /// @brief Emphasis (italic) delimiter
    ///
    /// Either "*" or "_"
    std::string emDelimiter;

    /// @brief Bullet list marker, also used by checklists
    ///
    /// Valid values: "-", "*", "+"
    std::string bulletListMarker;

    /// @brief Thematic break (horizontal rule) representation
    ///
    /// One of "---", "***", "___", "- - -", "* * *", "_ _ _"
    std::string hr;

    /// @brief Reject every `escape = false` request
    ///
    /// When true, any constructor called with `escape = false` throws
    /// SafeModeError instead of emitting unescaped content.
    bool safeMode;

    /// @brief Constructor that sets default option values
    MarkdownOptions();
};

/// @enum Alignment
/// @brief Column alignment of a table
enum class Alignment {
    Left,   ///< `:---`
    Center, ///< `:---:`
    Right   ///< `---:`
};

/// @brief Parse an alignment token
/// @param[in] token One of "left", "center", "right"
/// @return The matching alignment
/// @throws ValidationError for any other token
Alignment parseAlignment(std::string const& token);

/// @class MarkdownBuilder
/// @brief Node constructors bound to a set of options
///
/// A builder carries its configuration explicitly, so code running with
/// different policies (or tests running side by side) never observe each
/// other. The free functions at the end of this header forward to a builder
/// seeded from the process-wide safe-mode flag.
///
/// Every constructor taking an `escape` flag escapes literal input when it
/// is true (the default). Passing false emits literal input unchanged, marks
/// the result `escaped() == false`, and is rejected in safe mode.
class MarkdownBuilder {
public:
    /// @brief Construct a builder with default options
    MarkdownBuilder();

    /// @brief Construct a builder with custom options
    /// @param[in] options Configuration options
    /// @throws ValidationError if an option has a disallowed value
    explicit MarkdownBuilder(MarkdownOptions options);

    /// @brief Configure options using a callback function
    /// @param[in] fn A function that receives and modifies the options
    /// @return Reference to this builder for chaining
    /// @throws ValidationError if the modified options are invalid; the
    ///         previous options are kept in that case
    MarkdownBuilder& configureOptions(std::function<void(MarkdownOptions&)> fn);

    /// @brief Get read-only access to options
    MarkdownOptions const& options() const;

    /// @name Inline nodes
    /// @{

    /// @brief Plain text fragment
    Node text(std::string const& value, bool escape = true) const;

    /// @brief Strong emphasis: `**content**`
    Node bold(Content const& content, bool escape = true) const;

    /// @brief Emphasis: `*content*`
    Node italic(Content const& content, bool escape = true) const;

    /// @brief Strikethrough: `~~content~~`
    Node strikethrough(Content const& content, bool escape = true) const;

    /// @brief Inline code span
    ///
    /// The content is rendered literally. The fence is one backtick longer
    /// than the longest backtick run inside the content, and a space pads the
    /// content when it starts or ends with a backtick (or is wrapped in
    /// spaces) so the fence stays unambiguous.
    ///
    /// @code{.cpp}
    /// code("a `b` c").text(); // "``a `b` c``"
    /// @endcode
    Node code(std::string const& content, bool escape = true) const;

    /// @brief Inline link: `[text](url)`
    ///
    /// The url is always escaped in the Url context; @p escape only controls
    /// the visible text.
    Node link(Content const& text, std::string const& url, bool escape = true) const;

    /// @brief Image: `![alt](url)`
    ///
    /// The url is always escaped in the Url context; @p escape only controls
    /// the alternative text.
    Node image(std::string const& altText, std::string const& url, bool escape = true) const;

    /// @brief Hard line break: two spaces and a newline
    Node lineBreak() const;

    /// @brief Empty fragment
    Node empty() const;

    /// @brief Reference-style link: `[text][id]`
    ///
    /// The matching definition is produced by linkReference(); keeping ids
    /// unique across a document is up to the caller.
    Node referenceLink(Content const& text, std::string const& id, bool escape = true) const;

    /// @}

    /// @name Block nodes
    /// @{

    /// @brief Paragraph terminated by a blank line
    Node paragraph(Content const& content, bool escape = true) const;

    /// @brief ATX heading: `# content` followed by a blank line
    /// @param[in] level Heading level in [1, 6]
    /// @throws ValidationError if @p level is out of range
    Node heading(int level, Content const& content, bool escape = true) const;

    Node h1(Content const& content, bool escape = true) const;
    Node h2(Content const& content, bool escape = true) const;
    Node h3(Content const& content, bool escape = true) const;
    Node h4(Content const& content, bool escape = true) const;
    Node h5(Content const& content, bool escape = true) const;
    Node h6(Content const& content, bool escape = true) const;

    /// @brief Block quote
    ///
    /// The content is rendered as a paragraph, then every non-blank line is
    /// prefixed with `> ` and every blank line replaced with `>`.
    Node blockquote(Content const& content, bool escape = true) const;

    /// @brief Fenced code block
    ///
    /// The fence has at least three backticks and is longer than any backtick
    /// run in the content, which is rendered literally.
    ///
    /// @param[in] content Code to render
    /// @param[in] language Info string placed after the opening fence
    /// @throws ValidationError if @p language contains a backtick or line break
    Node codeBlock(std::string const& content, std::string const& language = {}, bool escape = true) const;

    /// @brief Thematic break, `---` by default
    Node horizontalRule() const;

    /// @brief Link reference definition: `[id]: url`
    ///
    /// Both halves are escaped in the Url context, the same way
    /// referenceLink() escapes its id.
    Node linkReference(std::string const& id, std::string const& url) const;

    /// @}

    /// @name Container nodes
    /// @{

    /// @brief Join blocks into a document
    ///
    /// Each child's text is stripped of trailing newlines and the children
    /// are joined with a single newline.
    ///
    /// @throws InvalidNestingError if a child is not a block kind
    Node document(std::vector<Node> const& children) const;

    /// @brief Unordered list
    ///
    /// Each item is a literal, a node, or a sequence rendering a nested list
    /// under the preceding item, indented by two spaces per level.
    Node bulletList(Content const& items, bool escape = true) const;

    /// @brief Ordered list numbered from @p start
    /// @throws ValidationError if @p start is less than 1
    Node orderedList(Content const& items, int start = 1, bool escape = true) const;

    /// @brief GFM task list
    ///
    /// @param[in] items List items
    /// @param[in] checked One flag per item; absent means all unchecked
    /// @throws ValidationError if @p checked does not have one entry per item
    Node checklist(Content const& items, std::optional<std::vector<bool>> const& checked = std::nullopt,
                   bool escape = true) const;

    /// @brief GFM table
    ///
    /// @param[in] headers Header cells; at least one
    /// @param[in] rows Data rows, each with one cell per header
    /// @param[in] alignment Empty, or one of "left", "center", "right" per column
    /// @throws ValidationError on an empty header, a row of the wrong width,
    ///         a bad alignment list, or a cell spanning several lines
    Node table(std::vector<Content> const& headers,
               std::vector<std::vector<Content>> const& rows,
               std::vector<std::string> const& alignment = {},
               bool escape = true) const;

    /// @}

private:
    Node listNode(Kind kind, Content const& items, int start,
                  std::vector<bool> const* checked, bool escape) const;

    MarkdownOptions options_;
};

/// @brief Enable or disable process-wide safe mode
///
/// Affects the free constructor functions below. Configure it before
/// spawning threads that build nodes; concurrent toggling is not ordered
/// against construction.
void setSafeMode(bool enabled);

/// @brief Check whether process-wide safe mode is active
bool isSafeMode();

/// @brief Builder seeded from the process-wide safe-mode flag
///
/// Used by the free functions; reflects the flag at the time of the call.
MarkdownBuilder defaultBuilder();

/// @name Free constructor functions
/// Convenience wrappers over defaultBuilder().
/// @{
Node text(std::string const& value, bool escape = true);
Node bold(Content const& content, bool escape = true);
Node italic(Content const& content, bool escape = true);
Node strikethrough(Content const& content, bool escape = true);
Node code(std::string const& content, bool escape = true);
Node link(Content const& text, std::string const& url, bool escape = true);
/// @brief link() for two string literals
///
/// POSIX `<unistd.h>` declares `::link(const char*, const char*)`, which
/// creates a hard link. With `using namespace markdown_strings_cpp;` an
/// unqualified `link("text", "url")` would otherwise resolve to it silently;
/// this exact-match overload turns that call into an ambiguity error. Qualify
/// the call, or use MarkdownBuilder::link().
Node link(char const* text, char const* url, bool escape = true);
Node image(std::string const& altText, std::string const& url, bool escape = true);
Node lineBreak();
Node empty();
Node referenceLink(Content const& text, std::string const& id, bool escape = true);
Node paragraph(Content const& content, bool escape = true);
Node heading(int level, Content const& content, bool escape = true);
Node h1(Content const& content, bool escape = true);
Node h2(Content const& content, bool escape = true);
Node h3(Content const& content, bool escape = true);
Node h4(Content const& content, bool escape = true);
Node h5(Content const& content, bool escape = true);
Node h6(Content const& content, bool escape = true);
Node blockquote(Content const& content, bool escape = true);
Node codeBlock(std::string const& content, std::string const& language = {}, bool escape = true);
Node horizontalRule();
Node linkReference(std::string const& id, std::string const& url);
Node document(std::vector<Node> const& children);
Node bulletList(Content const& items, bool escape = true);
Node orderedList(Content const& items, int start = 1, bool escape = true);
Node checklist(Content const& items, std::optional<std::vector<bool>> const& checked = std::nullopt,
               bool escape = true);
Node table(std::vector<Content> const& headers,
           std::vector<std::vector<Content>> const& rows,
           std::vector<std::string> const& alignment = {},
           bool escape = true);
/// @}

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_H
