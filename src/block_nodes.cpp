/// @file block_nodes.cpp
/// @brief Block node constructors of MarkdownBuilder
///
/// This file defines the block-level constructs:
///
/// - Paragraphs and ATX headings (built with buildInline())
/// - Blockquotes (paragraph body, then line prefixes)
/// - Fenced code blocks (fence sized from the content)
/// - Horizontal rules and link reference definitions
///
/// Every block except the link reference definition ends with the block
/// terminator, a blank line.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "errors.h"
#include "inline_builder.h"
#include "markdown_strings.h"
#include "rules.h"
#include "utilities.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace markdown_strings_cpp {

namespace {

constexpr char kBlockTerminator[] = "\n\n";

// Minimum fence length of a fenced code block.
constexpr std::size_t kMinBlockFence = 3;

} // namespace

Node MarkdownBuilder::paragraph(Content const& content, bool escape) const {
    InlineSpec spec{Kind::Paragraph, "", kBlockTerminator, acceptedChildren(Kind::Paragraph)};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::heading(int level, Content const& content, bool escape) const {
    if (level < 1 || level > 6) {
        throw ValidationError("heading level must be between 1 and 6, got " + std::to_string(level));
    }
    InlineSpec spec{Kind::Heading, repeatChar('#', static_cast<std::size_t>(level)) + " ", kBlockTerminator,
                    acceptedChildren(Kind::Heading)};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::h1(Content const& content, bool escape) const { return heading(1, content, escape); }
Node MarkdownBuilder::h2(Content const& content, bool escape) const { return heading(2, content, escape); }
Node MarkdownBuilder::h3(Content const& content, bool escape) const { return heading(3, content, escape); }
Node MarkdownBuilder::h4(Content const& content, bool escape) const { return heading(4, content, escape); }
Node MarkdownBuilder::h5(Content const& content, bool escape) const { return heading(5, content, escape); }
Node MarkdownBuilder::h6(Content const& content, bool escape) const { return heading(6, content, escape); }

/**
 * @brief Render content as a quoted paragraph
 *
 * The body is rendered like a paragraph (same accepted kinds), right-trimmed,
 * and each line is prefixed. Blank lines become a bare `>` so the quote is
 * not interrupted.
 */
Node MarkdownBuilder::blockquote(Content const& content, bool escape) const {
    ensureEscapeAllowed(escape, options_.safeMode);

    Fragment body = renderContent(content, Kind::Blockquote, acceptedChildren(Kind::Blockquote),
                                  EscapeContext::Plain, escape);

    std::vector<std::string> lines = splitLines(trimTrailingWhitespace(body.text));
    for (auto& line : lines) {
        line = trimStr(line).empty() ? ">" : "> " + line;
    }
    return NodeFactory::make(Kind::Blockquote, joinStrings(lines, "\n") + kBlockTerminator,
                             body.escaped && escape);
}

Node MarkdownBuilder::codeBlock(std::string const& content, std::string const& language, bool escape) const {
    if (language.find_first_of("`\r\n") != std::string::npos) {
        throw ValidationError("code block language must not contain backticks or line breaks: \"" + language + "\"");
    }

    auto fenceAround = [&language](std::string const& body) {
        std::string fence = repeatChar('`', std::max(kMinBlockFence, longestBacktickRun(body) + 1));
        return fence + language + "\n" + body + "\n" + fence;
    };
    InlineSpec spec{Kind::CodeBlock, "", kBlockTerminator, acceptedChildren(Kind::CodeBlock),
                    EscapeContext::Code, fenceAround};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::horizontalRule() const {
    return NodeFactory::make(Kind::HorizontalRule, options_.hr + kBlockTerminator, true);
}

Node MarkdownBuilder::linkReference(std::string const& id, std::string const& url) const {
    std::string rendered = "[" + escapeText(id, EscapeContext::Url) + "]: " +
                           escapeText(url, EscapeContext::Url) + "\n";
    return NodeFactory::make(Kind::LinkReference, std::move(rendered), true);
}

} // namespace markdown_strings_cpp
