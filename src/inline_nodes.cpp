/// @file inline_nodes.cpp
/// @brief Inline node constructors of MarkdownBuilder
///
/// This file defines the span-level constructs:
///
/// - Text, bold, italic, strikethrough
/// - Inline code (fence sized from the content)
/// - Links, images and reference links
/// - Line breaks and the empty node
///
/// All of them except the fixed line break and empty node go through
/// buildInline().
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "inline_builder.h"
#include "markdown_strings.h"
#include "rules.h"
#include "utilities.h"

#include <cstddef>
#include <string>

namespace markdown_strings_cpp {

namespace {

// A code span whose content starts or ends with a backtick, or is wrapped in
// spaces, needs one space of padding inside the fence. CommonMark strips one
// such space from each side when rendering.
bool codeSpanNeedsPadding(std::string const& content) {
    if (content.empty()) return false;
    if (content.front() == '`' || content.back() == '`') return true;
    if (content.size() >= 2 && content.front() == ' ' && content.back() == ' ') {
        return content.find_first_not_of(' ') != std::string::npos;
    }
    return false;
}

// A line ending inside a code span renders as a space, and a blank line would
// end the span and its paragraph, so each one is written as a space.
std::string foldLineEndings(std::string const& content) {
    std::string output;
    output.reserve(content.size());
    for (std::size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
            continue;
        }
        output.push_back((c == '\r' || c == '\n') ? ' ' : c);
    }
    return output;
}

std::string wrapInCodeFence(std::string const& literal) {
    std::string content = foldLineEndings(literal);
    std::string fence = repeatChar('`', longestBacktickRun(content) + 1);
    std::string pad = codeSpanNeedsPadding(content) ? " " : "";
    return fence + pad + content + pad + fence;
}

} // namespace

Node MarkdownBuilder::text(std::string const& value, bool escape) const {
    InlineSpec spec{Kind::Text, "", "", acceptedChildren(Kind::Text)};
    return buildInline(spec, value, escape, options_.safeMode);
}

Node MarkdownBuilder::bold(Content const& content, bool escape) const {
    InlineSpec spec{Kind::Bold, options_.strongDelimiter, options_.strongDelimiter,
                    acceptedChildren(Kind::Bold)};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::italic(Content const& content, bool escape) const {
    InlineSpec spec{Kind::Italic, options_.emDelimiter, options_.emDelimiter,
                    acceptedChildren(Kind::Italic)};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::strikethrough(Content const& content, bool escape) const {
    InlineSpec spec{Kind::Strikethrough, "~~", "~~", acceptedChildren(Kind::Strikethrough)};
    return buildInline(spec, content, escape, options_.safeMode);
}

// Code content is literal apart from line endings; only the fence depends on it.
Node MarkdownBuilder::code(std::string const& content, bool escape) const {
    InlineSpec spec{Kind::Code, "", "", acceptedChildren(Kind::Code), EscapeContext::Code, wrapInCodeFence};
    return buildInline(spec, content, escape, options_.safeMode);
}

Node MarkdownBuilder::link(Content const& text, std::string const& url, bool escape) const {
    std::string destination = escapeText(url, EscapeContext::Url);
    InlineSpec spec{Kind::Link, "[", "](" + destination + ")", acceptedChildren(Kind::Link)};
    return buildInline(spec, text, escape, options_.safeMode);
}

Node MarkdownBuilder::image(std::string const& altText, std::string const& url, bool escape) const {
    std::string destination = escapeText(url, EscapeContext::Url);
    InlineSpec spec{Kind::Image, "![", "](" + destination + ")", acceptedChildren(Kind::Image)};
    return buildInline(spec, altText, escape, options_.safeMode);
}

Node MarkdownBuilder::lineBreak() const {
    return NodeFactory::make(Kind::LineBreak, "  \n", true);
}

Node MarkdownBuilder::empty() const {
    return NodeFactory::make(Kind::Empty, "", true);
}

Node MarkdownBuilder::referenceLink(Content const& text, std::string const& id, bool escape) const {
    std::string label = escapeText(id, EscapeContext::Url);
    InlineSpec spec{Kind::ReferenceLink, "[", "][" + label + "]", acceptedChildren(Kind::ReferenceLink)};
    return buildInline(spec, text, escape, options_.safeMode);
}

} // namespace markdown_strings_cpp
