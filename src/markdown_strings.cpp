/// @file markdown_strings.cpp
/// @brief Options, MarkdownBuilder setup, safe mode and free functions
///
/// The node constructors themselves live in inline_nodes.cpp,
/// block_nodes.cpp and container_nodes.cpp.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "markdown_strings.h"
#include "errors.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace markdown_strings_cpp {

/**
 * @brief Initialize options with default values
 *
 * The defaults produce the canonical rendering of every construct:
 * `**bold**`, `*italic*`, `- item` and `---`.
 */
MarkdownOptions::MarkdownOptions() :
    strongDelimiter("**"),
    emDelimiter("*"),
    bulletListMarker("-"),
    hr("---"),
    safeMode(false)
{}

namespace {

std::atomic<bool> gSafeMode{false};

template <std::size_t N>
bool isOneOf(std::string const& value, std::array<std::string_view, N> const& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

/**
 * @brief Reject option values that would produce broken Markdown
 *
 * @throws ValidationError naming the offending option and value
 */
void validateOptions(MarkdownOptions const& options) {
    static constexpr std::array<std::string_view, 2> kStrong{"**", "__"};
    static constexpr std::array<std::string_view, 2> kEm{"*", "_"};
    static constexpr std::array<std::string_view, 3> kBullets{"-", "*", "+"};
    static constexpr std::array<std::string_view, 6> kRules{"---", "***", "___", "- - -", "* * *", "_ _ _"};

    if (!isOneOf(options.strongDelimiter, kStrong)) {
        throw ValidationError("strongDelimiter must be \"**\" or \"__\", got \"" + options.strongDelimiter + "\"");
    }
    if (!isOneOf(options.emDelimiter, kEm)) {
        throw ValidationError("emDelimiter must be \"*\" or \"_\", got \"" + options.emDelimiter + "\"");
    }
    if (!isOneOf(options.bulletListMarker, kBullets)) {
        throw ValidationError("bulletListMarker must be one of -, *, +, got \"" + options.bulletListMarker + "\"");
    }
    if (!isOneOf(options.hr, kRules)) {
        throw ValidationError("hr is not a valid thematic break: \"" + options.hr + "\"");
    }
}

} // namespace

Alignment parseAlignment(std::string const& token) {
    if (token == "left") return Alignment::Left;
    if (token == "center") return Alignment::Center;
    if (token == "right") return Alignment::Right;
    throw ValidationError("Invalid alignment value '" + token + "', must be left|center|right");
}

MarkdownBuilder::MarkdownBuilder() : MarkdownBuilder(MarkdownOptions()) {}

MarkdownBuilder::MarkdownBuilder(MarkdownOptions options) : options_(std::move(options)) {
    validateOptions(options_);
}

// Applies `fn` to a copy so invalid options leave the builder untouched.
MarkdownBuilder& MarkdownBuilder::configureOptions(std::function<void(MarkdownOptions&)> fn) {
    MarkdownOptions updated = options_;
    if (fn) {
        fn(updated);
    }
    validateOptions(updated);
    options_ = std::move(updated);
    return *this;
}

MarkdownOptions const& MarkdownBuilder::options() const {
    return options_;
}

void setSafeMode(bool enabled) {
    gSafeMode.store(enabled);
}

bool isSafeMode() {
    return gSafeMode.load();
}

MarkdownBuilder defaultBuilder() {
    MarkdownOptions options;
    options.safeMode = isSafeMode();
    return MarkdownBuilder(std::move(options));
}

Node text(std::string const& value, bool escape) {
    return defaultBuilder().text(value, escape);
}

Node bold(Content const& content, bool escape) {
    return defaultBuilder().bold(content, escape);
}

Node italic(Content const& content, bool escape) {
    return defaultBuilder().italic(content, escape);
}

Node strikethrough(Content const& content, bool escape) {
    return defaultBuilder().strikethrough(content, escape);
}

Node code(std::string const& content, bool escape) {
    return defaultBuilder().code(content, escape);
}

Node link(Content const& text, std::string const& url, bool escape) {
    return defaultBuilder().link(text, url, escape);
}

Node link(char const* text, char const* url, bool escape) {
    return defaultBuilder().link(text, url, escape);
}

Node image(std::string const& altText, std::string const& url, bool escape) {
    return defaultBuilder().image(altText, url, escape);
}

Node lineBreak() {
    return defaultBuilder().lineBreak();
}

Node empty() {
    return defaultBuilder().empty();
}

Node referenceLink(Content const& text, std::string const& id, bool escape) {
    return defaultBuilder().referenceLink(text, id, escape);
}

Node paragraph(Content const& content, bool escape) {
    return defaultBuilder().paragraph(content, escape);
}

Node heading(int level, Content const& content, bool escape) {
    return defaultBuilder().heading(level, content, escape);
}

Node h1(Content const& content, bool escape) { return heading(1, content, escape); }
Node h2(Content const& content, bool escape) { return heading(2, content, escape); }
Node h3(Content const& content, bool escape) { return heading(3, content, escape); }
Node h4(Content const& content, bool escape) { return heading(4, content, escape); }
Node h5(Content const& content, bool escape) { return heading(5, content, escape); }
Node h6(Content const& content, bool escape) { return heading(6, content, escape); }

Node blockquote(Content const& content, bool escape) {
    return defaultBuilder().blockquote(content, escape);
}

Node codeBlock(std::string const& content, std::string const& language, bool escape) {
    return defaultBuilder().codeBlock(content, language, escape);
}

Node horizontalRule() {
    return defaultBuilder().horizontalRule();
}

Node linkReference(std::string const& id, std::string const& url) {
    return defaultBuilder().linkReference(id, url);
}

Node document(std::vector<Node> const& children) {
    return defaultBuilder().document(children);
}

Node bulletList(Content const& items, bool escape) {
    return defaultBuilder().bulletList(items, escape);
}

Node orderedList(Content const& items, int start, bool escape) {
    return defaultBuilder().orderedList(items, start, escape);
}

Node checklist(Content const& items, std::optional<std::vector<bool>> const& checked, bool escape) {
    return defaultBuilder().checklist(items, checked, escape);
}

Node table(std::vector<Content> const& headers,
           std::vector<std::vector<Content>> const& rows,
           std::vector<std::string> const& alignment,
           bool escape) {
    return defaultBuilder().table(headers, rows, alignment, escape);
}

} // namespace markdown_strings_cpp
