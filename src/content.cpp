// markdown_strings.cpp/src/content.cpp
#include "content.h"

#include <utility>

namespace markdown_strings_cpp {

Content::Content() : value_(std::string()) {}

Content::Content(std::string text) : value_(std::move(text)) {}

Content::Content(std::string_view text) : value_(std::string(text)) {}

Content::Content(char const* text) : value_(std::string(text ? text : "")) {}

Content::Content(Node node) : value_(std::move(node)) {}

Content::Content(Sequence items) : value_(std::move(items)) {}

Content::Content(std::initializer_list<Content> items) : value_(Sequence(items)) {}

Content::Content(std::vector<std::string> const& items) : value_(Sequence(items.begin(), items.end())) {}

Content::Content(std::vector<Node> const& items) : value_(Sequence(items.begin(), items.end())) {}

bool Content::isLiteral() const noexcept {
    return std::holds_alternative<std::string>(value_);
}

bool Content::isNode() const noexcept {
    return std::holds_alternative<Node>(value_);
}

bool Content::isSequence() const noexcept {
    return std::holds_alternative<Sequence>(value_);
}

std::string const& Content::literal() const {
    return std::get<std::string>(value_);
}

Node const& Content::node() const {
    return std::get<Node>(value_);
}

Content::Sequence const& Content::sequence() const {
    return std::get<Sequence>(value_);
}

} // namespace markdown_strings_cpp
