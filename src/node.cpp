/// @file node.cpp
/// @brief Node model: kind names, classification and debug output
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "node.h"
#include "inline_builder.h"
#include "rules.h"

#include <ostream>
#include <string>
#include <utility>

namespace markdown_strings_cpp {

Node::Node(Kind kind, std::string text, bool escaped)
    : kind_(kind), text_(std::move(text)), escaped_(escaped) {}

Node NodeFactory::make(Kind kind, std::string text, bool escaped) {
    return Node(kind, std::move(text), escaped);
}

std::string_view kindName(Kind kind) noexcept {
    switch (kind) {
        case Kind::Text: return "text";
        case Kind::Bold: return "bold";
        case Kind::Italic: return "italic";
        case Kind::Code: return "code";
        case Kind::Strikethrough: return "strikethrough";
        case Kind::Link: return "link";
        case Kind::Image: return "image";
        case Kind::LineBreak: return "line_break";
        case Kind::ReferenceLink: return "reference_link";
        case Kind::Paragraph: return "paragraph";
        case Kind::Heading: return "heading";
        case Kind::Blockquote: return "blockquote";
        case Kind::CodeBlock: return "code_block";
        case Kind::Document: return "document";
        case Kind::BulletList: return "bullet_list";
        case Kind::OrderedList: return "ordered_list";
        case Kind::Checklist: return "checklist";
        case Kind::Table: return "table";
        case Kind::HorizontalRule: return "horizontal_rule";
        case Kind::LinkReference: return "link_reference";
        case Kind::Empty: return "empty";
    }
    return "unknown";
}

bool isBlockKind(Kind kind) noexcept {
    return kBlockKinds.contains(kind);
}

// Prints the node with control characters made visible.
std::ostream& operator<<(std::ostream& os, Node const& node) {
    os << "Node(kind=" << kindName(node.kind())
       << ", escaped=" << (node.escaped() ? "true" : "false")
       << ", text=\"";
    for (char c : node.text()) {
        switch (c) {
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            case '"': os << "\\\""; break;
            default: os << c; break;
        }
    }
    return os << "\")";
}

} // namespace markdown_strings_cpp
