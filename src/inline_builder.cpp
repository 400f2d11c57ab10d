/// @file inline_builder.cpp
/// @brief Implementation of the shared inline combinator
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "inline_builder.h"
#include "errors.h"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace markdown_strings_cpp {

namespace {

// Helper for std::visit with a set of lambdas.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[noreturn]] void throwNestedSequence(Kind owner) {
    throw TypeMismatchError(std::string(kindName(owner)) + " content cannot contain a nested sequence");
}

} // namespace

void ensureEscapeAllowed(bool escape, bool safeMode) {
    if (!escape && safeMode) {
        throw SafeModeError();
    }
}

std::vector<Content> normalizeContent(Content const& content, Kind owner) {
    if (!content.isSequence()) {
        return {content};
    }
    std::vector<Content> items;
    items.reserve(content.sequence().size());
    for (auto const& item : content.sequence()) {
        if (item.isSequence()) {
            throwNestedSequence(owner);
        }
        items.push_back(item);
    }
    return items;
}

Fragment renderItem(Content const& item, Kind owner, KindSet accepts, EscapeContext context, bool escape) {
    return std::visit(Overloaded{
        [&](std::string const& literal) {
            return Fragment{escape ? escapeText(literal, context) : literal, escape};
        },
        [&](Node const& child) {
            ensureAccepted(owner, accepts, child.kind());
            return Fragment{child.text(), child.escaped()};
        },
        [&](Content::Sequence const&) -> Fragment {
            throwNestedSequence(owner);
        },
    }, item.value());
}

Fragment renderContent(Content const& content, Kind owner, KindSet accepts, EscapeContext context, bool escape) {
    Fragment result{std::string(), escape};
    for (auto const& item : normalizeContent(content, owner)) {
        Fragment piece = renderItem(item, owner, accepts, context, escape);
        result.text += piece.text;
        if (!piece.escaped) {
            result.escaped = false;
        }
    }
    return result;
}

Node buildInline(InlineSpec const& spec, Content const& content, bool escape, bool safeMode) {
    ensureEscapeAllowed(escape, safeMode);

    Fragment body = renderContent(content, spec.kind, spec.accepts, spec.context, escape);
    if (spec.postProcess) {
        body.text = spec.postProcess(body.text);
    }

    std::string rendered;
    rendered.reserve(spec.left.size() + body.text.size() + spec.right.size());
    rendered += spec.left;
    rendered += body.text;
    rendered += spec.right;
    return NodeFactory::make(spec.kind, std::move(rendered), body.escaped);
}

} // namespace markdown_strings_cpp
