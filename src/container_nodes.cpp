/// @file container_nodes.cpp
/// @brief Container node constructors of MarkdownBuilder
///
/// This file defines the constructs that assemble many children:
///
/// - Documents (sequence of blocks)
/// - Bullet lists, ordered lists and checklists, with nested sub-lists
/// - GFM tables with optional column alignment
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "errors.h"
#include "inline_builder.h"
#include "markdown_strings.h"
#include "rules.h"
#include "utilities.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace markdown_strings_cpp {

namespace {

constexpr char kBlockTerminator[] = "\n\n";

// Spaces added per nesting level of a list.
constexpr std::size_t kListIndent = 2;

// CommonMark list markers carry at most nine digits.
constexpr long long kMaxOrderedListNumber = 999999999;

// Replaces every line break of `text` with a line break followed by `indent`.
std::string indentContinuationLines(std::string const& text, std::string const& indent) {
    std::string output;
    output.reserve(text.size());
    for (char c : text) {
        output.push_back(c);
        if (c == '\n') {
            output += indent;
        }
    }
    return output;
}

/**
 * @brief Render the items of one list level
 *
 * A sequence item is a sub-list of the preceding item: it is rendered one
 * level deeper, numbered from 1 and unchecked, and does not consume a number
 * of the current level.
 *
 * @param[in] items Items of this level
 * @param[in] kind List kind, for the nesting rules and the marker style
 * @param[in] bullet Bullet marker for bullet lists and checklists
 * @param[in] start First number of an ordered list
 * @param[in] checked One flag per item for checklists, or nullptr
 * @param[in] level Nesting depth, 0 for the top level
 * @param[in] escape Whether literal items are escaped
 * @return Lines of this level joined by newlines, without block terminator
 */
Fragment renderListItems(Content::Sequence const& items, Kind kind, std::string const& bullet, int start,
                         std::vector<bool> const* checked, std::size_t level, bool escape) {
    std::vector<std::string> lines;
    bool escaped = escape;
    int number = start;
    std::string indent = repeatChar(' ', kListIndent * level);

    for (std::size_t i = 0; i < items.size(); ++i) {
        Content const& item = items[i];
        if (item.isSequence()) {
            Fragment nested = renderListItems(item.sequence(), kind, bullet, 1, nullptr, level + 1, escape);
            if (!nested.text.empty()) {
                lines.push_back(std::move(nested.text));
            }
            escaped = escaped && nested.escaped;
            continue;
        }

        std::string marker;
        switch (kind) {
            case Kind::OrderedList:
                marker = std::to_string(number++) + ". ";
                break;
            case Kind::Checklist:
                marker = bullet + ((checked && (*checked)[i]) ? " [x] " : " [ ] ");
                break;
            default:
                marker = bullet + " ";
                break;
        }

        Fragment body = renderItem(item, kind, acceptedChildren(kind), EscapeContext::ListItem, escape);
        std::string itemText = item.isNode() ? trimStr(body.text) : body.text;
        itemText = indentContinuationLines(itemText, indent + repeatChar(' ', marker.size()));
        lines.push_back(indent + marker + itemText);
        escaped = escaped && body.escaped;
    }

    return Fragment{joinStrings(lines, "\n"), escaped};
}

// Backslash-escapes every `|` not already escaped. Node cells (bold, links,
// code spans) are rendered outside the TableCell context and may carry one.
std::string escapeCellPipes(std::string const& cell) {
    std::string output;
    output.reserve(cell.size());
    std::size_t backslashes = 0;
    for (char c : cell) {
        if (c == '|' && backslashes % 2 == 0) {
            output.push_back('\\');
        }
        backslashes = (c == '\\') ? backslashes + 1 : 0;
        output.push_back(c);
    }
    return output;
}

std::string alignmentCell(Alignment alignment) {
    switch (alignment) {
        case Alignment::Left: return ":---";
        case Alignment::Center: return ":---:";
        case Alignment::Right: return "---:";
    }
    return "---";
}

} // namespace

Node MarkdownBuilder::document(std::vector<Node> const& children) const {
    std::vector<std::string> parts;
    parts.reserve(children.size());
    bool escaped = true;
    for (auto const& child : children) {
        ensureAccepted(Kind::Document, child.kind());
        parts.push_back(trimTrailingNewlines(child.text()));
        escaped = escaped && child.escaped();
    }
    return NodeFactory::make(Kind::Document, joinStrings(parts, "\n"), escaped);
}

Node MarkdownBuilder::listNode(Kind kind, Content const& items, int start,
                               std::vector<bool> const* checked, bool escape) const {
    ensureEscapeAllowed(escape, options_.safeMode);

    Content::Sequence topLevel = items.isSequence() ? items.sequence() : Content::Sequence{items};
    if (checked && checked->size() != topLevel.size()) {
        throw ValidationError("checked list length must match items length, got " +
                              std::to_string(checked->size()) + " flags for " +
                              std::to_string(topLevel.size()) + " items");
    }
    if (kind == Kind::OrderedList) {
        long long numbered = 0;
        for (auto const& item : topLevel) {
            if (!item.isSequence()) ++numbered;
        }
        long long last = static_cast<long long>(start) + numbered - 1;
        if (last > kMaxOrderedListNumber) {
            throw ValidationError("ordered list numbers must not exceed " + std::to_string(kMaxOrderedListNumber) +
                                  ", got start " + std::to_string(start) + " for " + std::to_string(numbered) +
                                  " items");
        }
    }

    Fragment body = renderListItems(topLevel, kind, options_.bulletListMarker, start, checked, 0, escape);
    return NodeFactory::make(kind, body.text + kBlockTerminator, body.escaped);
}

Node MarkdownBuilder::bulletList(Content const& items, bool escape) const {
    return listNode(Kind::BulletList, items, 1, nullptr, escape);
}

Node MarkdownBuilder::orderedList(Content const& items, int start, bool escape) const {
    if (start < 1) {
        throw ValidationError("ordered list start must be a positive integer, got " + std::to_string(start));
    }
    return listNode(Kind::OrderedList, items, start, nullptr, escape);
}

Node MarkdownBuilder::checklist(Content const& items, std::optional<std::vector<bool>> const& checked,
                                bool escape) const {
    return listNode(Kind::Checklist, items, 1, checked ? &*checked : nullptr, escape);
}

/**
 * @brief Render a GFM table
 *
 * Shape is validated before anything is rendered: header width, alignment
 * list, then each row's width. Cells are escaped in the TableCell context, and
 * any `|` a child node brings along is escaped as well, so no cell can split.
 */
Node MarkdownBuilder::table(std::vector<Content> const& headers,
                            std::vector<std::vector<Content>> const& rows,
                            std::vector<std::string> const& alignment,
                            bool escape) const {
    ensureEscapeAllowed(escape, options_.safeMode);

    std::size_t const columns = headers.size();
    if (columns == 0) {
        throw ValidationError("table must have at least 1 header column");
    }

    std::vector<std::string> alignmentRow(columns, "---");
    if (!alignment.empty()) {
        if (alignment.size() != columns) {
            throw ValidationError("alignment list must match number of columns, got " +
                                  std::to_string(alignment.size()) + " for " + std::to_string(columns));
        }
        for (std::size_t c = 0; c < columns; ++c) {
            alignmentRow[c] = alignmentCell(parseAlignment(alignment[c]));
        }
    }

    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != columns) {
            throw ValidationError("table row " + std::to_string(r + 1) + " has " +
                                  std::to_string(rows[r].size()) + " columns but headers have " +
                                  std::to_string(columns));
        }
    }

    bool escaped = escape;
    auto renderRow = [&](std::vector<Content> const& cells, std::string const& rowName) {
        std::vector<std::string> rendered;
        rendered.reserve(cells.size());
        for (std::size_t c = 0; c < cells.size(); ++c) {
            Fragment cell = renderContent(cells[c], Kind::Table, acceptedChildren(Kind::Table),
                                          EscapeContext::TableCell, escape);
            if (cell.text.find_first_of("\r\n") != std::string::npos) {
                throw ValidationError(rowName + " column " + std::to_string(c + 1) + " contains a line break");
            }
            escaped = escaped && cell.escaped;
            rendered.push_back(escapeCellPipes(cell.text));
        }
        return joinStrings(rendered, " | ");
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 2);
    lines.push_back(renderRow(headers, "table header"));
    lines.push_back(joinStrings(alignmentRow, " | "));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        lines.push_back(renderRow(rows[r], "table row " + std::to_string(r + 1)));
    }

    return NodeFactory::make(Kind::Table, joinStrings(lines, "\n") + kBlockTerminator, escaped);
}

} // namespace markdown_strings_cpp
