/// @file utilities.cpp
/// @brief Implementation of the escaping engine and string helpers
///
/// The escaping rules are applied as sequential passes (common, context,
/// line-leading). Each pass only adds characters, so escaping always
/// succeeds.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace markdown_strings_cpp {

namespace {

// Characters escaped in every non-code context. Backslash is handled in the
// same single pass, so backslashes added here are never doubled.
constexpr std::string_view kCommonSpecials = "\\*_`~[]()<>&";

bool isAsciiSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Replaces every occurrence of `needle` with `replacement`.
void replaceChar(std::string& text, char needle, std::string_view replacement) {
    std::string result;
    result.reserve(text.size() + 8);
    for (char c : text) {
        if (c == needle) {
            result += replacement;
        } else {
            result.push_back(c);
        }
    }
    text.swap(result);
}

void applyContextRules(std::string& text, EscapeContext context) {
    switch (context) {
        case EscapeContext::TableCell:
            replaceChar(text, '|', "\\|");
            break;
        case EscapeContext::Url:
            // Minimal percent-encoding, not full URI escaping.
            replaceChar(text, ' ', "%20");
            replaceChar(text, '(', "%28");
            replaceChar(text, ')', "%29");
            break;
        case EscapeContext::Plain:
        case EscapeContext::ListItem:
        case EscapeContext::Code:
            break;
    }
}

} // namespace

std::string escapeCommon(std::string_view text) {
    std::string output;
    output.reserve(text.size() + text.size() / 4);
    for (char c : text) {
        if (kCommonSpecials.find(c) != std::string_view::npos) {
            output.push_back('\\');
        }
        output.push_back(c);
    }
    return output;
}

std::string escapeLeadingPatterns(std::string line) {
    if (!line.empty() && line.front() == '#') { // atx heading
        line.insert(0, "\\");
    }

    if (line.rfind("- ", 0) == 0 || line.rfind("+ ", 0) == 0) { // bullet item
        line.insert(0, "\\");
    }

    // ordered list prefix: digits + "." + whitespace
    std::size_t idx = 0;
    while (idx < line.size() && std::isdigit(static_cast<unsigned char>(line[idx]))) {
        ++idx;
    }
    if (idx > 0 && idx + 1 < line.size() && line[idx] == '.' && isAsciiSpace(line[idx + 1])) {
        line.insert(idx, "\\");
    }

    return line;
}

std::string escapeText(std::string_view text, EscapeContext context) {
    if (context == EscapeContext::Code) {
        return std::string(text);
    }

    std::string output = escapeCommon(text);
    applyContextRules(output, context);

    std::vector<std::string> lines = splitLines(output);
    for (auto& line : lines) {
        line = escapeLeadingPatterns(std::move(line));
    }
    return joinStrings(lines, "\n");
}

std::size_t longestBacktickRun(std::string_view text) {
    std::size_t longest = 0;
    std::size_t current = 0;
    for (char c : text) {
        if (c == '`') {
            longest = std::max(longest, ++current);
        } else {
            current = 0;
        }
    }
    return longest;
}

std::string repeatChar(char c, std::size_t count) {
    return std::string(count, c);
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (text[pos] != '\n') continue;
        std::size_t end = pos;
        if (end > start && text[end - 1] == '\r') {
            --end;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = pos + 1;
    }
    lines.emplace_back(text.substr(start));
    return lines;
}

std::string joinStrings(std::vector<std::string> const& parts, std::string_view separator) {
    std::string output;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) output += separator;
        output += parts[i];
    }
    return output;
}

std::string trimStr(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && isAsciiSpace(s[begin])) ++begin;
    while (end > begin && isAsciiSpace(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string trimTrailingWhitespace(std::string_view s) {
    std::size_t end = s.size();
    while (end > 0 && isAsciiSpace(s[end - 1])) --end;
    return std::string(s.substr(0, end));
}

// Uses a loop instead of a regex to keep match-at-end linear.
std::string trimTrailingNewlines(std::string_view text) {
    std::size_t index = text.size();
    while (index > 0 && (text[index - 1] == '\n' || text[index - 1] == '\r')) {
        --index;
    }
    return std::string(text.substr(0, index));
}

} // namespace markdown_strings_cpp
