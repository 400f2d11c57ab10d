/// @file utilities.h
/// @brief Markdown escaping engine and string helpers
///
/// markdown_strings.cpp uses backslashes to escape Markdown characters in
/// literal input. This ensures that user-supplied text is never interpreted
/// as Markdown syntax when the generated document is rendered.
///
/// For example, the text `1. Hello world` inside a heading needs to be escaped
/// to `1\. Hello world`, otherwise it would start an ordered list.
///
/// Escaping runs in three passes whose order matters, since a later pass must
/// not re-escape the backslashes introduced by an earlier one:
///
/// -# common rules, identical in every context
/// -# context rules (table cell, URL)
/// -# line-leading rules, applied to each line separately
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_UTILITIES_H
#define MARKDOWN_STRINGS_UTILITIES_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace markdown_strings_cpp {

/// @enum EscapeContext
/// @brief Where a piece of literal text will appear
enum class EscapeContext {
    Plain,     ///< Inline text (emphasis, links, headings, paragraphs)
    Url,       ///< Link or image destination, reference ids
    TableCell, ///< Cell of a GFM table
    ListItem,  ///< Body of a list item
    Code       ///< Code span or fenced block; content is kept verbatim
};

/// @defgroup markdown_escaping Markdown Escaping
/// @{

/// @brief Escape text for the given context
///
/// Applies, in order:
/// - common rules (all contexts but Code): `\` first, then
///   `` * _ ` ~ [ ] ( ) < > & `` each get a backslash prefix
/// - TableCell: `|` → `\|`
/// - Url: space → `%20`, `(` → `%28`, `)` → `%29`
/// - line-leading rules on every line (see escapeLeadingPatterns())
///
/// Lines are split on `\n` and `\r\n` and re-joined with `\n`.
///
/// Code content is returned unchanged: code spans and fenced blocks render
/// their content literally and are protected by fence sizing instead.
///
/// @param[in] text Raw input text that should be rendered literally
/// @param[in] context Where the text will appear
/// @return Escaped text; never fails
std::string escapeText(std::string_view text, EscapeContext context = EscapeContext::Plain);

/// @brief Apply the rules shared by every non-code context
///
/// @param[in] text The string to escape
/// @return Text with `\`, `*`, `_`, `` ` ``, `~`, `[`, `]`, `(`, `)`, `<`,
///         `>` and `&` backslash-escaped
std::string escapeCommon(std::string_view text);

/// @brief Escape the constructs a line could accidentally start
///
/// - `#...` → `\#...` (ATX heading)
/// - `- ...` → `\- ...`, `+ ...` → `\+ ...` (bullet item)
/// - `<digits>. ...` → `<digits>\. ...` (ordered item)
///
/// @param[in] line A single line without line terminator
/// @return The line with its leading pattern escaped
std::string escapeLeadingPatterns(std::string line);

/// @} // end of markdown_escaping

/// @defgroup string_utilities String Utilities
/// @{

/// @brief Length of the longest run of consecutive backticks
/// @param[in] text The text to scan
/// @return 0 if the text contains no backtick
std::size_t longestBacktickRun(std::string_view text);

/// @brief Repeat a character a specified number of times
/// @param[in] c The character to repeat
/// @param[in] count Number of times to repeat
/// @return String containing the repeated character
std::string repeatChar(char c, std::size_t count);

/// @brief Split text into lines on `\n` or `\r\n`
///
/// An empty input yields one empty line, a trailing terminator yields a
/// trailing empty line.
///
/// @param[in] text The text to split
/// @return Lines without their terminators
std::vector<std::string> splitLines(std::string_view text);

/// @brief Join strings with a separator
std::string joinStrings(std::vector<std::string> const& parts, std::string_view separator);

/// @brief Trim ASCII whitespace from both ends of a string
std::string trimStr(std::string_view s);

/// @brief Trim ASCII whitespace from the end of a string
std::string trimTrailingWhitespace(std::string_view s);

/// @brief Remove trailing carriage returns and line feeds
std::string trimTrailingNewlines(std::string_view text);

/// @} // end of string_utilities

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_UTILITIES_H
