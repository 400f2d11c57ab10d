/// @file errors.h
/// @brief Exception hierarchy reported by the node constructors
///
/// Every failure raised by markdown_strings.cpp derives from MarkdownError,
/// itself a std::runtime_error, so callers can catch the whole family with a
/// single handler or pick out the specific condition:
///
/// - InvalidNestingError: a child node's kind is not permitted in its parent
/// - ValidationError: a structural precondition is violated (heading level,
///   table shape, checklist pattern length, list start, alignment token)
/// - SafeModeError: unescaped content was requested while safe mode is on
/// - TypeMismatchError: content of a shape the constructor cannot take
///
/// A failed construction never affects nodes built earlier; nodes are
/// immutable values.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef MARKDOWN_STRINGS_ERRORS_H
#define MARKDOWN_STRINGS_ERRORS_H

#include "node.h"

#include <stdexcept>
#include <string>

namespace markdown_strings_cpp {

/// @class MarkdownError
/// @brief Base class of all library-defined exceptions
class MarkdownError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @class InvalidNestingError
/// @brief A node received a child kind it is not allowed to contain
///
/// @code{.cpp}
/// try {
///     bold(paragraph("text"));
/// } catch (InvalidNestingError const& e) {
///     // e.what() == "bold cannot contain node 'paragraph'"
///     // e.parent() == Kind::Bold, e.child() == Kind::Paragraph
/// }
/// @endcode
class InvalidNestingError : public MarkdownError {
public:
    /// @brief Construct the error for a rejected parent/child pair
    /// @param[in] parent Kind of the node being constructed
    /// @param[in] child Kind of the rejected child
    InvalidNestingError(Kind parent, Kind child);

    /// @brief Kind of the node whose construction failed
    Kind parent() const noexcept { return parent_; }

    /// @brief Kind of the child that was rejected
    Kind child() const noexcept { return child_; }

private:
    Kind parent_;
    Kind child_;
};

/// @class ValidationError
/// @brief A function argument failed validation
class ValidationError : public MarkdownError {
public:
    using MarkdownError::MarkdownError;
};

/// @class SafeModeError
/// @brief Safe mode forbids an escape=false request
class SafeModeError : public MarkdownError {
public:
    SafeModeError();
};

/// @class TypeMismatchError
/// @brief Content has a shape the constructor cannot accept
///
/// Raised, for instance, when a sequence nested inside another sequence is
/// passed as inline content. Only list constructors give nested sequences a
/// meaning (sub-lists).
class TypeMismatchError : public MarkdownError {
public:
    using MarkdownError::MarkdownError;
};

} // namespace markdown_strings_cpp

#endif // MARKDOWN_STRINGS_ERRORS_H
