// markdown_strings.cpp/src/errors.cpp
#include "errors.h"

#include <string>

namespace markdown_strings_cpp {

namespace {

std::string nestingMessage(Kind parent, Kind child) {
    std::string message(kindName(parent));
    message += " cannot contain node '";
    message += kindName(child);
    message += "'";
    return message;
}

} // namespace

InvalidNestingError::InvalidNestingError(Kind parent, Kind child)
    : MarkdownError(nestingMessage(parent, child)), parent_(parent), child_(child) {}

SafeModeError::SafeModeError()
    : MarkdownError("escape=false is disabled in safe mode") {}

} // namespace markdown_strings_cpp
