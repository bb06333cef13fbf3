#pragma once

#include <string>
#include <vector>
#include <unicode/umachine.h>

namespace readability::unicode {

// UTF-8 to code points; ill-formed sequences become U+FFFD.
std::vector<UChar32> decode(const std::string& text);

// Maximal runs of non-whitespace code points, as byte substrings of text.
std::vector<std::string> splitOnWhitespace(const std::string& text);

bool isLetterOrDigit(UChar32 c);
bool isLetter(UChar32 c);
bool isWhitespace(UChar32 c);

// Full Unicode lowercase mapping (root locale).
std::string toLower(const std::string& text);

} // namespace readability::unicode
