#pragma once

#include <map>
#include <string>

namespace readability {

// Lowercase abbreviation -> number of its dots that do not end a sentence.
const std::map<std::string, int>& abbreviations();

// Weight of a single key, 0 when it is not in the table.
int abbreviationWeight(const std::string& key);

// Sum of weights of every abbreviation occurring in text (case-insensitive).
// An occurrence must start at the beginning of the text or after a character
// that is not a letter or digit. The longest key wins at each position and
// occurrences never overlap.
int abbreviationCorrection(const std::string& text);

} // namespace readability
