#include "readability/Formulas.hpp"

#include <cmath>

namespace readability {

// A number counts as a word, so "18." is a valid input.
int gulpease(const std::string& text) {
    if (text.empty()) {
        throw ReadabilityError(Errc::EmptyInput, "Empty string.");
    }

    const double words = static_cast<double>(countWords(text));
    if (words == 0) {
        throw ReadabilityError(Errc::NoWords, "No words were parsed. Cannot calculate Gulpease readability index.");
    }

    const double characters = static_cast<double>(countCharacters(text));
    const double sentences = static_cast<double>(countSentences(text));

    double raw = 89 + (300 * sentences - 10 * characters) / words;
    return static_cast<int>(std::round(raw));
}

} // namespace readability
