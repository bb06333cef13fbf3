#include "readability/Formulas.hpp"

#include <cmath>

namespace readability {

double colemanLiau(const std::string& text) {
    if (text.empty()) {
        throw ReadabilityError(Errc::EmptyInput, "Empty string.");
    }

    const double characters = static_cast<double>(countCharacters(text));
    const double words = static_cast<double>(countWords(text));
    const double sentences = static_cast<double>(countSentences(text));

    if (words == 0) {
        throw ReadabilityError(Errc::NoWords, "No words were parsed. Cannot calculate CLI.");
    }

    double cli = 5.88 * (characters / words) - 29.6 * (sentences / words) - 15.8;
    return std::round(cli * 10) / 10;
}

} // namespace readability
