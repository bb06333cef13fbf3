#include "readability/Formulas.hpp"

#include <cmath>

namespace readability {

namespace {

const std::map<int, AriGrade>& ariTable() {
    static const std::map<int, AriGrade> table = {
        {1, {"5-6", "Kindengarden"}},
        {2, {"6-7", "First Grade"}},
        {3, {"7-8", "Second Grade"}},
        {4, {"8-9", "Third Grade"}},
        {5, {"9-10", "Forth Grade"}},
        {6, {"10-11", "Fifth Grade"}},
        {7, {"11-12", "Sixth Grade"}},
        {8, {"12-13", "Seventh Grade"}},
        {9, {"13-14", "Eighth Grade"}},
        {10, {"14-15", "Ninth Grade"}},
        {11, {"15-16", "Tenth Grade"}},
        {12, {"16-17", "Eleventh Grade"}},
        {13, {"17-18", "Twelfth Grade"}},
        {14, {"18-22", "College student"}},
    };
    return table;
}

} // namespace

int automatedReadabilityIndex(const std::string& text) {
    if (text.empty()) {
        throw ReadabilityError(Errc::EmptyInput, "Empty string.");
    }

    const double characters = static_cast<double>(countCharacters(text));
    const double words = static_cast<double>(countWords(text));
    const double sentences = static_cast<double>(countSentences(text));

    if (words == 0) {
        throw ReadabilityError(Errc::NoWords, "No words in text. Cannot calculate ARI.");
    }
    if (sentences == 0) {
        throw ReadabilityError(Errc::NoSentences, "No sentences in text. Cannot calculate ARI.");
    }

    double ari = 4.71 * (characters / words) + 0.5 * (words / sentences) - 21.43;
    return static_cast<int>(std::ceil(ari));
}

AriGrade convertAriToGrades(int score) {
    if (score > 14) {
        return {"22+", "Professor level"};
    }
    const auto& table = ariTable();
    auto it = table.find(score);
    if (it == table.end()) {
        return {"Unknown", "Unknown"};
    }
    return it->second;
}

} // namespace readability
