#include "readability/TextStats.hpp"

#include <algorithm>
#include <iterator>
#include "readability/Abbreviations.hpp"
#include "readability/Unicode.hpp"

namespace readability {

namespace {

size_t countSubstring(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

bool isVowel(UChar32 c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u' || c == 'y';
}

bool isConsonant(UChar32 c) {
    return unicode::isLetter(c) && !isVowel(c);
}

bool endsWith(const std::vector<UChar32>& w, const char* suffix) {
    const size_t len = std::char_traits<char>::length(suffix);
    if (w.size() < len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (w[w.size() - len + i] != static_cast<unsigned char>(suffix[i])) return false;
    }
    return true;
}

} // namespace

std::vector<std::string> splitWords(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), '\n', ' ');
    return unicode::splitOnWhitespace(normalized);
}

std::size_t countSymbols(const std::string& text) {
    if (text.empty()) return 0;

    const size_t scalars = unicode::decode(text).size();
    const size_t newLines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    const size_t ellipses = countSubstring(text, "...");
    return scalars - newLines - 2 * ellipses;
}

std::size_t countCharacters(const std::string& text) {
    size_t chars = 0;
    for (UChar32 c : unicode::decode(text)) {
        if (unicode::isLetterOrDigit(c)) ++chars;
    }
    return chars;
}

std::size_t countWords(const std::string& text) {
    if (text.empty()) return 0;
    return splitWords(text).size();
}

std::size_t countSentences(const std::string& text) {
    if (text.empty()) return 0;

    size_t marks = 0;
    for (char ch : text) {
        if (ch == '.' || ch == '!' || ch == '?') ++marks;
    }
    // Abbreviation dots are a subset of the counted dots.
    const size_t correction = static_cast<size_t>(abbreviationCorrection(text));
    return marks - correction;
}

std::size_t countSyllables(const std::string& word) {
    const std::vector<UChar32> lowered = unicode::decode(unicode::toLower(word));

    auto first = std::find_if(lowered.begin(), lowered.end(), unicode::isLetterOrDigit);
    auto last = std::find_if(lowered.rbegin(), std::make_reverse_iterator(first), unicode::isLetterOrDigit).base();
    const std::vector<UChar32> w(first, last);
    const size_t n = w.size();

    int count = 0;
    bool prevVowel = false;
    for (UChar32 c : w) {
        bool vowel = isVowel(c);
        if (vowel && !prevVowel) ++count;
        prevVowel = vowel;
    }

    // silent e
    if (n > 0 && w[n - 1] == 'e') --count;

    if (n > 2) {
        if (endsWith(w, "les") || endsWith(w, "le")) {
            const size_t before = endsWith(w, "les") ? 4 : 3;
            if (n >= before && isConsonant(w[n - before])) ++count;
        } else if (endsWith(w, "ed")) {
            if (w[n - 3] == 't') {
                ++count;
            } else if (isVowel(w[n - 3])) {
                --count;
            }
        } else if (endsWith(w, "es")) {
            const UChar32 c = w[n - 3];
            if (isConsonant(c) && c != 'w' && c != 'x' && c != 'y') ++count;
        }
    }

    return count < 1 ? 1 : static_cast<size_t>(count);
}

AggregateStats buildAggregateStats(const std::string& text) {
    AggregateStats stats;
    stats.symbols = countSymbols(text);
    stats.characters = countCharacters(text);
    stats.words = countWords(text);
    stats.sentences = countSentences(text);
    for (const auto& word : splitWords(text)) {
        stats.syllables += countSyllables(word);
    }
    return stats;
}

void printStats(std::ostream& out, const AggregateStats& stats) {
    out << "Symbols:\t" << stats.symbols << "\n"
        << "Characters:\t" << stats.characters << "\n"
        << "Words:\t\t" << stats.words << "\n"
        << "Sentences:\t" << stats.sentences << "\n"
        << "Syllables:\t" << stats.syllables << "\n";
}

nlohmann::json toJson(const AggregateStats& stats) {
    return nlohmann::json{
        {"symbols", stats.symbols},
        {"characters", stats.characters},
        {"words", stats.words},
        {"sentences", stats.sentences},
        {"syllables", stats.syllables}
    };
}

} // namespace readability
