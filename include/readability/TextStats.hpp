#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace readability {

struct AggregateStats {
    std::size_t symbols = 0;
    std::size_t characters = 0;
    std::size_t words = 0;
    std::size_t sentences = 0;
    std::size_t syllables = 0;
};

// Whitespace tokenizer shared by countWords and buildAggregateStats.
std::vector<std::string> splitWords(const std::string& text);

// Unicode scalars, minus newlines, with every "..." counted as one symbol.
std::size_t countSymbols(const std::string& text);

// Letters and digits by Unicode category.
std::size_t countCharacters(const std::string& text);

std::size_t countWords(const std::string& text);

// '.', '!' and '?' minus the dots that belong to known abbreviations.
// Repeated marks ("?!", "...") are not collapsed.
std::size_t countSentences(const std::string& text);

// English vowel-group heuristic with silent-e and suffix corrections.
// Punctuation around the word is ignored. Never returns less than 1.
std::size_t countSyllables(const std::string& word);

AggregateStats buildAggregateStats(const std::string& text);

void printStats(std::ostream& out, const AggregateStats& stats);

nlohmann::json toJson(const AggregateStats& stats);

} // namespace readability
