#include "readability/Abbreviations.hpp"

#include <algorithm>
#include <vector>
#include "readability/Unicode.hpp"

namespace readability {

namespace {

int countDots(const std::string& s) {
    return static_cast<int>(std::count(s.begin(), s.end(), '.'));
}

std::map<std::string, int> buildTable() {
    static const char* const keys[] = {
        "u.s.",

        "mr.", "messrs.", "mrs.", "mmes.", "ms.", "dr.", "prof.", "capt.",
        "st.", "revd.", "rev.",

        "jan.", "feb.", "mar.", "apr.", "aug.", "sept.", "oct.", "nov.", "dec.",

        "a.m.", "p.m.", "i.e.", "e.g.", "a.d.", "b.c.", "b.c.e.", "c.e.", "n.b.",
    };
    std::map<std::string, int> table;
    for (const char* k : keys) {
        std::string key(k);
        table.emplace(key, countDots(key));
    }
    return table;
}

// Keys ordered longest first so "b.c.e." is tried before "b.c.".
const std::vector<std::string>& keysByLength() {
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> out;
        for (const auto& kv : abbreviations()) out.push_back(kv.first);
        std::stable_sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
        return out;
    }();
    return keys;
}

bool matchesAt(const std::vector<UChar32>& text, size_t pos, const std::string& key) {
    if (pos + key.size() > text.size()) return false;
    for (size_t i = 0; i < key.size(); ++i) {
        if (text[pos + i] != static_cast<unsigned char>(key[i])) return false;
    }
    return true;
}

} // namespace

const std::map<std::string, int>& abbreviations() {
    static const std::map<std::string, int> table = buildTable();
    return table;
}

int abbreviationWeight(const std::string& key) {
    const auto& table = abbreviations();
    auto it = table.find(key);
    return it == table.end() ? 0 : it->second;
}

int abbreviationCorrection(const std::string& text) {
    if (text.empty()) return 0;

    const std::vector<UChar32> cps = unicode::decode(unicode::toLower(text));
    const auto& keys = keysByLength();
    const auto& table = abbreviations();

    int correction = 0;
    size_t i = 0;
    while (i < cps.size()) {
        bool boundary = (i == 0) || !unicode::isLetterOrDigit(cps[i - 1]);
        if (boundary) {
            bool matched = false;
            for (const auto& key : keys) {
                if (matchesAt(cps, i, key)) {
                    correction += table.at(key);
                    i += key.size();
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }
        ++i;
    }
    return correction;
}

} // namespace readability
