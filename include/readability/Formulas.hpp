#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "readability/Errors.hpp"
#include "readability/TextStats.hpp"

namespace readability {

struct AriGrade {
    std::string age;
    std::string gradeLevel;
};

inline bool operator==(const AriGrade& a, const AriGrade& b) {
    return a.age == b.age && a.gradeLevel == b.gradeLevel;
}

// Coleman–Liau index rounded to one decimal.
// Throws ReadabilityError (EmptyInput, NoWords).
double colemanLiau(const std::string& text);

// Automated readability index rounded up to a whole number.
// Throws ReadabilityError (EmptyInput, NoWords, NoSentences).
int automatedReadabilityIndex(const std::string& text);

// Age and grade band for an ARI score. Scores above the table map to
// ("22+", "Professor level"), anything else missing to ("Unknown", "Unknown").
AriGrade convertAriToGrades(int score);

// Gulpease index (Italian texts) rounded to the nearest whole number.
// Throws ReadabilityError (EmptyInput, NoWords).
int gulpease(const std::string& text);

namespace it {

inline int calcGulpease(const std::string& text) { return readability::gulpease(text); }

} // namespace it

// Everything computable for one text; a formula that failed has no value and
// an entry in errors keyed by formula name ("cli", "ari", "gulpease").
struct Report {
    AggregateStats stats;
    std::optional<double> colemanLiau;
    std::optional<int> ari;
    std::optional<AriGrade> ariGrade;
    std::optional<int> gulpease;
    std::map<std::string, Errc> errors;
};

Report analyze(const std::string& text);

nlohmann::json toJson(const Report& report);

// JSON text of a report tagged with its source name. Invalid UTF-8 in the
// source is replaced rather than rejected.
std::string dumpReport(const Report& report, const std::string& source, int indent = -1);

} // namespace readability
