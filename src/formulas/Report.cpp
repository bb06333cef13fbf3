#include "readability/Formulas.hpp"

namespace readability {

Report analyze(const std::string& text) {
    Report report;
    report.stats = buildAggregateStats(text);

    try {
        report.colemanLiau = colemanLiau(text);
    } catch (const ReadabilityError& e) {
        report.errors.emplace("cli", e.code());
    }

    try {
        report.ari = automatedReadabilityIndex(text);
        report.ariGrade = convertAriToGrades(*report.ari);
    } catch (const ReadabilityError& e) {
        report.errors.emplace("ari", e.code());
    }

    try {
        report.gulpease = gulpease(text);
    } catch (const ReadabilityError& e) {
        report.errors.emplace("gulpease", e.code());
    }

    return report;
}

nlohmann::json toJson(const Report& report) {
    nlohmann::json scores = nlohmann::json::object();
    if (report.colemanLiau) scores["cli"] = *report.colemanLiau;
    if (report.ari) {
        scores["ari"] = {
            {"score", *report.ari},
            {"age", report.ariGrade->age},
            {"grade", report.ariGrade->gradeLevel}
        };
    }
    if (report.gulpease) scores["gulpease"] = *report.gulpease;

    nlohmann::json errors = nlohmann::json::object();
    for (const auto& kv : report.errors) {
        errors[kv.first] = errcName(kv.second);
    }

    return nlohmann::json{
        {"stats", toJson(report.stats)},
        {"scores", scores},
        {"errors", errors}
    };
}

std::string dumpReport(const Report& report, const std::string& source, int indent) {
    auto j = toJson(report);
    j["source"] = source;
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace readability
