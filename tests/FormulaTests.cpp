#include "readability/Formulas.hpp"
#include "readability/Request.hpp"

#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace readability;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static void expectErrc(const std::function<void()>& fn, Errc code, const std::string& msg) {
    try {
        fn();
    } catch (const ReadabilityError& e) {
        expect(e.code() == code, msg + " (wrong error code " + errcName(e.code()) + ")");
        return;
    }
    expect(false, msg + " (no error thrown)");
}

// 10 five-letter words in 2 sentences: C=50, W=10, S=2.
static const std::string kSample = "Hello world there every thing. Quick brown foxes jumps about.";

static void testColemanLiau() {
    expectErrc([] { colemanLiau(""); }, Errc::EmptyInput, "cli on empty text");
    expectErrc([] { colemanLiau("   \n "); }, Errc::NoWords, "cli on whitespace");

    // 5.88*5 - 29.6*0.2 - 15.8 = 7.68
    expect(std::fabs(colemanLiau(kSample) - 7.7) < 1e-9, "cli rounds to one decimal");
    // no sentences is fine for CLI
    expect(std::fabs(colemanLiau("hello") - 13.6) < 1e-9, "cli without sentence marks");
}

static void testAri() {
    expectErrc([] { automatedReadabilityIndex(""); }, Errc::EmptyInput, "ari on empty text");
    expectErrc([] { automatedReadabilityIndex("  "); }, Errc::NoWords, "ari on whitespace");
    expectErrc([] { automatedReadabilityIndex("hello world"); }, Errc::NoSentences, "ari without sentences");

    // 4.71*5 + 0.5*5 - 21.43 = 4.62, rounded up
    expect(automatedReadabilityIndex(kSample) == 5, "ari rounds up");
}

static void testGrades() {
    expect((convertAriToGrades(1) == AriGrade{"5-6", "Kindengarden"}), "grade 1");
    expect((convertAriToGrades(5) == AriGrade{"9-10", "Forth Grade"}), "grade 5");
    expect((convertAriToGrades(14) == AriGrade{"18-22", "College student"}), "grade 14");
    expect((convertAriToGrades(15) == AriGrade{"22+", "Professor level"}), "above the table");
    expect((convertAriToGrades(20) == AriGrade{"22+", "Professor level"}), "grade 20");
    expect((convertAriToGrades(0) == AriGrade{"Unknown", "Unknown"}), "grade 0");
    expect((convertAriToGrades(-3) == AriGrade{"Unknown", "Unknown"}), "negative grade");
}

static void testGulpease() {
    expectErrc([] { gulpease(""); }, Errc::EmptyInput, "gulpease on empty text");
    expectErrc([] { gulpease("\t"); }, Errc::NoWords, "gulpease on whitespace");

    // 89 + (300*2 - 10*50)/10
    expect(gulpease(kSample) == 99, "gulpease sample");
    expect(it::calcGulpease(kSample) == gulpease(kSample), "italian entry point");
    // "18." is one word with two characters and one sentence: 89 + (300 - 20)/1
    expect(gulpease("18.") == 369, "number as a word");
}

static void testErrors() {
    expect(std::string(errcName(Errc::EmptyInput)) == "empty_input", "empty_input name");
    expect(std::string(errcName(Errc::NoWords)) == "no_words", "no_words name");
    expect(std::string(errcName(Errc::NoSentences)) == "no_sentences", "no_sentences name");

    try {
        colemanLiau("");
        expect(false, "expected a throw");
    } catch (const std::runtime_error& e) {
        expect(!std::string(e.what()).empty(), "error carries a message");
    }
}

static void testAnalyze() {
    auto report = analyze(kSample);
    expect(report.errors.empty(), "sample computes every score");
    expect(report.stats.words == 10 && report.stats.characters == 50 && report.stats.sentences == 2, "sample stats");
    expect(report.ari && *report.ari == 5, "report ari");
    expect(report.ariGrade && report.ariGrade->gradeLevel == "Forth Grade", "report grade");
    expect(report.gulpease && *report.gulpease == 99, "report gulpease");

    auto partial = analyze("hello world");
    expect(partial.colemanLiau.has_value(), "cli without sentences");
    expect(!partial.ari && !partial.ariGrade, "ari missing without sentences");
    expect(partial.errors.at("ari") == Errc::NoSentences, "ari error recorded");

    auto j = toJson(partial);
    expect(j["errors"]["ari"] == "no_sentences", "json error name");
    expect(j["scores"].contains("cli") && !j["scores"].contains("ari"), "json scores");
    expect(j["stats"]["words"] == 2, "json stats");

    auto empty = toJson(analyze(""));
    expect(empty["errors"]["cli"] == "empty_input" && empty["errors"]["gulpease"] == "empty_input", "empty report");
}

static void testRequestText() {
    expect(requestText("text/plain", "Raw body.") == "Raw body.", "raw body is the text");
    expect(requestText("", "{\"text\": \"x\"}") == "{\"text\": \"x\"}", "json is not parsed without the content type");
    expect(requestText("application/json; charset=utf-8", R"({"text": "Hello there."})") == "Hello there.", "text field of a json body");

    bool threw = false;
    try {
        requestText("application/json", "{not json");
    } catch (const nlohmann::json::parse_error&) {
        threw = true;
    }
    expect(threw, "malformed json is rejected");

    const std::string missing[] = {R"({"body": "x"})", R"({"text": 3})", R"(["text"])"};
    for (const auto& body : missing) {
        threw = false;
        try {
            requestText("application/json", body);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "json without a string text field is rejected: " + body);
    }
}

static void testDescribeError() {
    try {
        automatedReadabilityIndex("hello world");
        expect(false, "expected a throw");
    } catch (const ReadabilityError& e) {
        const std::string message = describeError(e);
        expect(message.rfind("no_sentences: ", 0) == 0, "message starts with the error name");
        expect(message.find(e.what()) != std::string::npos, "message keeps the error text");
    }
}

static void testDumpReport() {
    auto report = analyze(kSample);
    auto j = nlohmann::json::parse(dumpReport(report, "sample.txt", 2));
    expect(j["source"] == "sample.txt", "source is recorded");
    expect(j["scores"]["gulpease"] == 99, "scores survive the dump");

    // "bad\xff.txt" is not valid UTF-8.
    std::string dumped;
    try {
        dumped = dumpReport(report, "bad\xff.txt");
    } catch (const std::exception& e) {
        expect(false, std::string("invalid utf-8 source must not throw: ") + e.what());
    }
    auto k = nlohmann::json::parse(dumped);
    expect(k["source"] == "bad\xEF\xBF\xBD.txt", "invalid bytes become U+FFFD");
}

int main() {
    testColemanLiau();
    testAri();
    testGrades();
    testGulpease();
    testErrors();
    testAnalyze();
    testRequestText();
    testDescribeError();
    testDumpReport();

    std::cout << "All tests passed." << std::endl;
    return 0;
}
