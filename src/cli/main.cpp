#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include "readability/Formulas.hpp"
#include "readability/TextStats.hpp"

namespace {

void printReport(std::ostream& out, const readability::Report& report) {
    readability::printStats(out, report.stats);

    auto failure = [&report](const std::string& name) {
        return std::string("error (") + readability::errcName(report.errors.at(name)) + ")";
    };

    out << "CLI:\t\t";
    if (report.colemanLiau) out << *report.colemanLiau; else out << failure("cli");
    out << "\n";

    out << "ARI:\t\t";
    if (report.ari) {
        out << *report.ari << " (age " << report.ariGrade->age << ", " << report.ariGrade->gradeLevel << ")";
    } else {
        out << failure("ari");
    }
    out << "\n";

    out << "Gulpease:\t";
    if (report.gulpease) out << *report.gulpease; else out << failure("gulpease");
    out << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    bool asJson = false;
    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            asJson = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--json] [FILE...]\n"
                      << "Reads standard input when no file is given.\n";
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    std::vector<std::pair<std::string, std::string>> inputs;
    if (files.empty()) {
        std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        inputs.emplace_back("-", std::move(text));
    }
    for (const auto& path : files) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cerr << "readability: cannot open " << path << "\n";
            return 1;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        inputs.emplace_back(path, ss.str());
    }

    try {
        for (const auto& input : inputs) {
            auto report = readability::analyze(input.second);
            if (asJson) {
                std::cout << readability::dumpReport(report, input.first, 2) << "\n";
            } else {
                if (inputs.size() > 1) std::cout << "== " << input.first << "\n";
                printReport(std::cout, report);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "readability: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
