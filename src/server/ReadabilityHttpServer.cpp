#include "ReadabilityHttpServer.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>
#include "readability/Formulas.hpp"
#include "readability/Request.hpp"
#include "readability/TextStats.hpp"

using json = nlohmann::json;

ReadabilityHttpServer::ReadabilityHttpServer(readability::ServerConfig config)
    : config_(std::move(config)), startTime_(std::chrono::steady_clock::now()) {
    server_.set_payload_max_length(config_.maxBodyBytes);
    setupRoutes();
}

void ReadabilityHttpServer::run() {
    std::cout << "Readability HTTP server listening on "
              << config_.host << ":" << config_.port << std::endl;
    if (!server_.listen(config_.host.c_str(), config_.port)) {
        throw std::runtime_error("failed to listen on " + config_.host + ":" + std::to_string(config_.port));
    }
}

void ReadabilityHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // CORS helper to add to ALL responses
    const bool cors = config_.cors;
    auto addCors = [cors](httplib::Response& res) {
        if (!cors) return;
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    // Runs one computation and writes the envelope; formula errors are 422.
    auto respond = [ok, err, addCors](const httplib::Request& req, httplib::Response& res,
                                      const std::function<json(const std::string&)>& compute) {
        std::string text;
        try {
            text = readability::requestText(req.get_header_value("Content-Type"), req.body);
        } catch (const std::exception& e) {
            res.status = 400;
            res.set_content(err(400, std::string("Invalid JSON: ") + e.what()).dump(), "application/json");
            addCors(res);
            return;
        }
        try {
            res.set_content(ok(compute(text)).dump(), "application/json");
        } catch (const readability::ReadabilityError& e) {
            res.status = 422;
            res.set_content(err(422, readability::describeError(e)).dump(), "application/json");
        }
        addCors(res);
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_);
        json data = { {"uptimeSeconds", uptime.count()} };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- STATS ---
    server_.Post("/v1/stats", [respond](const httplib::Request& req, httplib::Response& res) {
        respond(req, res, [](const std::string& text) {
            return readability::toJson(readability::buildAggregateStats(text));
        });
    });

    // --- COLEMAN-LIAU ---
    server_.Post("/v1/cli", [respond](const httplib::Request& req, httplib::Response& res) {
        respond(req, res, [](const std::string& text) {
            return json{ {"cli", readability::colemanLiau(text)} };
        });
    });

    // --- ARI ---
    server_.Post("/v1/ari", [respond](const httplib::Request& req, httplib::Response& res) {
        respond(req, res, [](const std::string& text) {
            int score = readability::automatedReadabilityIndex(text);
            auto grade = readability::convertAriToGrades(score);
            return json{
                {"ari", score},
                {"age", grade.age},
                {"grade", grade.gradeLevel}
            };
        });
    });

    // --- GULPEASE ---
    server_.Post("/v1/gulpease", [respond](const httplib::Request& req, httplib::Response& res) {
        respond(req, res, [](const std::string& text) {
            return json{ {"gulpease", readability::gulpease(text)} };
        });
    });

    // --- FULL REPORT ---
    server_.Post("/v1/analyze", [respond](const httplib::Request& req, httplib::Response& res) {
        respond(req, res, [](const std::string& text) {
            return readability::toJson(readability::analyze(text));
        });
    });

    // --- GRADE LOOKUP ---
    server_.Get(R"(/v1/ari/grades/(-?\d+))", [ok, err, addCors](const httplib::Request& req, httplib::Response& res) {
        int score = 0;
        try {
            score = std::stoi(req.matches[1]);
        }
        catch (const std::exception&) {
            res.status = 400;
            res.set_content(err(400, "Invalid score").dump(), "application/json");
            addCors(res);
            return;
        }
        auto grade = readability::convertAriToGrades(score);
        json data = { {"score", score}, {"age", grade.age}, {"grade", grade.gradeLevel} };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });
}
