#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "readability/Config.hpp"
#include <nlohmann/json.hpp>

class ReadabilityHttpServer {
public:
    explicit ReadabilityHttpServer(readability::ServerConfig config);
    void run();

private:
    void setupRoutes();

    readability::ServerConfig config_;
    httplib::Server server_;
    std::chrono::steady_clock::time_point startTime_;
};
