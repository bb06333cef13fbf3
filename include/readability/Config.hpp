#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace readability {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::size_t maxBodyBytes = 1024 * 1024;
    bool cors = true;
};

// Tunables come from READABILITY_HOST, READABILITY_PORT,
// READABILITY_MAX_BODY and READABILITY_CORS. Invalid values keep the default.
ServerConfig loadServerConfig();
ServerConfig loadServerConfig(const std::function<const char*(const char*)>& getenv);

} // namespace readability
