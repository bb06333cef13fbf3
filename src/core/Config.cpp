#include "readability/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace readability {

ServerConfig loadServerConfig() {
    return loadServerConfig([](const char* name) { return std::getenv(name); });
}

ServerConfig loadServerConfig(const std::function<const char*(const char*)>& getenv) {
    ServerConfig cfg;

    if (const char* envHost = getenv("READABILITY_HOST")) {
        if (*envHost) cfg.host = envHost;
    }
    if (const char* envPort = getenv("READABILITY_PORT")) {
        try {
            unsigned long port = std::stoul(envPort);
            if (port >= 1 && port <= 65535) {
                cfg.port = static_cast<int>(port);
            } else {
                std::cerr << "Config: READABILITY_PORT out of range, using " << cfg.port << "\n";
            }
        } catch (const std::exception&) {
            std::cerr << "Config: invalid READABILITY_PORT, using " << cfg.port << "\n";
        }
    }
    if (const char* envBody = getenv("READABILITY_MAX_BODY")) {
        try {
            cfg.maxBodyBytes = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(envBody)));
        } catch (const std::exception&) {
            std::cerr << "Config: invalid READABILITY_MAX_BODY, using " << cfg.maxBodyBytes << "\n";
        }
    }
    if (const char* envCors = getenv("READABILITY_CORS")) {
        std::string v(envCors);
        cfg.cors = !(v == "0" || v == "false" || v == "off");
    }

    return cfg;
}

} // namespace readability
