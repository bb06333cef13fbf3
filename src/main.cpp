#include "ReadabilityHttpServer.hpp"
#include <iostream>

int main() {
    try {
        ReadabilityHttpServer app(readability::loadServerConfig());
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
