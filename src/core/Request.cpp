#include "readability/Request.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

namespace readability {

std::string requestText(const std::string& contentType, const std::string& body) {
    if (contentType.find("application/json") == std::string::npos) {
        return body;
    }
    auto j = nlohmann::json::parse(body);
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        throw std::invalid_argument("expected an object with a string field 'text'");
    }
    return j["text"].get<std::string>();
}

} // namespace readability
