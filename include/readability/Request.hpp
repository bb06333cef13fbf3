#pragma once

#include <string>

namespace readability {

// Text to analyze from an HTTP body: {"text": "..."} when the content type is
// application/json, the raw body otherwise. Throws nlohmann::json::parse_error
// on malformed JSON and std::invalid_argument when "text" is not a string.
std::string requestText(const std::string& contentType, const std::string& body);

} // namespace readability
