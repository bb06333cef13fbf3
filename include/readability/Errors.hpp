#pragma once

#include <stdexcept>
#include <string>

namespace readability {

enum class Errc {
    EmptyInput,
    NoWords,
    NoSentences,
};

// Stable machine-readable name ("empty_input", "no_words", "no_sentences").
const char* errcName(Errc code);

// Thrown by the formulas when a precondition on the counts does not hold.
class ReadabilityError : public std::runtime_error {
public:
    ReadabilityError(Errc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    Errc code() const { return code_; }

private:
    Errc code_;
};

// "<errcName>: <message>", as reported to clients.
std::string describeError(const ReadabilityError& e);

} // namespace readability
