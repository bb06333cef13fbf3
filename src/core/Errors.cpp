#include "readability/Errors.hpp"

namespace readability {

const char* errcName(Errc code) {
    switch (code) {
        case Errc::EmptyInput: return "empty_input";
        case Errc::NoWords: return "no_words";
        case Errc::NoSentences: return "no_sentences";
    }
    return "unknown";
}

std::string describeError(const ReadabilityError& e) {
    return std::string(errcName(e.code())) + ": " + e.what();
}

} // namespace readability
