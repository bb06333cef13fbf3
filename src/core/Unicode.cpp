#include "readability/Unicode.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace readability::unicode {

std::vector<UChar32> decode(const std::string& text) {
    std::vector<UChar32> out;
    if (text.empty()) return out;

    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);
    out.reserve(static_cast<size_t>(u.length()));
    for (int32_t i = 0; i < u.length(); i = u.moveIndex32(i, 1)) {
        out.push_back(u.char32At(i));
    }
    return out;
}

std::vector<std::string> splitOnWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    const char* s = text.data();
    const int32_t length = static_cast<int32_t>(text.size());

    int32_t start = -1;
    int32_t i = 0;
    while (i < length) {
        int32_t at = i;
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        // U8_NEXT yields a negative value for ill-formed input; treat it as a
        // visible character like U+FFFD.
        bool space = c >= 0 && u_isUWhiteSpace(c);
        if (space) {
            if (start >= 0) {
                tokens.emplace_back(s + start, static_cast<size_t>(at - start));
                start = -1;
            }
        } else if (start < 0) {
            start = at;
        }
    }
    if (start >= 0) {
        tokens.emplace_back(s + start, static_cast<size_t>(length - start));
    }
    return tokens;
}

bool isLetterOrDigit(UChar32 c) {
    return u_isalpha(c) || u_isdigit(c);
}

bool isLetter(UChar32 c) {
    return u_isalpha(c);
}

bool isWhitespace(UChar32 c) {
    return u_isUWhiteSpace(c);
}

std::string toLower(const std::string& text) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

} // namespace readability::unicode
