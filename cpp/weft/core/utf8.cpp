#include "weft/core/utf8.h"

#include <cstdint>
#include <cstdio>

namespace weft::utf8 {

static bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

char32_t decodeNext(std::string_view text, std::size_t& pos) {
    if (pos >= text.size()) return kEndOfText;
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if (c < 0x80) {
        pos++;
        return c;
    }

    std::uint32_t val = 0;
    std::size_t len = 0;
    if ((c & 0xE0) == 0xC0) { val = c & 0x1F; len = 2; }
    else if ((c & 0xF0) == 0xE0) { val = c & 0x0F; len = 3; }
    else if ((c & 0xF8) == 0xF0) { val = c & 0x07; len = 4; }
    else { pos++; return kReplacement; }

    for (std::size_t i = 1; i < len; ++i) {
        if (pos + i >= text.size() || !isContinuation(static_cast<unsigned char>(text[pos + i]))) {
            pos += i;
            return kReplacement;
        }
        val = (val << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    pos += len;
    return static_cast<char32_t>(val);
}

char32_t decodePrev(std::string_view text, std::size_t& pos) {
    if (pos == 0 || pos > text.size()) return kEndOfText;

    // walk back over at most three continuation bytes
    std::size_t start = pos - 1;
    std::size_t steps = 0;
    while (start > 0 && steps < 3 && isContinuation(static_cast<unsigned char>(text[start]))) {
        start--;
        steps++;
    }

    std::size_t end = start;
    char32_t codePoint = decodeNext(text, end);
    if (end != pos) {
        // the lead byte doesn't cover the trailing bytes, step one byte only
        pos -= 1;
        return kReplacement;
    }
    pos = start;
    return codePoint;
}

void append(std::string& out, char32_t codePoint) {
    std::uint32_t cp = static_cast<std::uint32_t>(codePoint);
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = kReplacement;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string describe(char32_t codePoint) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(codePoint));
    return buffer;
}

} // namespace weft::utf8
