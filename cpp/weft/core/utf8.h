#ifndef WEFT_CORE_UTF8_H
#define WEFT_CORE_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>

namespace weft::utf8 {

// Code point returned when the end of the text is reached.
constexpr char32_t kEndOfText = static_cast<char32_t>(-1);

// Replacement for invalid or truncated sequences.
constexpr char32_t kReplacement = 0xFFFD;

/**
 * Decode the code point starting at pos and move pos past it.
 * @return kEndOfText if pos is already at the end of the text
 */
char32_t decodeNext(std::string_view text, std::size_t& pos);

/**
 * Decode the code point ending right before pos and move pos to its start.
 * @return kEndOfText if pos is already at the start of the text
 */
char32_t decodePrev(std::string_view text, std::size_t& pos);

/**
 * Append the UTF-8 encoding of a code point. Invalid code points are
 * written as U+FFFD.
 */
void append(std::string& out, char32_t codePoint);

// Formats a code point as U+XXXX for error messages.
std::string describe(char32_t codePoint);

} // namespace weft::utf8

#endif // WEFT_CORE_UTF8_H
