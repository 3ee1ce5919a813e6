#ifndef WEFT_RENDER_LINE_ITERATOR_H
#define WEFT_RENDER_LINE_ITERATOR_H

#include "weft/core/utf8.h"
#include <cstddef>
#include <string_view>

namespace weft {

/**
 * Splits text into lines at '\n'. The line break itself is not part of
 * the returned line.
 */
class LineIterator {
public:
    explicit LineIterator(std::string_view text) : text_(text) {}

    /**
     * Next line, or false once the whole text has been returned.
     * @param endsWithBreak Set to true if the line is followed by '\n'
     */
    bool next(std::string_view& line, bool& endsWithBreak);

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    bool done_ = false;
};

/**
 * Reads the code points of a single line forwards or backwards.
 */
class RuneReader {
public:
    RuneReader(std::string_view line, bool reverse)
        : line_(line), pos_(reverse ? line.size() : 0), reverse_(reverse) {}

    // Next code point, or utf8::kEndOfText.
    char32_t next() {
        return reverse_ ? utf8::decodePrev(line_, pos_) : utf8::decodeNext(line_, pos_);
    }

private:
    std::string_view line_;
    std::size_t pos_;
    bool reverse_;
};

} // namespace weft

#endif // WEFT_RENDER_LINE_ITERATOR_H
