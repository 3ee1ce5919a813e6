#ifndef WEFT_RENDER_LAYOUT_CURSOR_H
#define WEFT_RENDER_LAYOUT_CURSOR_H

#include "weft/fract/fract.h"
#include "weft/text/text_types.h"
#include <algorithm>

namespace weft {

/**
 * Reported to the line change function on every line change while drawing
 * with wrap.
 */
struct LineChangeDetails {
    bool isWrap = false;      // false for explicit '\n' breaks
    bool elidedSpace = false; // the wrap consumed a space that wasn't drawn
};

/**
 * LayoutCursor: transient per-call traversal values.
 *
 * lineBreakNth is 0 right after a glyph, the count of consecutive line
 * breaks after a break, and -1 when kerning with the previous glyph must be
 * skipped without counting as a break.
 */
struct LayoutCursor {
    int lineBreakNth = -1;
    fract::Unit prevFractX = 0;
    GlyphIndex prevGlyph = 0;
    LineChangeDetails lineChange;

    void interruptKerning() { lineBreakNth = -1; }
    void increaseLineBreakNth() { lineBreakNth = std::max(1, lineBreakNth + 1); }
};

} // namespace weft

#endif // WEFT_RENDER_LAYOUT_CURSOR_H
