#ifndef WEFT_SIZER_SIZER_H
#define WEFT_SIZER_SIZER_H

#include "weft/fract/fract.h"
#include "weft/text/text_types.h"

namespace weft {

/**
 * Sizer: metrics oracle for a (font, scaled size) pair.
 *
 * The renderer calls notifyChange() whenever the font or the scaled size
 * changes, before any other query with the new values, so implementations
 * may cache size dependent metrics there.
 */
class Sizer {
public:
    virtual ~Sizer() = default;

    virtual fract::Unit ascent(const Font& font, fract::Unit size) const = 0;
    // Distance from the baseline to the descent line, positive.
    virtual fract::Unit descent(const Font& font, fract::Unit size) const = 0;
    virtual fract::Unit lineGap(const Font& font, fract::Unit size) const = 0;
    virtual fract::Unit lineHeight(const Font& font, fract::Unit size) const = 0;

    /**
     * Vertical advance for a line break.
     * @param nth 1-based count of consecutive line breaks
     */
    virtual fract::Unit lineAdvance(const Font& font, fract::Unit size, int nth) const = 0;

    virtual fract::Unit xHeight(const Font& font, fract::Unit size) const = 0;
    virtual fract::Unit capHeight(const Font& font, fract::Unit size) const = 0;

    virtual fract::Unit glyphAdvance(const Font& font, fract::Unit size, GlyphIndex glyph) const = 0;
    virtual fract::Unit kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const = 0;

    virtual void notifyChange(const Font& font, fract::Unit size) = 0;
};

} // namespace weft

#endif // WEFT_SIZER_SIZER_H
