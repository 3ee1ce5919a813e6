#ifndef WEFT_SIZER_DEFAULT_SIZER_H
#define WEFT_SIZER_DEFAULT_SIZER_H

#include "weft/sizer/sizer.h"

namespace weft {

/**
 * DefaultSizer: metrics straight from the font.
 *
 * Vertical metrics come from the FreeType size metrics and are cached on
 * notifyChange(). Advances are queried through HarfBuzz and kerning through
 * the font's kern table. Line advance is the line height regardless of the
 * number of consecutive breaks.
 *
 * Requires fonts loaded by a FontManager.
 */
class DefaultSizer : public Sizer {
public:
    fract::Unit ascent(const Font& font, fract::Unit size) const override;
    fract::Unit descent(const Font& font, fract::Unit size) const override;
    fract::Unit lineGap(const Font& font, fract::Unit size) const override;
    fract::Unit lineHeight(const Font& font, fract::Unit size) const override;
    fract::Unit lineAdvance(const Font& font, fract::Unit size, int nth) const override;
    fract::Unit xHeight(const Font& font, fract::Unit size) const override;
    fract::Unit capHeight(const Font& font, fract::Unit size) const override;
    fract::Unit glyphAdvance(const Font& font, fract::Unit size, GlyphIndex glyph) const override;
    fract::Unit kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const override;
    void notifyChange(const Font& font, fract::Unit size) override;

protected:
    fract::Unit cachedAscent_ = 0;
    fract::Unit cachedDescent_ = 0;
    fract::Unit cachedLineHeight_ = 0;
    fract::Unit cachedXHeight_ = 0;
    fract::Unit cachedCapHeight_ = 0;
};

/**
 * Adds a fixed padding to every glyph advance.
 */
class PaddedAdvanceSizer : public DefaultSizer {
public:
    explicit PaddedAdvanceSizer(fract::Unit padding = 0) : padding_(padding) {}

    void setPadding(fract::Unit padding) { padding_ = padding; }
    fract::Unit padding() const { return padding_; }

    fract::Unit glyphAdvance(const Font& font, fract::Unit size, GlyphIndex glyph) const override;

private:
    fract::Unit padding_;
};

/**
 * Adds a fixed padding to the kerning between every glyph pair.
 */
class PaddedKernSizer : public DefaultSizer {
public:
    explicit PaddedKernSizer(fract::Unit padding = 0) : padding_(padding) {}

    void setPadding(fract::Unit padding) { padding_ = padding; }
    fract::Unit padding() const { return padding_; }

    fract::Unit kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const override;

private:
    fract::Unit padding_;
};

/**
 * Like PaddedKernSizer, but the padding is given for a 16px size and scaled
 * linearly with the active size.
 */
class PaddedScalableKernSizer : public DefaultSizer {
public:
    explicit PaddedScalableKernSizer(fract::Unit paddingAt16px = 0) : paddingAt16px_(paddingAt16px) {}

    // Takes effect on the next notifyChange().
    void setPaddingAt16px(fract::Unit padding) { paddingAt16px_ = padding; }
    fract::Unit paddingAtSize(fract::Unit size) const;

    fract::Unit kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const override;
    void notifyChange(const Font& font, fract::Unit size) override;

private:
    fract::Unit paddingAt16px_;
    fract::Unit cachedPadding_ = 0;
};

} // namespace weft

#endif // WEFT_SIZER_DEFAULT_SIZER_H
