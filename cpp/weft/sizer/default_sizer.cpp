#include "weft/sizer/default_sizer.h"
#include "weft/core/errors.h"
#include "weft/text/font_manager.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

namespace weft {

namespace {

const FontHandle& sizedHandle(const Font& font, fract::Unit size) {
    const FontHandle& handle = requireFontHandle(font);
    if (!handle.setSize(size)) {
        throw ConfigError("can't set font " + std::to_string(font.id()) + " to size " + fract::toString(size));
    }
    return handle;
}

// Top of the glyph for a code point above the baseline, or 0 if unavailable.
fract::Unit glyphTop(const FontHandle& handle, char32_t codePoint) {
    GlyphIndex glyph = handle.glyphIndexOf(codePoint);
    if (glyph == 0) return 0;
    FT_Error error = FT_Load_Glyph(handle.ftFace(), glyph, FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP);
    if (error) return 0;
    return static_cast<fract::Unit>(handle.ftFace()->glyph->metrics.horiBearingY);
}

fract::Unit scaleDesignUnits(const FontHandle& handle, float designUnits, fract::Unit size) {
    if (handle.metrics().unitsPerEM <= 0.0f) return 0;
    double value = static_cast<double>(designUnits) * static_cast<double>(size) / handle.metrics().unitsPerEM;
    return static_cast<fract::Unit>(value + 0.5);
}

} // namespace

fract::Unit DefaultSizer::ascent(const Font&, fract::Unit) const {
    return cachedAscent_;
}

fract::Unit DefaultSizer::descent(const Font&, fract::Unit) const {
    return cachedDescent_;
}

fract::Unit DefaultSizer::lineGap(const Font&, fract::Unit) const {
    return cachedLineHeight_ - cachedAscent_ - cachedDescent_;
}

fract::Unit DefaultSizer::lineHeight(const Font&, fract::Unit) const {
    return cachedLineHeight_;
}

fract::Unit DefaultSizer::lineAdvance(const Font&, fract::Unit, int) const {
    return cachedLineHeight_;
}

fract::Unit DefaultSizer::xHeight(const Font&, fract::Unit) const {
    return cachedXHeight_;
}

fract::Unit DefaultSizer::capHeight(const Font&, fract::Unit) const {
    return cachedCapHeight_;
}

fract::Unit DefaultSizer::glyphAdvance(const Font& font, fract::Unit size, GlyphIndex glyph) const {
    const FontHandle& handle = sizedHandle(font, size);
    return static_cast<fract::Unit>(hb_font_get_glyph_h_advance(handle.hbFont(), glyph));
}

fract::Unit DefaultSizer::kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const {
    const FontHandle& handle = sizedHandle(font, size);
    FT_Face face = handle.ftFace();
    if (!FT_HAS_KERNING(face)) return 0;

    FT_Vector delta{};
    FT_Error error = FT_Get_Kerning(face, prev, curr, FT_KERNING_UNFITTED, &delta);
    if (error) return 0;
    return static_cast<fract::Unit>(delta.x);
}

void DefaultSizer::notifyChange(const Font& font, fract::Unit size) {
    const FontHandle& handle = sizedHandle(font, size);
    const FT_Size_Metrics& metrics = handle.ftFace()->size->metrics;

    cachedAscent_ = static_cast<fract::Unit>(metrics.ascender);
    cachedDescent_ = static_cast<fract::Unit>(-metrics.descender);
    cachedLineHeight_ = static_cast<fract::Unit>(metrics.height);

    if (handle.metrics().xHeight > 0.0f) {
        cachedXHeight_ = scaleDesignUnits(handle, handle.metrics().xHeight, size);
    } else {
        cachedXHeight_ = glyphTop(handle, U'x');
    }
    if (handle.metrics().capHeight > 0.0f) {
        cachedCapHeight_ = scaleDesignUnits(handle, handle.metrics().capHeight, size);
    } else {
        cachedCapHeight_ = glyphTop(handle, U'H');
    }
}

// =============================================================================
// Padded variants
// =============================================================================

fract::Unit PaddedAdvanceSizer::glyphAdvance(const Font& font, fract::Unit size, GlyphIndex glyph) const {
    return DefaultSizer::glyphAdvance(font, size, glyph) + padding_;
}

fract::Unit PaddedKernSizer::kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const {
    return DefaultSizer::kern(font, size, prev, curr) + padding_;
}

fract::Unit PaddedScalableKernSizer::paddingAtSize(fract::Unit size) const {
    return fract::rescale(paddingAt16px_, fract::fromInt(16), size);
}

fract::Unit PaddedScalableKernSizer::kern(const Font& font, fract::Unit size, GlyphIndex prev, GlyphIndex curr) const {
    return DefaultSizer::kern(font, size, prev, curr) + cachedPadding_;
}

void PaddedScalableKernSizer::notifyChange(const Font& font, fract::Unit size) {
    cachedPadding_ = paddingAtSize(size);
    DefaultSizer::notifyChange(font, size);
}

} // namespace weft
