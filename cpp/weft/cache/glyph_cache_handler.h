#ifndef WEFT_CACHE_GLYPH_CACHE_HANDLER_H
#define WEFT_CACHE_GLYPH_CACHE_HANDLER_H

#include "weft/fract/fract.h"
#include "weft/mask/glyph_mask.h"
#include "weft/mask/rasterizer.h"
#include "weft/text/text_types.h"
#include <memory>

namespace weft {

/**
 * GlyphCacheHandler: the renderer's view of a glyph mask cache.
 *
 * The renderer keeps the handler informed of the active font, size,
 * rasterizer and sub-pixel position, so lookups only need the glyph index.
 * A handler is attached to a single renderer at a time.
 */
class GlyphCacheHandler {
public:
    virtual ~GlyphCacheHandler() = default;

    virtual void notifyFontChange(const Font* font) = 0;
    virtual void notifySizeChange(fract::Unit size) = 0;
    virtual void notifyRasterizerChange(const Rasterizer& rasterizer) = 0;

    // Called whenever the fractional part of the next draw position may differ.
    virtual void notifyFractChange(fract::Point position) = 0;

    // Returns nullptr on a cache miss.
    virtual std::shared_ptr<const GlyphMask> getMask(GlyphIndex glyph) = 0;
    virtual void passMask(GlyphIndex glyph, std::shared_ptr<const GlyphMask> mask) = 0;
};

} // namespace weft

#endif // WEFT_CACHE_GLYPH_CACHE_HANDLER_H
