#ifndef WEFT_RENDER_FEED_H
#define WEFT_RENDER_FEED_H

#include "weft/fract/fract.h"
#include "weft/render/target.h"
#include "weft/text/text_types.h"

namespace weft {

class Renderer;

/**
 * Feed: a pen for manual glyph-by-glyph layout.
 *
 * Applies the same kerning, advance and quantization rules as the
 * renderer's own traversal, one glyph at a time. There is no lookahead,
 * wrapping or twine support; horizontal align is ignored.
 *
 * The fields are public and may be adjusted between calls.
 */
class Feed {
public:
    explicit Feed(Renderer& renderer) : renderer_(&renderer) {}

    fract::Point position;
    fract::Unit lineBreakX = 0;
    // Consecutive line breaks since the last glyph. -1 right after at().
    int lineBreakAcc = -1;
    GlyphIndex prevGlyph = 0;

    /**
     * Move the pen to (x, y), resolving the vertical align of the renderer
     * as if the text had a single line. Also sets lineBreakX.
     */
    Feed& at(int x, int y);
    Feed& fractAt(fract::Unit x, fract::Unit y);

    // Draws the glyph for the code point. Skipped if the miss handler skips it.
    void draw(Target& target, char32_t codePoint);
    void drawGlyph(Target& target, GlyphIndex glyph);

    // Like draw() without drawing. '\n' performs a line break.
    void advance(char32_t codePoint);
    void advanceGlyph(GlyphIndex glyph);

    void lineBreak();

    // Zero the pen. The renderer is kept.
    void reset();

    Renderer& renderer() const { return *renderer_; }

private:
    void traverseGlyph(Target* target, GlyphIndex glyph);

    Renderer* renderer_;
};

} // namespace weft

#endif // WEFT_RENDER_FEED_H
