#include "weft/render/feed.h"
#include "weft/core/errors.h"
#include "weft/render/renderer.h"
#include <algorithm>

namespace weft {

Feed& Feed::at(int x, int y) {
    return fractAt(fract::fromInt(x), fract::fromInt(y));
}

Feed& Feed::fractAt(fract::Unit x, fract::Unit y) {
    Renderer& renderer = *renderer_;
    position.x = x;
    lineBreakX = x;
    lineBreakAcc = -1;

    const Align vert = vertOf(renderer.state().align);
    if (vert == Align::Baseline || vert == Align::LastBaseline) {
        position.y = y;
        return *this;
    }

    renderer.requireFontAndSizer("position a feed");
    position.y = renderer.alignedY(y, [&renderer]() { return renderer.lineHeight(); });
    return *this;
}

void Feed::draw(Target& target, char32_t codePoint) {
    renderer_->requireDrawable("draw with a feed");
    std::optional<GlyphIndex> glyph = renderer_->resolveGlyph(codePoint);
    if (glyph) {
        traverseGlyph(&target, *glyph);
    }
}

void Feed::drawGlyph(Target& target, GlyphIndex glyph) {
    renderer_->requireDrawable("draw with a feed");
    traverseGlyph(&target, glyph);
}

void Feed::advance(char32_t codePoint) {
    if (codePoint == '\n') {
        lineBreak();
        return;
    }

    renderer_->requireFontAndSizer("advance a feed");
    std::optional<GlyphIndex> glyph = renderer_->resolveGlyph(codePoint);
    if (glyph) {
        traverseGlyph(nullptr, *glyph);
    }
}

void Feed::advanceGlyph(GlyphIndex glyph) {
    renderer_->requireFontAndSizer("advance a feed");
    traverseGlyph(nullptr, glyph);
}

void Feed::lineBreak() {
    Renderer& renderer = *renderer_;
    renderer.requireFontAndSizer("break a feed line");

    lineBreakAcc = std::max(1, lineBreakAcc + 1);
    position.y = fract::quantizeUp(position.y + renderer.opLineAdvance(lineBreakAcc), renderer.state().vertStep());
    position.x = lineBreakX;
}

void Feed::reset() {
    position = fract::Point();
    lineBreakX = 0;
    lineBreakAcc = -1;
    prevGlyph = 0;
}

void Feed::traverseGlyph(Target* target, GlyphIndex glyph) {
    Renderer& renderer = *renderer_;
    const RenderState& state = renderer.state();

    if (state.direction == Direction::LeftToRight) {
        if (lineBreakAcc == 0) {
            position.x += renderer.opKern(prevGlyph, glyph);
        }
        position.x = fract::quantizeUp(position.x, state.horzStep());
        position.y = fract::quantizeUp(position.y, state.vertStep());
        renderer.notifyFract(position);
        if (target) {
            renderer.internalGlyphDraw(*target, glyph, position);
        }
        position.x += renderer.opAdvance(glyph);
    } else {
        position.x -= renderer.opAdvance(glyph);
        if (lineBreakAcc == 0) {
            position.x -= renderer.opKern(glyph, prevGlyph);
        }
        position.x = fract::quantizeUp(position.x, state.horzStep());
        position.y = fract::quantizeUp(position.y, state.vertStep());
        renderer.notifyFract(position);
        if (target) {
            renderer.internalGlyphDraw(*target, glyph, position);
        }
    }

    lineBreakAcc = 0;
    prevGlyph = glyph;
}

} // namespace weft
