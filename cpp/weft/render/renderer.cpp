#include "weft/render/renderer.h"
#include "weft/core/errors.h"
#include "weft/core/logging.h"
#include "weft/core/utf8.h"
#include "weft/mask/freetype_rasterizer.h"
#include "weft/sizer/default_sizer.h"
#include "weft/twine/twine_context.h"

namespace weft {

Renderer::Renderer()
    : ownedSizer_(std::make_unique<DefaultSizer>()),
      ownedRasterizer_(std::make_unique<FreeTypeRasterizer>()),
      twine_(std::make_unique<TwineContext>()) {
    state_.sizer = ownedSizer_.get();
    state_.rasterizer = ownedRasterizer_.get();
    attachRasterizerHook(state_.rasterizer);
    registerBuiltinEffects(*twine_);
}

Renderer::~Renderer() {
    if (state_.rasterizer) {
        state_.rasterizer->setOnChangeFunc(nullptr);
    }
}

// =============================================================================
// State
// =============================================================================

void Renderer::applyState(const RenderState& next) {
    if (vertOf(next.align) == Align::None || horzOf(next.align) == Align::None || !isValidAlign(next.align)) {
        throw ConfigError("invalid align " + toString(next.align) + " (both components required)");
    }
    if (!fract::isValidStep(next.horzStep()) || !fract::isValidStep(next.vertStep())) {
        throw ConfigError("invalid quantization");
    }
    if (next.logicalSize <= 0 || next.scale <= 0 || next.scaledSize() <= 0) {
        throw ConfigError("size and scale must be positive (size " + fract::toString(next.logicalSize)
            + ", scale " + fract::toString(next.scale) + ")");
    }

    const RenderState prev = state_;
    const bool fontChanged = next.font != prev.font;
    const bool sizeChanged = next.scaledSize() != prev.scaledSize();
    const bool sizerChanged = next.sizer != prev.sizer;
    const bool rasterizerChanged = next.rasterizer != prev.rasterizer;

    // the sizer may reject the font, so notify it before committing
    if ((fontChanged || sizeChanged || sizerChanged) && next.font && next.sizer) {
        try {
            next.sizer->notifyChange(*next.font, next.scaledSize());
        } catch (const ConfigError& e) {
            WEFT_LOG_WARN("sizer rejected font %u: %s", static_cast<unsigned>(next.font->id()), e.what());
            throw;
        }
    }

    state_ = next;

    if (rasterizerChanged) {
        if (prev.rasterizer) {
            prev.rasterizer->setOnChangeFunc(nullptr);
        }
        attachRasterizerHook(state_.rasterizer);
    }

    if (cacheHandler_) {
        if (fontChanged) {
            cacheHandler_->notifyFontChange(state_.font);
        }
        if (sizeChanged) {
            cacheHandler_->notifySizeChange(state_.scaledSize());
        }
        if (rasterizerChanged && state_.rasterizer) {
            cacheHandler_->notifyRasterizerChange(*state_.rasterizer);
        }
    }
}

void Renderer::attachRasterizerHook(Rasterizer* rasterizer) {
    if (!rasterizer) {
        return;
    }
    rasterizer->setOnChangeFunc([this](const Rasterizer& changed) {
        if (cacheHandler_) {
            cacheHandler_->notifyRasterizerChange(changed);
        }
    });
}

void Renderer::setFont(const Font* font) {
    RenderState next = state_;
    next.font = font;
    applyState(next);
}

void Renderer::setSize(float size) {
    RenderState next = state_;
    next.logicalSize = fract::fromFloatUp(size);
    applyState(next);
}

void Renderer::setScale(float scale) {
    RenderState next = state_;
    next.scale = fract::fromFloatUp(scale);
    applyState(next);
}

void Renderer::setAlign(Align align) {
    if (align == Align::None || !isValidAlign(align)) {
        throw ConfigError("invalid align " + toString(align));
    }
    RenderState next = state_;
    next.align = adjustedAlign(state_.align, align);
    applyState(next);
}

void Renderer::setDirection(Direction direction) {
    RenderState next = state_;
    next.direction = direction;
    applyState(next);
}

void Renderer::setQuantization(Quantization horz, Quantization vert) {
    RenderState next = state_;
    next.horzQuantization = horz;
    next.vertQuantization = vert;
    applyState(next);
}

void Renderer::setColor(Color color) {
    RenderState next = state_;
    next.color = color;
    applyState(next);
}

void Renderer::setBlendMode(BlendMode mode) {
    RenderState next = state_;
    next.blendMode = mode;
    applyState(next);
}

void Renderer::setSizer(Sizer* sizer) {
    RenderState next = state_;
    next.sizer = sizer ? sizer : ownedSizer_.get();
    applyState(next);
}

void Renderer::setRasterizer(Rasterizer* rasterizer) {
    RenderState next = state_;
    next.rasterizer = rasterizer ? rasterizer : ownedRasterizer_.get();
    applyState(next);
}

void Renderer::setCacheHandler(GlyphCacheHandler* handler) {
    cacheHandler_ = handler;
    if (!cacheHandler_) {
        return;
    }

    cacheHandler_->notifyFontChange(state_.font);
    cacheHandler_->notifySizeChange(state_.scaledSize());
    if (state_.rasterizer) {
        cacheHandler_->notifyRasterizerChange(*state_.rasterizer);
    }
    cacheHandler_->notifyFractChange(fract::Point());
}

// =============================================================================
// Metrics
// =============================================================================

void Renderer::requireFontAndSizer(const char* operation) const {
    if (!state_.font) {
        throw ConfigError(std::string("can't ") + operation + " with a null font (see Renderer::setFont)");
    }
    if (!state_.sizer) {
        throw ConfigError(std::string("can't ") + operation + " with a null sizer");
    }
}

void Renderer::requireDrawable(const char* operation) const {
    requireFontAndSizer(operation);
    if (!state_.rasterizer && !drawFunc_) {
        throw ConfigError(std::string("can't ") + operation + " without a rasterizer or a custom draw function");
    }
}

fract::Unit Renderer::ascent() const {
    requireFontAndSizer("query ascent");
    return state_.sizer->ascent(*state_.font, state_.scaledSize());
}

fract::Unit Renderer::descent() const {
    requireFontAndSizer("query descent");
    return state_.sizer->descent(*state_.font, state_.scaledSize());
}

fract::Unit Renderer::lineHeight() const {
    requireFontAndSizer("query line height");
    return state_.sizer->lineHeight(*state_.font, state_.scaledSize());
}

fract::Unit Renderer::lineAdvance(int nthConsecutiveBreak) const {
    requireFontAndSizer("query line advance");
    return opLineAdvance(nthConsecutiveBreak);
}

fract::Unit Renderer::xHeight() const {
    requireFontAndSizer("query x-height");
    return state_.sizer->xHeight(*state_.font, state_.scaledSize());
}

fract::Unit Renderer::capHeight() const {
    requireFontAndSizer("query cap height");
    return state_.sizer->capHeight(*state_.font, state_.scaledSize());
}

fract::Unit Renderer::opAdvance(GlyphIndex glyph) const {
    return state_.sizer->glyphAdvance(*state_.font, state_.scaledSize(), glyph);
}

fract::Unit Renderer::opKern(GlyphIndex prev, GlyphIndex curr) const {
    return state_.sizer->kern(*state_.font, state_.scaledSize(), prev, curr);
}

fract::Unit Renderer::opLineAdvance(int nth) const {
    return state_.sizer->lineAdvance(*state_.font, state_.scaledSize(), nth);
}

// =============================================================================
// Glyph steps
// =============================================================================

std::optional<GlyphIndex> Renderer::resolveGlyph(char32_t codePoint) {
    GlyphIndex glyph = state_.font->glyphIndexOf(codePoint);
    if (glyph != 0) {
        return glyph;
    }

    if (missHandler_) {
        std::optional<GlyphIndex> replacement = missHandler_(*state_.font, codePoint);
        WEFT_LOG_DEBUG("glyph for %s missing, miss handler %s", utf8::describe(codePoint).c_str(),
            replacement ? "substituted it" : "skipped it");
        return replacement;
    }

    throw MissingGlyphError(codePoint, "glyph for " + utf8::describe(codePoint)
        + " missing in font " + std::to_string(state_.font->id()));
}

fract::Unit Renderer::alignedY(fract::Unit y, const std::function<fract::Unit()>& measureHeight) const {
    const fract::Unit vertStep = state_.vertStep();
    switch (vertOf(state_.align)) {
        case Align::Top:
            return fract::quantizeUp(y + ascent(), vertStep);
        case Align::CapLine:
            return fract::quantizeUp(y + ascent() - capHeight(), vertStep);
        case Align::Midline:
            return fract::quantizeUp(y + ascent() - xHeight(), vertStep);
        case Align::VertCenter:
            return fract::quantizeUp(y + ascent() - (measureHeight() >> 1), vertStep);
        case Align::Baseline:
            return fract::quantizeUp(y, vertStep);
        case Align::LastBaseline: {
            fract::Unit height = measureHeight();
            fract::Unit qtLineHeight = fract::quantizeUp(lineHeight(), vertStep);
            if (height >= qtLineHeight) {
                height -= qtLineHeight;
            }
            return fract::quantizeUp(y - height, vertStep);
        }
        case Align::Bottom:
            return fract::quantizeUp(y + ascent() - measureHeight(), vertStep);
        default:
            throw ConfigError("invalid vertical align " + toString(state_.align));
    }
}

void Renderer::notifyFract(fract::Point position) {
    if (cacheHandler_) {
        cacheHandler_->notifyFractChange(position);
    }
}

std::shared_ptr<const GlyphMask> Renderer::loadGlyphMask(GlyphIndex glyph, fract::Point origin) {
    if (cacheHandler_) {
        std::shared_ptr<const GlyphMask> cached = cacheHandler_->getMask(glyph);
        if (cached) {
            return cached;
        }
    }

    if (!state_.rasterizer) {
        throw ConfigError("can't load glyph masks with a null rasterizer");
    }
    std::shared_ptr<const GlyphMask> mask = state_.rasterizer->rasterize(*state_.font, glyph, state_.scaledSize(), origin);
    if (!mask) {
        WEFT_LOG_WARN("rasterizer failed for glyph %u", static_cast<unsigned>(glyph));
        return nullptr;
    }

    if (cacheHandler_) {
        cacheHandler_->passMask(glyph, mask);
    }
    return mask;
}

void Renderer::internalGlyphDraw(Target& target, GlyphIndex glyph, fract::Point origin) {
    if (drawFunc_) {
        drawFunc_(target, glyph, origin);
        return;
    }

    std::shared_ptr<const GlyphMask> mask = loadGlyphMask(glyph, origin);
    if (!mask || mask->empty()) {
        return;
    }
    target.drawMask(*mask,
        fract::toIntFloor(origin.x) + mask->offsetX,
        fract::toIntFloor(origin.y) + mask->offsetY,
        state_.color, state_.blendMode);
}

fract::Point Renderer::drawGlyphLTR(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor) {
    if (cursor.lineBreakNth == 0) {
        position.x += opKern(cursor.prevGlyph, glyph);
    } else {
        cursor.lineBreakNth = 0;
    }

    position.x = fract::quantizeUp(position.x, state_.horzStep());
    if (target) {
        if (fract::fractShift(position.x) != cursor.prevFractX) {
            cursor.prevFractX = fract::fractShift(position.x);
            notifyFract(position);
        }
        internalGlyphDraw(*target, glyph, position);
    }
    position.x += opAdvance(glyph);
    cursor.prevGlyph = glyph;
    return position;
}

fract::Point Renderer::drawGlyphRTL(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor) {
    position.x -= opAdvance(glyph);
    if (cursor.lineBreakNth == 0) {
        position.x -= opKern(glyph, cursor.prevGlyph);
    } else {
        cursor.lineBreakNth = 0;
    }

    position.x = fract::quantizeUp(position.x, state_.horzStep());
    if (target) {
        if (fract::fractShift(position.x) != cursor.prevFractX) {
            cursor.prevFractX = fract::fractShift(position.x);
            notifyFract(position);
        }
        internalGlyphDraw(*target, glyph, position);
    }
    cursor.prevGlyph = glyph;
    return position;
}

fract::Point Renderer::advanceLine(fract::Point position, fract::Unit lineBreakX, int lineBreakNth, LayoutCursor& cursor) {
    const fract::Unit prevFractY = fract::fractShift(position.y);
    position.x = lineBreakX;
    position.y = fract::quantizeUp(position.y + opLineAdvance(lineBreakNth), state_.vertStep());
    if (fract::fractShift(position.y) != prevFractY) {
        cursor.prevFractX = fract::fractShift(position.x);
        notifyFract(position);
    }
    return position;
}

// =============================================================================
// RendererFract
// =============================================================================

void RendererFract::draw(Target& target, std::string_view text, fract::Unit x, fract::Unit y) {
    renderer_.fractDraw(target, text, x, y);
}

fract::Rect RendererFract::measure(std::string_view text) {
    return renderer_.fractMeasure(text);
}

void RendererFract::drawWithWrap(Target& target, std::string_view text, fract::Unit x, fract::Unit y, fract::Unit widthLimit) {
    renderer_.fractDrawWithWrap(target, text, x, y, widthLimit);
}

fract::Rect RendererFract::measureWithWrap(std::string_view text, fract::Unit widthLimit) {
    return renderer_.fractMeasureWithWrap(text, widthLimit);
}

void RendererFract::setSize(fract::Unit logicalSize) {
    RenderState next = renderer_.state_;
    next.logicalSize = logicalSize;
    renderer_.applyState(next);
}

void RendererFract::setScale(fract::Unit scale) {
    RenderState next = renderer_.state_;
    next.scale = scale;
    renderer_.applyState(next);
}

fract::Unit RendererFract::size() const {
    return renderer_.state_.logicalSize;
}

fract::Unit RendererFract::scale() const {
    return renderer_.state_.scale;
}

fract::Unit RendererFract::scaledSize() const {
    return renderer_.state_.scaledSize();
}

// =============================================================================
// RendererGlyph
// =============================================================================

void RendererGlyph::drawGlyph(Target& target, GlyphIndex glyph, fract::Point origin) {
    renderer_.requireDrawable("draw glyphs");
    renderer_.notifyFract(origin);
    renderer_.internalGlyphDraw(target, glyph, origin);
}

std::optional<GlyphIndex> RendererGlyph::glyphIndexOf(char32_t codePoint) {
    renderer_.requireFontAndSizer("look up glyphs");
    return renderer_.resolveGlyph(codePoint);
}

std::shared_ptr<const GlyphMask> RendererGlyph::loadMask(GlyphIndex glyph, fract::Point origin) {
    renderer_.requireFontAndSizer("load glyph masks");
    renderer_.notifyFract(origin);
    return renderer_.loadGlyphMask(glyph, origin);
}

void RendererGlyph::setMissHandler(MissHandler handler) {
    renderer_.missHandler_ = std::move(handler);
}

void RendererGlyph::setDrawFunc(DrawFunc fn) {
    renderer_.drawFunc_ = std::move(fn);
}

void RendererGlyph::setLineChangeFunc(LineChangeFunc fn) {
    renderer_.lineChangeFunc_ = std::move(fn);
}

} // namespace weft
