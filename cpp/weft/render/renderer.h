#ifndef WEFT_RENDER_RENDERER_H
#define WEFT_RENDER_RENDERER_H

#include "weft/cache/glyph_cache_handler.h"
#include "weft/fract/fract.h"
#include "weft/mask/rasterizer.h"
#include "weft/render/layout_cursor.h"
#include "weft/render/render_state.h"
#include "weft/render/target.h"
#include "weft/sizer/sizer.h"
#include "weft/text/text_types.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace weft {

class DefaultSizer;
class FreeTypeRasterizer;
class Renderer;
class RendererTwine;
struct TwineContext;

/**
 * Decides what to do with a code point the font has no glyph for: return
 * a replacement glyph, or std::nullopt to skip the code point.
 */
using MissHandler = std::function<std::optional<GlyphIndex>(const Font& font, char32_t codePoint)>;

// Replaces mask loading and compositing for every glyph drawn.
using DrawFunc = std::function<void(Target& target, GlyphIndex glyph, fract::Point origin)>;

using LineChangeFunc = std::function<void(const LineChangeDetails& details)>;

/**
 * Sub-pixel precision operations. Coordinates and limits are fract::Units.
 */
class RendererFract {
public:
    explicit RendererFract(Renderer& renderer) : renderer_(renderer) {}

    void draw(Target& target, std::string_view text, fract::Unit x, fract::Unit y);
    fract::Rect measure(std::string_view text);
    void drawWithWrap(Target& target, std::string_view text, fract::Unit x, fract::Unit y, fract::Unit widthLimit);
    fract::Rect measureWithWrap(std::string_view text, fract::Unit widthLimit);

    void setSize(fract::Unit logicalSize);
    void setScale(fract::Unit scale);
    fract::Unit size() const;
    fract::Unit scale() const;
    fract::Unit scaledSize() const;

private:
    Renderer& renderer_;
};

/**
 * Glyph level operations: glyph lookup, single glyph drawing and the
 * per-glyph hooks.
 */
class RendererGlyph {
public:
    explicit RendererGlyph(Renderer& renderer) : renderer_(renderer) {}

    /**
     * Draw a glyph with its origin exactly at the given position. Align and
     * quantization are not applied.
     */
    void drawGlyph(Target& target, GlyphIndex glyph, fract::Point origin);

    /**
     * Glyph for a code point in the active font, after the miss handler.
     * @return std::nullopt if the miss handler skipped the code point
     * @throws MissingGlyphError if unmapped and no miss handler is set
     */
    std::optional<GlyphIndex> glyphIndexOf(char32_t codePoint);

    /**
     * Mask for a glyph at the given position, through the cache handler.
     * @return The mask, or nullptr if the rasterizer failed
     */
    std::shared_ptr<const GlyphMask> loadMask(GlyphIndex glyph, fract::Point origin);

    void setMissHandler(MissHandler handler);
    void setDrawFunc(DrawFunc fn);
    void setLineChangeFunc(LineChangeFunc fn);

private:
    Renderer& renderer_;
};

/**
 * Renderer: measures and draws text with a single RenderState.
 *
 * Not reentrant: a renderer must be used by one caller at a time. Text is
 * UTF-8. Missing glyphs raise MissingGlyphError unless a miss handler is
 * set through glyph().
 *
 * Drawing needs a font, a sizer and either a rasterizer or a custom draw
 * function. Measuring needs a font and a sizer.
 *
 * Fonts, sizers, rasterizers and cache handlers are borrowed and must
 * outlive the renderer, or be replaced before they are destroyed. The
 * renderer installs its on-change hook on the active rasterizer and
 * removes it when the rasterizer is replaced and on destruction.
 */
class Renderer {
public:
    /**
     * Create a renderer with an owned DefaultSizer and FreeTypeRasterizer
     * and no font.
     */
    Renderer();
    ~Renderer();

    // Non-copyable
    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // =========================================================================
    // State
    // =========================================================================

    const RenderState& state() const { return state_; }

    /**
     * Replace the whole state, then notify the sizer, cache handler and
     * rasterizer hook of what changed.
     * @throws ConfigError if the state is invalid; the old state is kept
     */
    void applyState(const RenderState& next);

    void setFont(const Font* font);
    const Font* font() const { return state_.font; }

    // Logical size in pixels.
    void setSize(float size);
    float size() const { return static_cast<float>(fract::toFloat(state_.logicalSize)); }

    void setScale(float scale);
    float scale() const { return static_cast<float>(fract::toFloat(state_.scale)); }

    /**
     * Set the align. Each component of align that is not empty replaces
     * the current one, so setAlign(Align::Right) keeps the vertical align.
     * @throws ConfigError on Align::None or unknown components
     */
    void setAlign(Align align);
    Align align() const { return state_.align; }

    void setDirection(Direction direction);
    Direction direction() const { return state_.direction; }

    void setQuantization(Quantization horz, Quantization vert);
    Quantization horzQuantization() const { return state_.horzQuantization; }
    Quantization vertQuantization() const { return state_.vertQuantization; }

    void setColor(Color color);
    Color color() const { return state_.color; }

    void setBlendMode(BlendMode mode);
    BlendMode blendMode() const { return state_.blendMode; }

    // Borrowed. nullptr restores the renderer's own DefaultSizer.
    void setSizer(Sizer* sizer);
    Sizer* sizer() const { return state_.sizer; }

    /**
     * Borrowed. nullptr restores the renderer's own FreeTypeRasterizer.
     * The previous rasterizer is unhooked, so it may be destroyed after
     * this call.
     */
    void setRasterizer(Rasterizer* rasterizer);
    Rasterizer* rasterizer() const { return state_.rasterizer; }

    /**
     * Attach a glyph cache handler (borrowed) and synchronize it with the
     * current state. nullptr detaches the current one.
     */
    void setCacheHandler(GlyphCacheHandler* handler);
    GlyphCacheHandler* cacheHandler() const { return cacheHandler_; }

    // =========================================================================
    // Metrics (active font and scaled size)
    // =========================================================================

    fract::Unit ascent() const;
    fract::Unit descent() const;
    fract::Unit lineHeight() const;
    fract::Unit lineAdvance(int nthConsecutiveBreak) const;
    fract::Unit xHeight() const;
    fract::Unit capHeight() const;

    // =========================================================================
    // Text
    // =========================================================================

    /**
     * Draw text at (x, y), interpreted according to the align.
     */
    void draw(Target& target, std::string_view text, int x, int y);

    /**
     * Size of the text as drawn. Align is ignored, the rect has its origin
     * at (0, 0).
     */
    fract::Rect measure(std::string_view text);

    /**
     * Like draw(), breaking lines at spaces so no line is wider than
     * widthLimit pixels, unless a single glyph is wider on its own.
     * @throws UnimplementedError for Left align with RightToLeft and
     *         Right align with LeftToRight
     */
    void drawWithWrap(Target& target, std::string_view text, int x, int y, int widthLimit);
    fract::Rect measureWithWrap(std::string_view text, int widthLimit);

    // =========================================================================
    // Gateways
    // =========================================================================

    RendererFract fract() { return RendererFract(*this); }
    RendererGlyph glyph() { return RendererGlyph(*this); }
    RendererTwine twine();

private:
    friend class RendererFract;
    friend class RendererGlyph;
    friend class RendererTwine;
    friend class TwineOperator;
    friend class Feed;

    struct WrapLine {
        fract::Unit width = 0;     // quantized
        std::size_t drawEnd = 0;   // end of the runes to draw on this line
        std::size_t next = 0;      // start of the next line
        char32_t terminal = 0;     // '\n', utf8::kEndOfText or the rune that wrapped
        bool elidedSpace = false;
    };

    // preconditions
    void requireFontAndSizer(const char* operation) const;
    void requireDrawable(const char* operation) const;

    // metrics for the active state
    fract::Unit opAdvance(GlyphIndex glyph) const;
    fract::Unit opKern(GlyphIndex prev, GlyphIndex curr) const;
    fract::Unit opLineAdvance(int nth) const;

    // glyph lookup honoring the miss handler
    std::optional<GlyphIndex> resolveGlyph(char32_t codePoint);

    // vertical align resolution; height is only measured when needed
    fract::Unit alignedY(fract::Unit y, const std::function<fract::Unit()>& measureHeight) const;

    // glyph steps shared by every traversal; a null target only advances
    void notifyFract(fract::Point position);
    void internalGlyphDraw(Target& target, GlyphIndex glyph, fract::Point origin);
    std::shared_ptr<const GlyphMask> loadGlyphMask(GlyphIndex glyph, fract::Point origin);
    fract::Point drawGlyphLTR(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor);
    fract::Point drawGlyphRTL(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor);
    fract::Point advanceLine(fract::Point position, fract::Unit lineBreakX, int lineBreakNth, LayoutCursor& cursor);
    fract::Point drawLine(Target& target, std::string_view line, fract::Point position,
                          bool reverseRunes, bool stepRTL, LayoutCursor& cursor);

    // plain text measuring helpers
    fract::Unit measureLineLTR(std::string_view line);
    fract::Unit measureLineReverseLTR(std::string_view line);
    fract::Unit measureHeight(std::string_view text);
    WrapLine measureWrapLine(std::string_view text, std::size_t pos, fract::Unit widthLimit, bool reverse);

    // fractional entry points
    void fractDraw(Target& target, std::string_view text, fract::Unit x, fract::Unit y);
    fract::Rect fractMeasure(std::string_view text);
    void fractDrawWithWrap(Target& target, std::string_view text, fract::Unit x, fract::Unit y, fract::Unit widthLimit);
    fract::Rect fractMeasureWithWrap(std::string_view text, fract::Unit widthLimit);

    void attachRasterizerHook(Rasterizer* rasterizer);

    RenderState state_;
    GlyphCacheHandler* cacheHandler_ = nullptr;
    std::unique_ptr<DefaultSizer> ownedSizer_;
    std::unique_ptr<FreeTypeRasterizer> ownedRasterizer_;

    MissHandler missHandler_;
    DrawFunc drawFunc_;
    LineChangeFunc lineChangeFunc_;

    std::unique_ptr<TwineContext> twine_;
};

} // namespace weft

#endif // WEFT_RENDER_RENDERER_H
