#include "weft/twine/renderer_twine.h"
#include "weft/core/errors.h"
#include "weft/core/utf8.h"
#include "weft/render/renderer.h"
#include "weft/twine/twine_context.h"
#include "weft/twine/twine_operator.h"
#include <algorithm>

namespace weft {

namespace {

// Renderer values a twine operation may change through its effects.
struct TwineSnapshot {
    RenderState state;
    std::vector<StoredValue> storage;
    FontIndex fontIndex = 0;

    TwineSnapshot(const Renderer& renderer, const TwineContext& context)
        : state(renderer.state()), storage(context.storage), fontIndex(context.fontIndex) {}

    void restore(Renderer& renderer, TwineContext& context) const {
        renderer.applyState(state);
        context.storage = storage;
        context.fontIndex = fontIndex;
    }
};

} // namespace

RendererTwine Renderer::twine() {
    return RendererTwine(*this);
}

void RendererTwine::draw(Target& target, const Twine& twine, int x, int y) {
    fractDraw(target, twine, fract::fromInt(x), fract::fromInt(y));
}

void RendererTwine::fractDraw(Target& target, const Twine& twine, fract::Unit x, fract::Unit y) {
    if (twine.empty()) {
        return;
    }
    const PixelRect bounds = target.bounds();
    if (bounds.empty()) {
        return;
    }
    renderer_.requireDrawable("draw twines");

    TwineContext& context = *renderer_.twine_;
    const TwineSnapshot snapshot(renderer_, context);
    try {
        const Align horz = horzOf(renderer_.state().align);
        const bool rtl = renderer_.state().direction == Direction::RightToLeft;
        const fract::Unit maxBaselineY = fract::fromInt(bounds.maxY) + renderer_.lineHeight();

        y = renderer_.alignedY(y, [&]() { return measureTwine(twine, false).height(); });
        const fract::Unit baseX = horz == Align::HorzCenter ? x : fract::quantizeUp(x, renderer_.state().horzStep());

        TwineOperator op(renderer_, context, twine);
        auto placer = [&](fract::Unit width) {
            const fract::Unit lineX = baseX + op.lineShift();
            switch (horz) {
                case Align::Left:
                    return rtl ? lineX + width : lineX;
                case Align::Right:
                    return rtl ? lineX : lineX - width;
                default:
                    return rtl ? lineX + (width >> 1) : lineX - (width >> 1);
            }
        };

        LayoutCursor cursor;
        cursor.prevFractX = fract::fractShift(baseX);
        renderer_.notifyFract(fract::Point(baseX, y));

        while (true) {
            char32_t terminal = utf8::kEndOfText;
            fract::Point position = op.drawLine(target, cursor, y, placer, terminal);
            if (terminal == utf8::kEndOfText) {
                break;
            }

            cursor.increaseLineBreakNth();
            const fract::Unit prevFractY = fract::fractShift(y);
            y = op.advanceLine(y, cursor.lineBreakNth);
            if (fract::fractShift(y) != prevFractY) {
                const fract::Unit lineX = baseX + op.lineShift();
                cursor.prevFractX = fract::fractShift(lineX);
                renderer_.notifyFract(fract::Point(lineX, y));
            }
            if (y > maxBaselineY) {
                op.popAll(&target, fract::Point(position.x, y), cursor);
                break;
            }
        }
    } catch (...) {
        snapshot.restore(renderer_, context);
        throw;
    }
    snapshot.restore(renderer_, context);
}

fract::Rect RendererTwine::measure(const Twine& twine) {
    return measureTwine(twine, true);
}

fract::Rect RendererTwine::measureTwine(const Twine& twine, bool singlePassEffects) {
    renderer_.requireFontAndSizer("measure twines");
    if (twine.empty()) {
        return fract::Rect();
    }

    TwineContext& context = *renderer_.twine_;
    const TwineSnapshot snapshot(renderer_, context);
    fract::Unit width = 0;
    fract::Unit height = 0;
    try {
        TwineOperator op(renderer_, context, twine);
        LayoutCursor cursor;
        bool onlyLineBreaks = true;

        while (true) {
            const TwineOperator::LineMeasure line = op.measureLine(cursor, singlePassEffects);
            width = std::max(width, line.width);
            if (line.hasContent || line.width > 0) {
                onlyLineBreaks = false;
            }
            if (line.terminal == utf8::kEndOfText) {
                break;
            }
            cursor.increaseLineBreakNth();
            height = op.advanceLine(height, cursor.lineBreakNth);
        }

        if (!onlyLineBreaks) {
            height = fract::quantizeUp(height + op.lineHeight(), renderer_.state().vertStep());
        }
    } catch (...) {
        snapshot.restore(renderer_, context);
        throw;
    }
    snapshot.restore(renderer_, context);

    return fract::Rect(0, 0, fract::quantizeUp(width, renderer_.state().horzStep()), height);
}

void RendererTwine::registerEffectFunc(EffectKey key, EffectFunc fn) {
    if (key > kMaxCustomEffectKey) {
        throw ConfigError("effect key " + std::to_string(key) + " is reserved for built-in effects");
    }
    renderer_.twine_->effects[key] = std::move(fn);
}

void RendererTwine::registerFont(FontIndex index, const Font* font) {
    renderer_.twine_->fonts[index] = font;
}

void RendererTwine::setFontIndex(FontIndex index) {
    TwineContext& context = *renderer_.twine_;
    const Font* font = context.fonts[index];
    if (!font) {
        throw ConfigError("no font registered at index " + std::to_string(index));
    }
    renderer_.setFont(font);
    context.fontIndex = index;
}

FontIndex RendererTwine::fontIndex() const {
    return renderer_.twine_->fontIndex;
}

} // namespace weft
