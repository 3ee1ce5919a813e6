#ifndef WEFT_TWINE_TWINE_OPERATOR_H
#define WEFT_TWINE_TWINE_OPERATOR_H

#include "weft/fract/fract.h"
#include "weft/render/layout_cursor.h"
#include "weft/render/target.h"
#include "weft/twine/effect.h"
#include "weft/twine/effect_list.h"
#include "weft/twine/twine.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace weft {

class Renderer;
struct TwineContext;

/**
 * TwineOperator: interprets a twine line by line.
 *
 * Measuring a line for a draw is a provisional pass: pops are soft, line
 * metrics and restart markers are not committed, and the renderer state
 * and effect storage are restored afterwards. The line is then replayed
 * from the same position with the effect stack rewound to its line start
 * contents, and pops become hard.
 */
class TwineOperator {
public:
    // Returns the x where a line of the given width starts.
    using Placer = std::function<fract::Unit(fract::Unit width)>;

    struct LineMeasure {
        fract::Unit width = 0;
        char32_t terminal = 0; // '\n' or utf8::kEndOfText
        bool hasContent = false;
    };

    TwineOperator(Renderer& renderer, TwineContext& context, const Twine& twine);

    // Non-copyable
    TwineOperator(const TwineOperator&) = delete;
    TwineOperator& operator=(const TwineOperator&) = delete;

    /**
     * Measure the next line and commit its line metrics and markers. Pops
     * are final.
     * @param singlePassEffects False when measuring ahead of a draw, where
     *        single pass effects only see the drawing pass
     */
    LineMeasure measureLine(LayoutCursor& cursor, bool singlePassEffects = true);

    /**
     * Measure the next line provisionally, place it with placer and draw it.
     * @return The pen position at the end of the line
     */
    fract::Point drawLine(Target& target, LayoutCursor& cursor, fract::Unit y,
                          const Placer& placer, char32_t& terminal);

    /**
     * Baseline of the next line, using the committed line metrics.
     */
    fract::Unit advanceLine(fract::Unit y, int lineBreakNth);

    // Line height for the committed line metrics.
    fract::Unit lineHeight();

    // Pop every active effect for good, e.g. when drawing stops early.
    void popAll(Target* target, fract::Point position, LayoutCursor& cursor);

    // Offset of the line restart marker relative to the line start.
    fract::Unit lineShift() const { return lineShift_; }

private:
    enum class Pass {
        Measure,    // standalone measure, committed
        MeasureAhead, // committed measure for a draw, single pass effects skipped
        MeasureSub, // provisional measure before drawing
        Draw
    };

    enum class TokenKind {
        EndOfText,
        LineBreak,
        ControlCode,
        Rune,
        Glyph
    };

    struct Token {
        TokenKind kind = TokenKind::EndOfText;
        char32_t codePoint = 0;
        GlyphIndex glyph = 0;
    };

    struct LineMetrics {
        const Font* font = nullptr;
        fract::Unit scaledSize = 0;
        fract::Unit ascent = 0;
        fract::Unit descent = 0;
    };

    Token nextToken();
    LineMetrics currentMetrics() const;

    LineMeasure measurePass(Target* target, LayoutCursor& cursor, fract::Unit y, Pass pass);
    void processControlCode(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass);
    void pushEffectAt(EffectMode mode, Pass pass);
    void pop(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass);
    void popAllActive(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass);
    void lineStart(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass);
    void lineBreak(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass);
    fract::Point step(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor);

    // effect invocation; each returns the pad to advance by
    fract::Unit callPush(EffectOperation& op, Target* target, fract::Point origin, Pass pass);
    fract::Unit callLineStart(EffectOperation& op, Target* target, fract::Point origin, Pass pass);
    fract::Unit callLineBreak(EffectOperation& op, Target* target, fract::Unit x, Pass pass);
    fract::Unit callPop(EffectOperation& op, Target* target, fract::Unit x, Pass pass);
    void invoke(EffectOperation& op, Target* target, EffectTrigger trigger, fract::Unit x,
                fract::Unit prePad, fract::Unit postPad, Pass pass);
    void applyAdvance(fract::Point& position, LayoutCursor& cursor, fract::Unit advance) const;

    Renderer& renderer_;
    TwineContext& context_;
    std::string_view buffer_;
    std::size_t index_ = 0;
    bool inGlyphMode_ = false;
    fract::Unit sign_ = 1;

    EffectList effects_;
    std::optional<EffectSpacing> pendingSpacing_;

    fract::Unit lineStartX_ = 0;
    fract::Unit lineShift_ = 0;
    LineMetrics lineMetrics_;
    LineMetrics nextLineMetrics_;
};

} // namespace weft

#endif // WEFT_TWINE_TWINE_OPERATOR_H
