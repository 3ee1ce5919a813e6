#include "weft/render/renderer.h"
#include "weft/core/errors.h"
#include "weft/core/utf8.h"
#include "weft/render/line_iterator.h"
#include <algorithm>

namespace weft {

namespace {

// Rune order and glyph step direction for each align and text direction.
struct LineTraversal {
    bool reverseRunes;
    bool stepRTL;
};

LineTraversal traversalFor(Align horz, Direction direction) {
    const bool rtl = direction == Direction::RightToLeft;
    switch (horz) {
        case Align::Left:
            return {rtl, false};
        case Align::Right:
            return {!rtl, true};
        default:
            return {false, rtl};
    }
}

} // namespace

// =============================================================================
// Integer entry points
// =============================================================================

void Renderer::draw(Target& target, std::string_view text, int x, int y) {
    fractDraw(target, text, fract::fromInt(x), fract::fromInt(y));
}

fract::Rect Renderer::measure(std::string_view text) {
    return fractMeasure(text);
}

void Renderer::drawWithWrap(Target& target, std::string_view text, int x, int y, int widthLimit) {
    fractDrawWithWrap(target, text, fract::fromInt(x), fract::fromInt(y), fract::fromInt(widthLimit));
}

fract::Rect Renderer::measureWithWrap(std::string_view text, int widthLimit) {
    return fractMeasureWithWrap(text, fract::fromInt(widthLimit));
}

// =============================================================================
// Measuring helpers
// =============================================================================

fract::Unit Renderer::measureLineLTR(std::string_view line) {
    const fract::Unit horzStep = state_.horzStep();
    fract::Unit x = 0;
    bool hasPrev = false;
    GlyphIndex prev = 0;

    RuneReader runes(line, false);
    for (char32_t cp = runes.next(); cp != utf8::kEndOfText; cp = runes.next()) {
        std::optional<GlyphIndex> glyph = resolveGlyph(cp);
        if (!glyph) {
            continue;
        }
        if (hasPrev) {
            x = fract::quantizeUp(x + opKern(prev, *glyph), horzStep);
        }
        x += opAdvance(*glyph);
        prev = *glyph;
        hasPrev = true;
    }
    return fract::quantizeUp(x, horzStep);
}

fract::Unit Renderer::measureLineReverseLTR(std::string_view line) {
    const fract::Unit horzStep = state_.horzStep();
    fract::Unit x = 0;
    bool hasPrev = false;
    GlyphIndex prev = 0;

    RuneReader runes(line, false);
    for (char32_t cp = runes.next(); cp != utf8::kEndOfText; cp = runes.next()) {
        std::optional<GlyphIndex> glyph = resolveGlyph(cp);
        if (!glyph) {
            continue;
        }
        x -= opAdvance(*glyph);
        if (hasPrev) {
            x -= opKern(*glyph, prev);
        }
        x = fract::quantizeUp(x, horzStep);
        prev = *glyph;
        hasPrev = true;
    }
    return -x;
}

fract::Unit Renderer::measureHeight(std::string_view text) {
    const fract::Unit vertStep = state_.vertStep();
    fract::Unit height = 0;
    int lineBreakNth = -1;
    bool onlyLineBreaks = true;

    for (char c : text) {
        if (c == '\n') {
            lineBreakNth = std::max(1, lineBreakNth + 1);
            height = fract::quantizeUp(height + opLineAdvance(lineBreakNth), vertStep);
        } else {
            onlyLineBreaks = false;
            lineBreakNth = 0;
        }
    }

    if (!onlyLineBreaks) {
        height = fract::quantizeUp(height + lineHeight(), vertStep);
    }
    return height;
}

// =============================================================================
// Draw and measure
// =============================================================================

void Renderer::fractDraw(Target& target, std::string_view text, fract::Unit x, fract::Unit y) {
    if (text.empty()) {
        return;
    }
    const PixelRect bounds = target.bounds();
    if (bounds.empty()) {
        return;
    }
    requireDrawable("draw");

    const fract::Unit horzStep = state_.horzStep();
    const fract::Unit vertStep = state_.vertStep();
    const fract::Unit lineHeight = this->lineHeight();

    y = alignedY(y, [&]() { return measureHeight(text); });
    const fract::Unit minBaselineY = fract::fromInt(bounds.minY) - lineHeight;
    const fract::Unit maxBaselineY = fract::fromInt(bounds.maxY) + lineHeight;

    LayoutCursor cursor;

    // skip lines above the target
    if (y < minBaselineY) {
        std::size_t skipped = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '\n') {
                cursor.lineBreakNth = 0;
                continue;
            }
            cursor.increaseLineBreakNth();
            y = fract::quantizeUp(y + opLineAdvance(cursor.lineBreakNth), vertStep);
            skipped = i + 1;
            if (y >= minBaselineY) {
                break;
            }
        }
        text = text.substr(skipped);
        if (text.empty()) {
            return;
        }
        if (cursor.lineBreakNth == 0) {
            cursor.interruptKerning();
        }
    }

    const Align horz = horzOf(state_.align);
    const bool rtl = state_.direction == Direction::RightToLeft;
    const LineTraversal traversal = traversalFor(horz, state_.direction);
    const fract::Unit lineBreakX = horz == Align::HorzCenter ? x : fract::quantizeUp(x, horzStep);

    fract::Point position(lineBreakX, y);
    cursor.prevFractX = fract::fractShift(position.x);
    notifyFract(position);

    LineIterator lines(text);
    std::string_view line;
    bool endsWithBreak = false;
    while (lines.next(line, endsWithBreak)) {
        if (horz == Align::HorzCenter) {
            if (rtl) {
                position.x = x + (measureLineReverseLTR(line) >> 1);
            } else {
                position.x = x - (measureLineLTR(line) >> 1);
            }
        }
        position = drawLine(target, line, position, traversal.reverseRunes, traversal.stepRTL, cursor);

        if (!endsWithBreak) {
            break;
        }
        cursor.increaseLineBreakNth();
        position = advanceLine(position, lineBreakX, cursor.lineBreakNth, cursor);
        if (position.y > maxBaselineY) {
            break;
        }
    }
}

fract::Point Renderer::drawLine(Target& target, std::string_view line, fract::Point position,
                                bool reverseRunes, bool stepRTL, LayoutCursor& cursor) {
    RuneReader runes(line, reverseRunes);
    for (char32_t cp = runes.next(); cp != utf8::kEndOfText; cp = runes.next()) {
        std::optional<GlyphIndex> glyph = resolveGlyph(cp);
        if (!glyph) {
            continue;
        }
        if (stepRTL) {
            position = drawGlyphRTL(&target, position, *glyph, cursor);
        } else {
            position = drawGlyphLTR(&target, position, *glyph, cursor);
        }
    }
    return position;
}

fract::Rect Renderer::fractMeasure(std::string_view text) {
    requireFontAndSizer("measure");
    if (text.empty()) {
        return fract::Rect();
    }

    const bool rtl = state_.direction == Direction::RightToLeft;
    const fract::Unit vertStep = state_.vertStep();
    fract::Unit width = 0;
    fract::Unit height = 0;
    int lineBreakNth = -1;
    bool onlyLineBreaks = true;

    LineIterator lines(text);
    std::string_view line;
    bool endsWithBreak = false;
    while (lines.next(line, endsWithBreak)) {
        if (!line.empty()) {
            width = std::max(width, rtl ? measureLineReverseLTR(line) : measureLineLTR(line));
            onlyLineBreaks = false;
            lineBreakNth = 0;
        }
        if (!endsWithBreak) {
            break;
        }
        lineBreakNth = std::max(1, lineBreakNth + 1);
        height = fract::quantizeUp(height + opLineAdvance(lineBreakNth), vertStep);
    }

    if (!onlyLineBreaks) {
        height = fract::quantizeUp(height + lineHeight(), vertStep);
    }
    return fract::Rect(0, 0, fract::quantizeUp(width, state_.horzStep()), height);
}

// =============================================================================
// Wrap
// =============================================================================

Renderer::WrapLine Renderer::measureWrapLine(std::string_view text, std::size_t pos, fract::Unit widthLimit, bool reverse) {
    const fract::Unit horzStep = state_.horzStep();
    auto finalWidth = [&](fract::Unit x) { return reverse ? -x : fract::quantizeUp(x, horzStep); };

    WrapLine out;
    fract::Unit x = 0;
    bool hasPrev = false;
    GlyphIndex prev = 0;
    std::size_t runeCount = 0;

    bool hasSafeBreak = false;
    std::size_t safeStart = 0;
    std::size_t safeEnd = 0;
    fract::Unit widthAtSafeBreak = 0;

    std::size_t cursor = pos;
    while (true) {
        const std::size_t runeStart = cursor;
        const char32_t cp = utf8::decodeNext(text, cursor);

        if (cp == utf8::kEndOfText || cp == '\n') {
            out.width = finalWidth(x);
            out.drawEnd = runeStart;
            out.next = cursor;
            out.terminal = cp;
            return out;
        }

        std::optional<GlyphIndex> glyph = resolveGlyph(cp);
        if (!glyph) {
            ++runeCount;
            continue;
        }

        fract::Unit nextX = x;
        bool exceeds = false;
        if (!reverse) {
            if (hasPrev) {
                nextX = fract::quantizeUp(nextX + opKern(prev, *glyph), horzStep);
            }
            nextX += opAdvance(*glyph);
            exceeds = nextX > widthLimit;
        } else {
            nextX -= opAdvance(*glyph);
            if (hasPrev) {
                nextX -= opKern(*glyph, prev);
            }
            nextX = fract::quantizeUp(nextX, horzStep);
            exceeds = -nextX > widthLimit;
        }

        if (exceeds && runeCount > 0) {
            if (cp == ' ') {
                out.width = finalWidth(x);
                out.drawEnd = runeStart;
                out.next = cursor;
                out.elidedSpace = true;
            } else if (hasSafeBreak) {
                out.width = widthAtSafeBreak;
                out.drawEnd = safeStart;
                out.next = safeEnd;
                out.elidedSpace = true;
            } else {
                out.width = finalWidth(x);
                out.drawEnd = runeStart;
                out.next = runeStart;
            }
            // a wrap right before the end of the text ends it
            out.terminal = out.next >= text.size() ? utf8::kEndOfText : cp;
            return out;
        }

        if (cp == ' ' && runeCount > 0) {
            hasSafeBreak = true;
            safeStart = runeStart;
            safeEnd = cursor;
            widthAtSafeBreak = finalWidth(x);
        }
        x = nextX;
        prev = *glyph;
        hasPrev = true;
        ++runeCount;
    }
}

fract::Rect Renderer::fractMeasureWithWrap(std::string_view text, fract::Unit widthLimit) {
    requireFontAndSizer("measure");
    if (widthLimit < 0) {
        throw ConfigError("negative wrap width limit " + fract::toString(widthLimit));
    }
    if (text.empty()) {
        return fract::Rect();
    }

    const bool rtl = state_.direction == Direction::RightToLeft;
    const fract::Unit vertStep = state_.vertStep();
    fract::Unit width = 0;
    fract::Unit height = 0;
    int lineBreakNth = -1;
    bool onlyLineBreaks = true;

    std::size_t pos = 0;
    while (true) {
        const WrapLine line = measureWrapLine(text, pos, widthLimit, rtl);
        if (line.drawEnd > pos) {
            width = std::max(width, line.width);
            onlyLineBreaks = false;
            lineBreakNth = 0;
        }
        if (line.terminal == utf8::kEndOfText) {
            break;
        }
        lineBreakNth = std::max(1, lineBreakNth + 1);
        height = fract::quantizeUp(height + opLineAdvance(lineBreakNth), vertStep);
        pos = line.next;
    }

    if (!onlyLineBreaks) {
        height = fract::quantizeUp(height + lineHeight(), vertStep);
    }
    return fract::Rect(0, 0, width, height);
}

void Renderer::fractDrawWithWrap(Target& target, std::string_view text, fract::Unit x, fract::Unit y, fract::Unit widthLimit) {
    if (text.empty()) {
        return;
    }
    const PixelRect bounds = target.bounds();
    if (bounds.empty()) {
        return;
    }
    requireDrawable("draw with wrap");
    if (widthLimit < 0) {
        throw ConfigError("negative wrap width limit " + fract::toString(widthLimit));
    }

    const Align horz = horzOf(state_.align);
    const bool rtl = state_.direction == Direction::RightToLeft;
    if ((horz == Align::Left && rtl) || (horz == Align::Right && !rtl)) {
        throw UnimplementedError("wrapped drawing with " + toString(state_.align)
            + (rtl ? " and right-to-left direction" : " and left-to-right direction"));
    }

    const fract::Unit horzStep = state_.horzStep();
    const fract::Unit vertStep = state_.vertStep();
    const fract::Unit lineHeight = this->lineHeight();

    y = alignedY(y, [&]() { return fractMeasureWithWrap(text, widthLimit).height(); });
    const fract::Unit minBaselineY = fract::fromInt(bounds.minY) - lineHeight;
    const fract::Unit maxBaselineY = fract::fromInt(bounds.maxY) + lineHeight;

    LayoutCursor cursor;
    std::size_t pos = 0;

    // skip lines above the target
    if (y < minBaselineY) {
        while (true) {
            const WrapLine line = measureWrapLine(text, pos, widthLimit, rtl);
            if (line.terminal == utf8::kEndOfText) {
                return;
            }
            if (line.drawEnd > pos) {
                cursor.lineBreakNth = 0;
            }
            cursor.increaseLineBreakNth();
            y = fract::quantizeUp(y + opLineAdvance(cursor.lineBreakNth), vertStep);
            pos = line.next;
            if (y >= minBaselineY) {
                break;
            }
        }
    }

    const fract::Unit lineBreakX = horz == Align::HorzCenter ? x : fract::quantizeUp(x, horzStep);
    fract::Point position(lineBreakX, y);
    cursor.prevFractX = fract::fractShift(position.x);
    notifyFract(position);

    while (true) {
        const WrapLine line = measureWrapLine(text, pos, widthLimit, rtl);
        if (horz == Align::HorzCenter) {
            position.x = rtl ? x + (line.width >> 1) : x - (line.width >> 1);
        }
        position = drawLine(target, text.substr(pos, line.drawEnd - pos), position, false, rtl, cursor);

        if (line.terminal == utf8::kEndOfText) {
            break;
        }
        cursor.lineChange.isWrap = line.terminal != '\n';
        cursor.lineChange.elidedSpace = line.elidedSpace;
        if (lineChangeFunc_) {
            lineChangeFunc_(cursor.lineChange);
        }

        cursor.increaseLineBreakNth();
        position = advanceLine(position, lineBreakX, cursor.lineBreakNth, cursor);
        pos = line.next;
        if (position.y > maxBaselineY) {
            break;
        }
    }
}

} // namespace weft
