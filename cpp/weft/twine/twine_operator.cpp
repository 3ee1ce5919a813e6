#include "weft/twine/twine_operator.h"
#include "weft/core/errors.h"
#include "weft/core/utf8.h"
#include "weft/render/renderer.h"
#include "weft/twine/twine_context.h"

namespace weft {

TwineOperator::TwineOperator(Renderer& renderer, TwineContext& context, const Twine& twine)
    : renderer_(renderer),
      context_(context),
      buffer_(twine.buffer()),
      sign_(renderer.state().direction == Direction::RightToLeft ? -1 : 1) {
    lineMetrics_ = currentMetrics();
    nextLineMetrics_ = lineMetrics_;
}

TwineOperator::LineMetrics TwineOperator::currentMetrics() const {
    LineMetrics metrics;
    metrics.font = renderer_.state().font;
    metrics.scaledSize = renderer_.state().scaledSize();
    metrics.ascent = renderer_.ascent();
    metrics.descent = renderer_.descent();
    return metrics;
}

// =============================================================================
// Decoding
// =============================================================================

TwineOperator::Token TwineOperator::nextToken() {
    Token token;
    if (index_ >= buffer_.size()) {
        token.kind = TokenKind::EndOfText;
        return token;
    }

    if (inGlyphMode_) {
        if (buffer_.size() - index_ < 2) {
            throw MalformedTwineError("truncated glyph index at byte " + std::to_string(index_));
        }
        token.glyph = static_cast<GlyphIndex>(static_cast<std::uint8_t>(buffer_[index_])
            | (static_cast<std::uint8_t>(buffer_[index_ + 1]) << 8));
        index_ += 2;
        token.kind = TokenKind::Glyph;
        if (token.glyph != 0) {
            return token;
        }

        // glyph 0 is followed by 0, control sequences by kBegin
        if (index_ >= buffer_.size()) {
            throw MalformedTwineError("truncated glyph mode escape");
        }
        const std::uint8_t escape = static_cast<std::uint8_t>(buffer_[index_++]);
        if (escape == twine_code::kBegin) {
            token.kind = TokenKind::ControlCode;
        } else if (escape != 0) {
            throw MalformedTwineError("invalid glyph mode escape " + std::to_string(escape));
        }
        return token;
    }

    if (static_cast<std::uint8_t>(buffer_[index_]) == twine_code::kBegin) {
        ++index_;
        token.kind = TokenKind::ControlCode;
        return token;
    }

    token.codePoint = utf8::decodeNext(buffer_, index_);
    token.kind = token.codePoint == '\n' ? TokenKind::LineBreak : TokenKind::Rune;
    return token;
}

// =============================================================================
// Lines
// =============================================================================

TwineOperator::LineMeasure TwineOperator::measureLine(LayoutCursor& cursor, bool singlePassEffects) {
    const fract::Unit shift = lineShift_;
    LineMeasure line = measurePass(nullptr, cursor, 0, singlePassEffects ? Pass::Measure : Pass::MeasureAhead);
    line.width += sign_ * shift;
    return line;
}

TwineOperator::LineMeasure TwineOperator::measurePass(Target* target, LayoutCursor& cursor, fract::Unit y, Pass pass) {
    LineMeasure line;
    fract::Point position(0, y);
    lineStartX_ = 0;

    lineStart(target, position, cursor, pass);
    while (true) {
        const Token token = nextToken();
        if (token.kind == TokenKind::EndOfText) {
            popAllActive(target, position, cursor, pass);
            line.terminal = utf8::kEndOfText;
            break;
        }
        if (token.kind == TokenKind::LineBreak) {
            lineBreak(target, position, cursor, pass);
            line.terminal = '\n';
            break;
        }

        switch (token.kind) {
            case TokenKind::ControlCode:
                processControlCode(target, position, cursor, pass);
                break;
            case TokenKind::Rune: {
                line.hasContent = true;
                renderer_.requireFontAndSizer("measure twines");
                std::optional<GlyphIndex> glyph = renderer_.resolveGlyph(token.codePoint);
                if (glyph) {
                    position = step(nullptr, position, *glyph, cursor);
                }
                break;
            }
            default:
                line.hasContent = true;
                position = step(nullptr, position, token.glyph, cursor);
                break;
        }
    }

    line.width = sign_ > 0 ? fract::quantizeUp(position.x, renderer_.state().horzStep()) : -position.x;
    return line;
}

fract::Point TwineOperator::drawLine(Target& target, LayoutCursor& cursor, fract::Unit y,
                                     const Placer& placer, char32_t& terminal) {
    if (effects_.activeCount() != effects_.totalCount()) {
        throw MalformedTwineError("effect stack out of sync at line start");
    }

    const std::size_t memoIndex = index_;
    const bool memoInGlyphMode = inGlyphMode_;
    const std::size_t memoActiveCount = effects_.activeCount();
    const LayoutCursor memoCursor = cursor;
    const RenderState memoState = renderer_.state();
    const std::vector<StoredValue> memoStorage = context_.storage;
    const FontIndex memoFontIndex = context_.fontIndex;

    const LineMeasure measured = measurePass(nullptr, cursor, y, Pass::MeasureSub);

    // rewind to the line start
    renderer_.applyState(memoState);
    context_.storage = memoStorage;
    context_.fontIndex = memoFontIndex;
    index_ = memoIndex;
    inGlyphMode_ = memoInGlyphMode;
    cursor = memoCursor;
    pendingSpacing_.reset();
    effects_.rewind(memoActiveCount);

    lineStartX_ = placer(measured.width);
    fract::Point position(lineStartX_, y);

    lineStart(&target, position, cursor, Pass::Draw);
    while (true) {
        const Token token = nextToken();
        if (token.kind == TokenKind::EndOfText) {
            popAllActive(&target, position, cursor, Pass::Draw);
            terminal = utf8::kEndOfText;
            break;
        }
        if (token.kind == TokenKind::LineBreak) {
            lineBreak(&target, position, cursor, Pass::Draw);
            terminal = '\n';
            break;
        }

        switch (token.kind) {
            case TokenKind::ControlCode:
                processControlCode(&target, position, cursor, Pass::Draw);
                break;
            case TokenKind::Rune: {
                renderer_.requireFontAndSizer("draw twines");
                std::optional<GlyphIndex> glyph = renderer_.resolveGlyph(token.codePoint);
                if (glyph) {
                    position = step(&target, position, *glyph, cursor);
                }
                break;
            }
            default:
                position = step(&target, position, token.glyph, cursor);
                break;
        }
    }
    return position;
}

fract::Unit TwineOperator::advanceLine(fract::Unit y, int lineBreakNth) {
    lineMetrics_ = nextLineMetrics_;

    const RenderState& state = renderer_.state();
    fract::Unit advance = 0;
    if (lineMetrics_.font == state.font && lineMetrics_.scaledSize == state.scaledSize()) {
        advance = renderer_.opLineAdvance(lineBreakNth);
    } else {
        // the sizer caches per font and size, so switch it over and back
        state.sizer->notifyChange(*lineMetrics_.font, lineMetrics_.scaledSize);
        advance = state.sizer->lineAdvance(*lineMetrics_.font, lineMetrics_.scaledSize, lineBreakNth);
        state.sizer->notifyChange(*state.font, state.scaledSize());
    }
    return fract::quantizeUp(y + advance, state.vertStep());
}

fract::Unit TwineOperator::lineHeight() {
    const RenderState& state = renderer_.state();
    if (lineMetrics_.font == state.font && lineMetrics_.scaledSize == state.scaledSize()) {
        return renderer_.lineHeight();
    }

    state.sizer->notifyChange(*lineMetrics_.font, lineMetrics_.scaledSize);
    const fract::Unit height = state.sizer->lineHeight(*lineMetrics_.font, lineMetrics_.scaledSize);
    state.sizer->notifyChange(*state.font, state.scaledSize());
    return height;
}

void TwineOperator::popAll(Target* target, fract::Point position, LayoutCursor& cursor) {
    popAllActive(target, position, cursor, Pass::Draw);
}

fract::Point TwineOperator::step(Target* target, fract::Point position, GlyphIndex glyph, LayoutCursor& cursor) {
    renderer_.requireFontAndSizer("lay out twine glyphs");
    if (sign_ > 0) {
        return renderer_.drawGlyphLTR(target, position, glyph, cursor);
    }
    return renderer_.drawGlyphRTL(target, position, glyph, cursor);
}

// =============================================================================
// Control codes
// =============================================================================

void TwineOperator::processControlCode(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass) {
    if (index_ >= buffer_.size()) {
        throw MalformedTwineError("truncated control sequence");
    }

    const std::uint8_t code = static_cast<std::uint8_t>(buffer_[index_++]);
    switch (code) {
        case twine_code::kSwitchGlyphMode:
            inGlyphMode_ = true;
            break;
        case twine_code::kSwitchStringMode:
            inGlyphMode_ = false;
            break;
        case twine_code::kRefreshLineMetrics:
            if (pass != Pass::MeasureSub) {
                nextLineMetrics_ = currentMetrics();
            }
            break;
        case twine_code::kPushLineRestartMarker:
            if (pass != Pass::MeasureSub) {
                lineShift_ = position.x - lineStartX_;
            }
            break;
        case twine_code::kClearLineRestartMarker:
            if (pass != Pass::MeasureSub) {
                lineShift_ = 0;
            }
            break;
        case twine_code::kPushEffectWithSpacing: {
            pendingSpacing_ = EffectSpacing::decode(buffer_, index_);
            if (index_ >= buffer_.size()) {
                throw MalformedTwineError("effect spacing not followed by an effect push");
            }
            const std::uint8_t next = static_cast<std::uint8_t>(buffer_[index_]);
            if (next != twine_code::kPushSinglePassEffect && next != twine_code::kPushDoublePassEffect) {
                throw MalformedTwineError("effect spacing not followed by an effect push");
            }
            processControlCode(target, position, cursor, pass);
            break;
        }
        case twine_code::kPop:
            pop(target, position, cursor, pass);
            break;
        case twine_code::kPopAll:
            popAllActive(target, position, cursor, pass);
            break;
        case twine_code::kPushSinglePassEffect:
        case twine_code::kPushDoublePassEffect: {
            pushEffectAt(code == twine_code::kPushSinglePassEffect ? EffectMode::SinglePass : EffectMode::DoublePass, pass);
            const fract::Unit advance = callPush(*effects_.head(), target, position, pass);
            applyAdvance(position, cursor, advance);
            break;
        }
        case twine_code::kPushMotion:
            throw UnimplementedError("twine motion effects");
        default:
            throw MalformedTwineError("unknown twine control code " + std::to_string(code));
    }
}

void TwineOperator::pushEffectAt(EffectMode mode, Pass pass) {
    if (buffer_.size() - index_ < 2) {
        throw MalformedTwineError("truncated effect push");
    }
    const EffectKey key = static_cast<std::uint8_t>(buffer_[index_]);
    const std::size_t payloadSize = static_cast<std::uint8_t>(buffer_[index_ + 1]);
    const std::size_t payloadStart = index_ + 2;
    const std::size_t payloadEnd = payloadStart + payloadSize;
    if (payloadEnd > buffer_.size()) {
        throw MalformedTwineError("truncated effect payload");
    }
    if (!context_.effects[key]) {
        throw ConfigError("no effect function registered for key " + std::to_string(key));
    }
    index_ = payloadEnd;

    if (pass == Pass::Draw) {
        EffectOperation* recalled = effects_.tryRecallNext();
        if (recalled) {
            if (recalled->key != key || recalled->payloadStart != payloadStart) {
                throw MalformedTwineError("effect stack out of sync: recalled effect " + std::to_string(recalled->key));
            }
            pendingSpacing_.reset();
            return;
        }
    }

    EffectOperation operation;
    operation.key = key;
    operation.mode = mode;
    operation.payloadStart = payloadStart;
    operation.payloadEnd = payloadEnd;
    operation.spacing = pendingSpacing_;
    pendingSpacing_.reset();
    effects_.push(operation);
}

void TwineOperator::pop(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass) {
    EffectOperation* head = effects_.head();
    if (!head) {
        throw MalformedTwineError("unbalanced pop: no active effects left");
    }

    const fract::Unit advance = callPop(*head, target, position.x, pass);
    if (pass == Pass::MeasureSub) {
        effects_.softPop();
    } else {
        effects_.hardPop();
    }
    applyAdvance(position, cursor, advance);
}

void TwineOperator::popAllActive(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass) {
    while (effects_.activeCount() > 0) {
        pop(target, position, cursor, pass);
    }
}

void TwineOperator::lineStart(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass) {
    effects_.forEachActive([&](EffectOperation& op) {
        applyAdvance(position, cursor, callLineStart(op, target, position, pass));
    });
}

void TwineOperator::lineBreak(Target* target, fract::Point& position, LayoutCursor& cursor, Pass pass) {
    effects_.forEachActiveReverse([&](EffectOperation& op) {
        applyAdvance(position, cursor, callLineBreak(op, target, position.x, pass));
    });
}

void TwineOperator::applyAdvance(fract::Point& position, LayoutCursor& cursor, fract::Unit advance) const {
    if (advance == 0) {
        return;
    }
    cursor.interruptKerning();
    position.x += sign_ * advance;
}

// =============================================================================
// Effect calls
// =============================================================================

fract::Unit TwineOperator::callPush(EffectOperation& op, Target* target, fract::Point origin, Pass pass) {
    const fract::Unit size = renderer_.state().scaledSize();
    const bool measuring = pass != Pass::Draw;

    op.origin = origin;
    if (measuring) {
        op.forceLineBreakPostPad = false;
        op.knownWidth = op.spacing ? op.spacing->minWidthAt(size) : 0;
    }

    fract::Unit prePad = 0;
    fract::Unit postPad = 0;
    if (op.spacing) {
        prePad = op.spacing->prePadAt(size);
        if (!measuring) {
            postPad = op.forceLineBreakPostPad ? op.spacing->lineBreakPadAt(size) : op.spacing->postPadAt(size);
        }
    }

    op.contentStartX = origin.x + sign_ * prePad;
    invoke(op, target, EffectTrigger::Push, origin.x, prePad, postPad, pass);
    return prePad;
}

fract::Unit TwineOperator::callLineStart(EffectOperation& op, Target* target, fract::Point origin, Pass pass) {
    const fract::Unit size = renderer_.state().scaledSize();
    const bool measuring = pass != Pass::Draw;

    op.origin = origin;
    if (measuring) {
        op.forceLineBreakPostPad = false;
        op.knownWidth = 0;
    }

    fract::Unit lineStartPad = 0;
    fract::Unit postPad = 0;
    if (op.spacing) {
        lineStartPad = op.spacing->lineStartPadAt(size);
        if (!measuring) {
            postPad = op.forceLineBreakPostPad ? op.spacing->lineBreakPadAt(size) : op.spacing->postPadAt(size);
        }
    }

    op.contentStartX = origin.x + sign_ * lineStartPad;
    invoke(op, target, EffectTrigger::LineStart, origin.x, lineStartPad, postPad, pass);
    return lineStartPad;
}

fract::Unit TwineOperator::callLineBreak(EffectOperation& op, Target* target, fract::Unit x, Pass pass) {
    const fract::Unit size = renderer_.state().scaledSize();
    op.forceLineBreakPostPad = true;

    fract::Unit prePad = 0;
    fract::Unit lineBreakPad = 0;
    if (op.spacing) {
        prePad = op.spacing->prePadAt(size);
        lineBreakPad = op.spacing->lineBreakPadAt(size);
    }

    invoke(op, target, EffectTrigger::LineBreak, x, prePad, lineBreakPad, pass);
    return lineBreakPad;
}

fract::Unit TwineOperator::callPop(EffectOperation& op, Target* target, fract::Unit x, Pass pass) {
    const fract::Unit size = renderer_.state().scaledSize();

    fract::Unit prePad = 0;
    fract::Unit postPad = 0;
    fract::Unit fill = 0;
    if (op.spacing) {
        prePad = op.spacing->prePadAt(size);
        postPad = op.spacing->postPadAt(size);
        const fract::Unit content = sign_ * (x - op.contentStartX);
        const fract::Unit minWidth = op.spacing->minWidthAt(size);
        if (content < minWidth) {
            fill = minWidth - content;
        }
    }

    invoke(op, target, EffectTrigger::Pop, x, prePad, postPad, pass);
    return fill + postPad;
}

void TwineOperator::invoke(EffectOperation& op, Target* target, EffectTrigger trigger, fract::Unit x,
                           fract::Unit prePad, fract::Unit postPad, Pass pass) {
    const fract::Unit width = sign_ * (x - op.contentStartX);
    if (width > op.knownWidth) {
        op.knownWidth = width;
    }

    // single pass effects only see the drawing pass of a draw
    if ((pass == Pass::MeasureSub || pass == Pass::MeasureAhead) && op.mode == EffectMode::SinglePass) {
        return;
    }

    const EffectFunc& fn = context_.effects[op.key];
    if (!fn) {
        throw ConfigError("no effect function registered for key " + std::to_string(op.key));
    }

    EffectArgs args;
    args.trigger = trigger;
    args.measuring = pass != Pass::Draw;
    args.doublePass = op.mode == EffectMode::DoublePass;
    args.rightToLeft = sign_ < 0;
    args.payload.data = reinterpret_cast<const std::uint8_t*>(buffer_.data()) + op.payloadStart;
    args.payload.size = op.payloadEnd - op.payloadStart;
    args.origin = op.origin;
    args.lineAscent = lineMetrics_.ascent;
    args.lineDescent = lineMetrics_.descent;
    args.knownWidth = op.knownWidth;
    args.prePad = prePad;
    args.knownPostPad = postPad;

    fn(renderer_, pass == Pass::Draw ? target : nullptr, args);
}

} // namespace weft
