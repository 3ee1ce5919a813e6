#include "weft/twine/twine.h"
#include "weft/core/errors.h"
#include "weft/core/utf8.h"

namespace weft {

Twine& Twine::add(std::string_view text) {
    if (text.find(static_cast<char>(twine_code::kBegin)) != std::string_view::npos) {
        throw ConfigError("twine text can't contain the control byte 0x1F");
    }
    ensureStringMode();
    buffer_.append(text.data(), text.size());
    return *this;
}

Twine& Twine::addRune(char32_t codePoint) {
    if (codePoint == twine_code::kBegin) {
        throw ConfigError("twine text can't contain the control byte 0x1F");
    }
    ensureStringMode();
    utf8::append(buffer_, codePoint);
    return *this;
}

Twine& Twine::addLineBreak() {
    return addRune('\n');
}

Twine& Twine::addGlyph(GlyphIndex glyph) {
    ensureGlyphMode();
    buffer_.push_back(static_cast<char>(glyph & 0xFF));
    buffer_.push_back(static_cast<char>(glyph >> 8));
    if (glyph == 0) {
        buffer_.push_back('\0');
    }
    return *this;
}

Twine& Twine::addGlyphs(const std::vector<GlyphIndex>& glyphs) {
    for (GlyphIndex glyph : glyphs) {
        addGlyph(glyph);
    }
    return *this;
}

Twine& Twine::pushEffect(EffectKey key, EffectMode mode, const std::vector<std::uint8_t>& payload) {
    const std::uint8_t code = mode == EffectMode::SinglePass
        ? twine_code::kPushSinglePassEffect
        : twine_code::kPushDoublePassEffect;
    appendKeyWithPayload(code, key, payload);
    return *this;
}

Twine& Twine::pushEffectWithSpacing(EffectKey key, EffectMode mode, const EffectSpacing& spacing,
                                    const std::vector<std::uint8_t>& payload) {
    if (payload.size() > 255) {
        throw ConfigError("twine effect payloads are limited to 255 bytes, got " + std::to_string(payload.size()));
    }

    // encode into a scratch buffer first so a failure leaves the twine untouched
    std::string encoded;
    spacing.appendTo(encoded);

    appendControl(twine_code::kPushEffectWithSpacing);
    buffer_.append(encoded);
    buffer_.push_back(static_cast<char>(mode == EffectMode::SinglePass
        ? twine_code::kPushSinglePassEffect
        : twine_code::kPushDoublePassEffect));
    buffer_.push_back(static_cast<char>(key));
    buffer_.push_back(static_cast<char>(payload.size()));
    buffer_.append(payload.begin(), payload.end());
    return *this;
}

Twine& Twine::pop() {
    appendControl(twine_code::kPop);
    return *this;
}

Twine& Twine::popAll() {
    appendControl(twine_code::kPopAll);
    return *this;
}

Twine& Twine::pushColor(Color color) {
    return pushEffect(kEffectPushColor, EffectMode::SinglePass, {color.r, color.g, color.b, color.a});
}

Twine& Twine::pushFont(FontIndex index) {
    return pushEffect(kEffectPushFont, EffectMode::DoublePass, {index});
}

Twine& Twine::shiftSize(std::int8_t logicalSizeChange) {
    return pushEffect(kEffectShiftSize, EffectMode::DoublePass, {static_cast<std::uint8_t>(logicalSizeChange)});
}

Twine& Twine::setSize(float logicalSize) {
    std::string encoded;
    appendUnit24(encoded, fract::fromFloatUp(logicalSize));
    return pushEffect(kEffectSetSize, EffectMode::DoublePass, std::vector<std::uint8_t>(encoded.begin(), encoded.end()));
}

Twine& Twine::refreshLineMetrics() {
    appendControl(twine_code::kRefreshLineMetrics);
    return *this;
}

Twine& Twine::pushLineRestartMarker() {
    appendControl(twine_code::kPushLineRestartMarker);
    return *this;
}

Twine& Twine::clearLineRestartMarker() {
    appendControl(twine_code::kClearLineRestartMarker);
    return *this;
}

Twine& Twine::pushMotion(std::uint8_t key, const std::vector<std::uint8_t>& payload) {
    appendKeyWithPayload(twine_code::kPushMotion, key, payload);
    return *this;
}

void Twine::reset() {
    buffer_.clear();
    inGlyphMode_ = false;
}

void Twine::ensureStringMode() {
    if (!inGlyphMode_) {
        return;
    }
    appendControl(twine_code::kSwitchStringMode);
    inGlyphMode_ = false;
}

void Twine::ensureGlyphMode() {
    if (inGlyphMode_) {
        return;
    }
    appendControl(twine_code::kSwitchGlyphMode);
    inGlyphMode_ = true;
}

void Twine::appendControl(std::uint8_t code) {
    if (inGlyphMode_) {
        buffer_.push_back('\0');
        buffer_.push_back('\0');
    }
    buffer_.push_back(static_cast<char>(twine_code::kBegin));
    buffer_.push_back(static_cast<char>(code));
}

void Twine::appendKeyWithPayload(std::uint8_t code, std::uint8_t key, const std::vector<std::uint8_t>& payload) {
    if (payload.size() > 255) {
        throw ConfigError("twine effect payloads are limited to 255 bytes, got " + std::to_string(payload.size()));
    }
    appendControl(code);
    buffer_.push_back(static_cast<char>(key));
    buffer_.push_back(static_cast<char>(payload.size()));
    buffer_.append(payload.begin(), payload.end());
}

} // namespace weft
