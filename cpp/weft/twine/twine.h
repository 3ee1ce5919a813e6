#ifndef WEFT_TWINE_TWINE_H
#define WEFT_TWINE_TWINE_H

#include "weft/fract/fract.h"
#include "weft/text/text_types.h"
#include "weft/twine/effect_spacing.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace weft {

using EffectKey = std::uint8_t;
using FontIndex = std::uint8_t;

// Keys up to this value are available for custom effects.
constexpr EffectKey kMaxCustomEffectKey = 192;

// Built-in effects
constexpr EffectKey kEffectPushColor = 193;
constexpr EffectKey kEffectPushFont = 194;
constexpr EffectKey kEffectShiftSize = 195;
constexpr EffectKey kEffectSetSize = 196;

/**
 * How often an effect is invoked while drawing. SinglePass effects only
 * see the drawing pass of each line; DoublePass effects also see the
 * measuring pass that precedes it, which they need when they change
 * metrics (font, size).
 */
enum class EffectMode : std::uint8_t {
    SinglePass,
    DoublePass
};

namespace twine_code {

// Starts a control sequence. Not valid inside twine text.
constexpr std::uint8_t kBegin = 0x1F;

constexpr std::uint8_t kPop = 0x00;
constexpr std::uint8_t kPopAll = 0x01;
constexpr std::uint8_t kRefreshLineMetrics = 0x02;
constexpr std::uint8_t kSwitchGlyphMode = 0x03;
constexpr std::uint8_t kSwitchStringMode = 0x04;
constexpr std::uint8_t kPushSinglePassEffect = 0x05;
constexpr std::uint8_t kPushDoublePassEffect = 0x06;
constexpr std::uint8_t kPushEffectWithSpacing = 0x07;
constexpr std::uint8_t kPushMotion = 0x08;
constexpr std::uint8_t kPushLineRestartMarker = 0x09;
constexpr std::uint8_t kClearLineRestartMarker = 0x0A;

} // namespace twine_code

/**
 * Twine: rich text buffer mixing UTF-8 text, raw glyph indices and control
 * codes for effects.
 *
 * Encoding:
 * - Text is stored as UTF-8. A control sequence starts with kBegin.
 * - In glyph mode each glyph is 2 little-endian bytes. Glyph 0 is written
 *   as 0,0,0 and control sequences as 0,0,kBegin,...
 * - Effect pushes: kBegin, code, key, payload length, payload.
 *
 * The builder methods return *this for chaining.
 */
class Twine {
public:
    Twine() = default;

    /**
     * Append UTF-8 text.
     * @throws ConfigError if the text contains the control byte 0x1F
     */
    Twine& add(std::string_view text);
    Twine& addRune(char32_t codePoint);
    Twine& addLineBreak();
    Twine& addGlyph(GlyphIndex glyph);
    Twine& addGlyphs(const std::vector<GlyphIndex>& glyphs);

    /**
     * Push an effect until the matching pop.
     * @param payload Up to 255 bytes passed to the effect function
     * @throws ConfigError if the payload is too long
     */
    Twine& pushEffect(EffectKey key, EffectMode mode, const std::vector<std::uint8_t>& payload = {});
    Twine& pushEffectWithSpacing(EffectKey key, EffectMode mode, const EffectSpacing& spacing,
                                 const std::vector<std::uint8_t>& payload = {});
    Twine& pop();
    Twine& popAll();

    // Built-in effects
    Twine& pushColor(Color color);
    Twine& pushFont(FontIndex index);
    Twine& shiftSize(std::int8_t logicalSizeChange);
    Twine& setSize(float logicalSize);

    /**
     * Make the line metrics (font and size used for line advances) follow
     * the current renderer state from the next line on.
     */
    Twine& refreshLineMetrics();

    // Lines after the current one start at the x position where the marker was pushed.
    Twine& pushLineRestartMarker();
    Twine& clearLineRestartMarker();

    // Encoded for forward compatibility; interpreting it raises UnimplementedError.
    Twine& pushMotion(std::uint8_t key, const std::vector<std::uint8_t>& payload = {});

    void reset();

    const std::string& buffer() const { return buffer_; }
    bool empty() const { return buffer_.empty(); }
    bool inGlyphMode() const { return inGlyphMode_; }

private:
    void ensureStringMode();
    void ensureGlyphMode();
    void appendControl(std::uint8_t code);
    void appendKeyWithPayload(std::uint8_t code, std::uint8_t key, const std::vector<std::uint8_t>& payload);

    std::string buffer_;
    bool inGlyphMode_ = false;
};

} // namespace weft

#endif // WEFT_TWINE_TWINE_H
