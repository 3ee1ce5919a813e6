#ifndef WEFT_TWINE_EFFECT_SPACING_H
#define WEFT_TWINE_EFFECT_SPACING_H

#include "weft/fract/fract.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace weft {

/**
 * Extra horizontal space an effect adds around its content.
 *
 * Pads are added when the effect is pushed (prePad), popped (postPad), at
 * the start of each continuation line (lineStartPad) and before each line
 * break (lineBreakPad). lineStartPad should not exceed prePad and
 * lineBreakPad should not exceed postPad.
 *
 * Logical values are expressed at 16px and rescaled to the scaled size of
 * the renderer when used.
 */
struct EffectSpacing {
    fract::Unit prePad = 0;
    fract::Unit postPad = 0;
    fract::Unit minWidth = 0;
    fract::Unit lineStartPad = 0;
    fract::Unit lineBreakPad = 0;
    bool arePadsLogical = false;
    bool isMinWidthLogical = false;

    bool empty() const {
        return prePad == 0 && postPad == 0 && minWidth == 0 && lineStartPad == 0 && lineBreakPad == 0;
    }

    fract::Unit prePadAt(fract::Unit scaledSize) const;
    fract::Unit postPadAt(fract::Unit scaledSize) const;
    fract::Unit minWidthAt(fract::Unit scaledSize) const;
    fract::Unit lineStartPadAt(fract::Unit scaledSize) const;
    fract::Unit lineBreakPadAt(fract::Unit scaledSize) const;

    /**
     * Append the encoded spacing: one control byte followed by 1 to 5
     * values of 3 bytes each.
     * @throws ConfigError if the spacing is empty or a value exceeds the
     *         encodable range
     */
    void appendTo(std::string& buffer) const;

    /**
     * Decode a spacing block starting at pos and move pos past it.
     * @throws MalformedTwineError on truncated or invalid blocks
     */
    static EffectSpacing decode(std::string_view buffer, std::size_t& pos);
};

bool operator==(const EffectSpacing& a, const EffectSpacing& b);

// Largest magnitude a 3-byte encoded value can hold.
constexpr fract::Unit kMaxEncodedUnit = (1 << 22) - 1;

/**
 * Append a signed value as 3 little-endian bytes.
 * @throws ConfigError if |value| > kMaxEncodedUnit
 */
void appendUnit24(std::string& buffer, fract::Unit value);

// Read a value written by appendUnit24. The caller checks that 3 bytes are available.
fract::Unit readUnit24(std::string_view buffer, std::size_t pos);

} // namespace weft

#endif // WEFT_TWINE_EFFECT_SPACING_H
