#ifndef WEFT_TEXT_TEXT_TYPES_H
#define WEFT_TEXT_TEXT_TYPES_H

#include "weft/fract/fract.h"
#include <cstdint>
#include <string>

namespace weft {

// Font specific glyph index. 0 is the "missing glyph" (notdef) index.
using GlyphIndex = std::uint16_t;

// ============================================================================
// Align
// ============================================================================

/**
 * Two component align. The low nibble holds the vertical component and the
 * high nibble the horizontal one, so both can be combined with operator|.
 */
enum class Align : std::uint8_t {
    None = 0,

    // vertical
    Top          = 0x01,
    CapLine      = 0x02,
    Midline      = 0x03,
    VertCenter   = 0x04,
    Baseline     = 0x05,
    Bottom       = 0x06,
    LastBaseline = 0x07,

    // horizontal
    Left       = 0x10,
    HorzCenter = 0x20,
    Right      = 0x30,

    Center = HorzCenter | VertCenter,
};

constexpr std::uint8_t kAlignVertBits = 0x0F;
constexpr std::uint8_t kAlignHorzBits = 0xF0;

inline Align operator|(Align a, Align b) {
    return static_cast<Align>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline Align vertOf(Align align) {
    return static_cast<Align>(static_cast<std::uint8_t>(align) & kAlignVertBits);
}
inline Align horzOf(Align align) {
    return static_cast<Align>(static_cast<std::uint8_t>(align) & kAlignHorzBits);
}

// True if every non-empty component holds a known value.
bool isValidAlign(Align align);

/**
 * Combine an align with a new one: each component of next that is not empty
 * replaces the matching component of current.
 */
Align adjustedAlign(Align current, Align next);

std::string toString(Align align);

// ============================================================================
// Direction, quantization, color
// ============================================================================

enum class Direction : std::uint8_t {
    LeftToRight = 0,
    RightToLeft = 1,
};

/**
 * Sub-pixel granularity for glyph positions, in 1/64ths of a pixel.
 */
enum class Quantization : std::uint8_t {
    None         = 1,
    ThirtySecond = 2,
    Sixteenth    = 4,
    Eighth       = 8,
    Quarter      = 16,
    Half         = 32,
    Full         = 64,
};

inline fract::Unit stepOf(Quantization q) {
    return static_cast<fract::Unit>(q);
}

struct Color {
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;
    std::uint8_t a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

enum class BlendMode : std::uint8_t {
    Over    = 0, // source over destination
    Replace = 1, // mask coverage replaces destination
};

// ============================================================================
// Font
// ============================================================================

/**
 * Font as seen by the layout code: an identity plus a code point to glyph
 * mapping. Metrics come from a Sizer and outlines from a Rasterizer.
 */
class Font {
public:
    virtual ~Font() = default;

    // Stable identifier, unique among live fonts. Used for cache keys.
    virtual std::uint32_t id() const = 0;

    // Glyph for a code point, or 0 if the font has no mapping for it.
    virtual GlyphIndex glyphIndexOf(char32_t codePoint) const = 0;
};

} // namespace weft

#endif // WEFT_TEXT_TEXT_TYPES_H
