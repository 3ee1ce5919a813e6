#ifndef WEFT_MASK_GLYPH_MASK_H
#define WEFT_MASK_GLYPH_MASK_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace weft {

/**
 * GlyphMask: 8-bit coverage bitmap for a rasterized glyph.
 * offsetX/offsetY position the top-left pixel relative to the integer pixel
 * containing the glyph origin (baseline pen position).
 */
struct GlyphMask {
    int offsetX = 0;
    int offsetY = 0;
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> alpha; // width * height, row-major

    bool empty() const { return width <= 0 || height <= 0; }

    std::uint8_t at(int x, int y) const {
        return alpha[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }

    // Approximate memory used by the mask, for cache accounting.
    std::size_t byteSize() const { return sizeof(GlyphMask) + alpha.size(); }
};

} // namespace weft

#endif // WEFT_MASK_GLYPH_MASK_H
