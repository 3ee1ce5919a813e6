#ifndef WEFT_RENDER_TARGET_H
#define WEFT_RENDER_TARGET_H

#include "weft/mask/glyph_mask.h"
#include "weft/text/text_types.h"
#include <cstdint>
#include <vector>

namespace weft {

/**
 * Integer pixel rectangle. Min inclusive, max exclusive.
 */
struct PixelRect {
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;

    bool empty() const { return minX >= maxX || minY >= maxY; }
};

/**
 * Target: a surface glyph masks are drawn onto.
 */
class Target {
public:
    virtual ~Target() = default;

    virtual PixelRect bounds() const = 0;

    /**
     * Composite a mask with its top-left pixel at (x, y).
     * Pixels outside bounds() are ignored.
     */
    virtual void drawMask(const GlyphMask& mask, int x, int y, Color color, BlendMode blend) = 0;
};

/**
 * RgbaTarget: owned RGBA8 pixel buffer, non-premultiplied.
 */
class RgbaTarget : public Target {
public:
    RgbaTarget(int width, int height);

    PixelRect bounds() const override { return PixelRect{0, 0, width_, height_}; }
    void drawMask(const GlyphMask& mask, int x, int y, Color color, BlendMode blend) override;

    int width() const { return width_; }
    int height() const { return height_; }

    Color pixel(int x, int y) const;
    void clear(Color color = Color{0, 0, 0, 0});

    // Number of pixels with non-zero alpha.
    std::size_t coveredPixelCount() const;

    const std::vector<std::uint8_t>& data() const { return pixels_; }

private:
    int width_;
    int height_;
    std::vector<std::uint8_t> pixels_;
};

} // namespace weft

#endif // WEFT_RENDER_TARGET_H
