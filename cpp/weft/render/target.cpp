#include "weft/render/target.h"

#include <algorithm>

namespace weft {

RgbaTarget::RgbaTarget(int width, int height)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4, 0) {}

Color RgbaTarget::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return Color{0, 0, 0, 0};
    }
    std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * 4;
    return Color{pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
}

void RgbaTarget::clear(Color color) {
    for (std::size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = color.r;
        pixels_[i + 1] = color.g;
        pixels_[i + 2] = color.b;
        pixels_[i + 3] = color.a;
    }
}

std::size_t RgbaTarget::coveredPixelCount() const {
    std::size_t count = 0;
    for (std::size_t i = 3; i < pixels_.size(); i += 4) {
        if (pixels_[i] != 0) count++;
    }
    return count;
}

// Non-premultiplied source over: weights are srcAlpha and dstAlpha * (1 - srcAlpha).
static std::uint8_t mix(std::uint32_t dst, std::uint32_t src, std::uint32_t srcAlpha, std::uint32_t dstAlpha, std::uint32_t outAlpha) {
    if (outAlpha == 0) return 0;
    std::uint32_t num = src * srcAlpha * 255 + dst * dstAlpha * (255 - srcAlpha);
    std::uint32_t den = outAlpha * 255;
    return static_cast<std::uint8_t>((num + den / 2) / den);
}

void RgbaTarget::drawMask(const GlyphMask& mask, int x, int y, Color color, BlendMode blend) {
    if (mask.empty()) return;

    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(width_, x + mask.width);
    int y1 = std::min(height_, y + mask.height);

    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            std::uint32_t coverage = mask.at(px - x, py - y);
            std::size_t i = (static_cast<std::size_t>(py) * width_ + px) * 4;

            if (blend == BlendMode::Replace) {
                pixels_[i] = color.r;
                pixels_[i + 1] = color.g;
                pixels_[i + 2] = color.b;
                pixels_[i + 3] = static_cast<std::uint8_t>((coverage * color.a + 127) / 255);
                continue;
            }

            if (coverage == 0) continue;
            std::uint32_t srcAlpha = (coverage * color.a + 127) / 255;
            std::uint32_t dstAlpha = pixels_[i + 3];
            std::uint32_t outAlpha = srcAlpha + (dstAlpha * (255 - srcAlpha) + 127) / 255;
            pixels_[i] = mix(pixels_[i], color.r, srcAlpha, dstAlpha, outAlpha);
            pixels_[i + 1] = mix(pixels_[i + 1], color.g, srcAlpha, dstAlpha, outAlpha);
            pixels_[i + 2] = mix(pixels_[i + 2], color.b, srcAlpha, dstAlpha, outAlpha);
            pixels_[i + 3] = static_cast<std::uint8_t>(outAlpha);
        }
    }
}

} // namespace weft
