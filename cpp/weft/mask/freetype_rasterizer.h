#ifndef WEFT_MASK_FREETYPE_RASTERIZER_H
#define WEFT_MASK_FREETYPE_RASTERIZER_H

#include "weft/mask/rasterizer.h"

namespace weft {

/**
 * FreeTypeRasterizer: renders glyph outlines with FreeType's anti-aliased
 * renderer, shifted by the sub-pixel part of the origin. Requires fonts
 * loaded by a FontManager.
 */
class FreeTypeRasterizer : public Rasterizer {
public:
    struct Config {
        bool hinting = false;
    };

    FreeTypeRasterizer() = default;
    explicit FreeTypeRasterizer(const Config& config) : config_(config) {}

    std::shared_ptr<const GlyphMask> rasterize(
        const Font& font, GlyphIndex glyph, fract::Unit size, fract::Point origin) override;

    std::uint64_t signature() const override;

    void setConfig(const Config& config);
    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace weft

#endif // WEFT_MASK_FREETYPE_RASTERIZER_H
