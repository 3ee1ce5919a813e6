#ifndef WEFT_MASK_RASTERIZER_H
#define WEFT_MASK_RASTERIZER_H

#include "weft/fract/fract.h"
#include "weft/mask/glyph_mask.h"
#include "weft/text/text_types.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace weft {

/**
 * Rasterizer: turns a glyph outline into a coverage mask.
 *
 * The signature identifies the rasterizer type and its configuration; two
 * rasterizers with the same signature must produce identical masks. When the
 * configuration changes the rasterizer calls its on-change function so glyph
 * caches can switch keys.
 */
class Rasterizer {
public:
    using OnChangeFunc = std::function<void(const Rasterizer&)>;

    virtual ~Rasterizer() = default;

    /**
     * Rasterize a glyph.
     * @param size Scaled font size
     * @param origin Pen position; only its fractional part affects the mask
     * @return The mask, or nullptr if the glyph couldn't be rasterized
     */
    virtual std::shared_ptr<const GlyphMask> rasterize(
        const Font& font, GlyphIndex glyph, fract::Unit size, fract::Point origin) = 0;

    virtual std::uint64_t signature() const = 0;

    void setOnChangeFunc(OnChangeFunc fn) { onChange_ = std::move(fn); }

protected:
    void notifyConfigChange() {
        if (onChange_) onChange_(*this);
    }

private:
    OnChangeFunc onChange_;
};

} // namespace weft

#endif // WEFT_MASK_RASTERIZER_H
