#ifndef WEFT_RENDER_RENDER_STATE_H
#define WEFT_RENDER_RENDER_STATE_H

#include "weft/fract/fract.h"
#include "weft/text/text_types.h"

namespace weft {

class Sizer;
class Rasterizer;

/**
 * RenderState: every parameter that affects how text is measured and drawn.
 * Font, sizer and rasterizer are borrowed and must outlive the renderer
 * state that references them.
 */
struct RenderState {
    const Font* font = nullptr;
    fract::Unit logicalSize = fract::fromInt(16);
    fract::Unit scale = fract::kOne;
    Quantization horzQuantization = Quantization::Full;
    Quantization vertQuantization = Quantization::Full;
    Align align = Align::Baseline | Align::Left;
    Direction direction = Direction::LeftToRight;
    Color color{};
    BlendMode blendMode = BlendMode::Over;
    Sizer* sizer = nullptr;
    Rasterizer* rasterizer = nullptr;

    // Size used for metrics and rasterization.
    fract::Unit scaledSize() const { return fract::mulDown(logicalSize, scale); }

    fract::Unit horzStep() const { return stepOf(horzQuantization); }
    fract::Unit vertStep() const { return stepOf(vertQuantization); }
};

} // namespace weft

#endif // WEFT_RENDER_RENDER_STATE_H
