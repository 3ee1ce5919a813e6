#ifndef WEFT_TWINE_RENDERER_TWINE_H
#define WEFT_TWINE_RENDERER_TWINE_H

#include "weft/fract/fract.h"
#include "weft/render/target.h"
#include "weft/twine/effect.h"
#include "weft/twine/twine.h"

namespace weft {

class Renderer;

/**
 * Rich text operations of a renderer.
 *
 * Every align and direction is supported. Each line is measured before
 * it is drawn; see EffectMode for how effects see both passes. The
 * renderer state is restored when a twine operation ends, also on errors.
 */
class RendererTwine {
public:
    explicit RendererTwine(Renderer& renderer) : renderer_(renderer) {}

    void draw(Target& target, const Twine& twine, int x, int y);
    void fractDraw(Target& target, const Twine& twine, fract::Unit x, fract::Unit y);

    /**
     * Size of the twine as drawn. Effects are invoked in measuring mode.
     */
    fract::Rect measure(const Twine& twine);

    /**
     * Register the function for a custom effect key.
     * @throws ConfigError if key is above kMaxCustomEffectKey
     */
    void registerEffectFunc(EffectKey key, EffectFunc fn);

    // Make a font available to Twine::pushFont(). nullptr unregisters.
    void registerFont(FontIndex index, const Font* font);

    /**
     * Set the active font from the registered fonts.
     * @throws ConfigError if no font is registered at index
     */
    void setFontIndex(FontIndex index);
    FontIndex fontIndex() const;

private:
    // Single pass effects are skipped when singlePassEffects is false.
    fract::Rect measureTwine(const Twine& twine, bool singlePassEffects);

    Renderer& renderer_;
};

} // namespace weft

#endif // WEFT_TWINE_RENDERER_TWINE_H
