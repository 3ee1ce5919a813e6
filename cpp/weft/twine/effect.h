#ifndef WEFT_TWINE_EFFECT_H
#define WEFT_TWINE_EFFECT_H

#include "weft/fract/fract.h"
#include "weft/twine/twine.h"
#include <cstddef>
#include <cstdint>
#include <functional>

namespace weft {

class Renderer;
class Target;

enum class EffectTrigger : std::uint8_t {
    Push,
    LineStart,
    LineBreak,
    Pop
};

const char* toString(EffectTrigger trigger);

// Read-only view of an effect payload inside a twine buffer.
struct PayloadView {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;

    bool empty() const { return size == 0; }
    std::uint8_t operator[](std::size_t index) const { return data[index]; }
};

/**
 * Arguments passed to an effect function.
 *
 * origin is the pen position at the push or line start. While measuring,
 * x coordinates are relative to the start of the line.
 */
struct EffectArgs {
    EffectTrigger trigger = EffectTrigger::Push;
    bool measuring = false;
    bool doublePass = false;
    bool rightToLeft = false;
    PayloadView payload;
    fract::Point origin;
    fract::Unit lineAscent = 0;
    fract::Unit lineDescent = 0;
    // Width of the content seen so far, pads excluded. Complete on the
    // drawing pass.
    fract::Unit knownWidth = 0;
    fract::Unit prePad = 0;
    fract::Unit knownPostPad = 0;

    bool drawing() const { return !measuring; }

    /**
     * Area covered by the effect content on the current line, from the end
     * of the pre pad to knownWidth, between the line ascent and descent.
     */
    fract::Rect contentRect() const;

    // @throws MalformedTwineError if the payload doesn't have exactly size bytes
    void requirePayloadSize(std::size_t size) const;
};

/**
 * Effect callback. target is nullptr while measuring. Effects may change
 * the renderer state; the state is restored after each measuring pass and
 * when the twine operation ends.
 */
using EffectFunc = std::function<void(Renderer& renderer, Target* target, const EffectArgs& args)>;

} // namespace weft

#endif // WEFT_TWINE_EFFECT_H
