#include "weft/twine/effect.h"
#include "weft/core/errors.h"
#include <algorithm>
#include <string>

namespace weft {

const char* toString(EffectTrigger trigger) {
    switch (trigger) {
        case EffectTrigger::Push: return "Push";
        case EffectTrigger::LineStart: return "LineStart";
        case EffectTrigger::LineBreak: return "LineBreak";
        case EffectTrigger::Pop: return "Pop";
    }
    return "Unknown";
}

fract::Rect EffectArgs::contentRect() const {
    const fract::Unit sign = rightToLeft ? -1 : 1;
    const fract::Unit start = origin.x + sign * prePad;
    const fract::Unit end = start + sign * knownWidth;
    return fract::Rect(std::min(start, end), origin.y - lineAscent, std::max(start, end), origin.y + lineDescent);
}

void EffectArgs::requirePayloadSize(std::size_t size) const {
    if (payload.size == size) {
        return;
    }
    throw MalformedTwineError("effect expects a payload of " + std::to_string(size)
        + " bytes, got " + std::to_string(payload.size));
}

} // namespace weft
