#ifndef WEFT_TWINE_TWINE_CONTEXT_H
#define WEFT_TWINE_TWINE_CONTEXT_H

#include "weft/core/errors.h"
#include "weft/fract/fract.h"
#include "weft/text/text_types.h"
#include "weft/twine/effect.h"
#include "weft/twine/twine.h"
#include <array>
#include <variant>
#include <vector>

namespace weft {

struct FontSlot {
    const Font* font = nullptr;
    FontIndex index = 0;
};

// Renderer values saved by built-in effects until their pop.
using StoredValue = std::variant<Color, FontSlot, fract::Unit>;

/**
 * Twine support data owned by a renderer: effect functions by key, fonts
 * by index and the storage stack used by built-in effects.
 */
struct TwineContext {
    std::array<EffectFunc, 256> effects;
    std::array<const Font*, 256> fonts{};
    FontIndex fontIndex = 0;
    std::vector<StoredValue> storage;

    void storagePush(const StoredValue& value) { storage.push_back(value); }

    /**
     * Pop the newest stored value, which must hold a T.
     * @throws MalformedTwineError if the storage is empty or holds another type
     */
    template <typename T>
    T storagePop() {
        if (storage.empty()) {
            throw MalformedTwineError("built-in effect popped without a stored value");
        }
        const T* value = std::get_if<T>(&storage.back());
        if (!value) {
            throw MalformedTwineError("built-in effects popped out of order");
        }
        T result = *value;
        storage.pop_back();
        return result;
    }
};

/**
 * Install the built-in effects (color, font, size shift, absolute size)
 * at their reserved keys.
 */
void registerBuiltinEffects(TwineContext& context);

} // namespace weft

#endif // WEFT_TWINE_TWINE_CONTEXT_H
