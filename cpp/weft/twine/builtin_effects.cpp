#include "weft/core/errors.h"
#include "weft/render/renderer.h"
#include "weft/twine/renderer_twine.h"
#include "weft/twine/twine_context.h"

namespace weft {

namespace {

void colorEffect(TwineContext& context, Renderer& renderer, const EffectArgs& args) {
    if (args.measuring) {
        return;
    }
    args.requirePayloadSize(4);

    switch (args.trigger) {
        case EffectTrigger::Push:
            context.storagePush(renderer.color());
            renderer.setColor(Color{args.payload[0], args.payload[1], args.payload[2], args.payload[3]});
            break;
        case EffectTrigger::Pop:
            renderer.setColor(context.storagePop<Color>());
            break;
        default:
            break;
    }
}

void fontEffect(TwineContext& context, Renderer& renderer, const EffectArgs& args) {
    args.requirePayloadSize(1);

    switch (args.trigger) {
        case EffectTrigger::Push:
            context.storagePush(FontSlot{renderer.font(), context.fontIndex});
            renderer.twine().setFontIndex(args.payload[0]);
            break;
        case EffectTrigger::Pop: {
            FontSlot previous = context.storagePop<FontSlot>();
            renderer.setFont(previous.font);
            context.fontIndex = previous.index;
            break;
        }
        default:
            break;
    }
}

void sizeEffect(TwineContext& context, Renderer& renderer, const EffectArgs& args, bool absolute) {
    args.requirePayloadSize(absolute ? 3 : 1);

    switch (args.trigger) {
        case EffectTrigger::Push: {
            const fract::Unit current = renderer.fract().size();
            context.storagePush(current);
            fract::Unit next = 0;
            if (absolute) {
                next = readUnit24(std::string_view(reinterpret_cast<const char*>(args.payload.data), 3), 0);
            } else {
                next = current + fract::fromInt(static_cast<std::int8_t>(args.payload[0]));
            }
            renderer.fract().setSize(next);
            break;
        }
        case EffectTrigger::Pop:
            renderer.fract().setSize(context.storagePop<fract::Unit>());
            break;
        default:
            break;
    }
}

} // namespace

void registerBuiltinEffects(TwineContext& context) {
    TwineContext* ctx = &context;
    context.effects[kEffectPushColor] = [ctx](Renderer& renderer, Target*, const EffectArgs& args) {
        colorEffect(*ctx, renderer, args);
    };
    context.effects[kEffectPushFont] = [ctx](Renderer& renderer, Target*, const EffectArgs& args) {
        fontEffect(*ctx, renderer, args);
    };
    context.effects[kEffectShiftSize] = [ctx](Renderer& renderer, Target*, const EffectArgs& args) {
        sizeEffect(*ctx, renderer, args, false);
    };
    context.effects[kEffectSetSize] = [ctx](Renderer& renderer, Target*, const EffectArgs& args) {
        sizeEffect(*ctx, renderer, args, true);
    };
}

} // namespace weft
