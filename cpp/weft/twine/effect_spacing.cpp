#include "weft/twine/effect_spacing.h"
#include "weft/core/errors.h"

namespace weft {

namespace {

constexpr std::uint8_t kPadsLogicalBit = 0x80;
constexpr std::uint8_t kMinWidthLogicalBit = 0x40;
constexpr std::uint8_t kPartsMask = 0x3F;

// Layouts by part count:
// 1: minWidth
// 2: prePad, postPad
// 3: minWidth, prePad, postPad
// 4: prePad, postPad, lineStartPad, lineBreakPad
// 5: minWidth, prePad, postPad, lineStartPad, lineBreakPad
constexpr std::uint8_t kMaxParts = 5;

fract::Unit rescaleLogical(fract::Unit value, bool logical, fract::Unit scaledSize) {
    if (!logical) {
        return value;
    }
    return fract::rescale(value, fract::fromInt(16), scaledSize);
}

} // namespace

fract::Unit EffectSpacing::prePadAt(fract::Unit scaledSize) const {
    return rescaleLogical(prePad, arePadsLogical, scaledSize);
}

fract::Unit EffectSpacing::postPadAt(fract::Unit scaledSize) const {
    return rescaleLogical(postPad, arePadsLogical, scaledSize);
}

fract::Unit EffectSpacing::minWidthAt(fract::Unit scaledSize) const {
    return rescaleLogical(minWidth, isMinWidthLogical, scaledSize);
}

fract::Unit EffectSpacing::lineStartPadAt(fract::Unit scaledSize) const {
    return rescaleLogical(lineStartPad, arePadsLogical, scaledSize);
}

fract::Unit EffectSpacing::lineBreakPadAt(fract::Unit scaledSize) const {
    return rescaleLogical(lineBreakPad, arePadsLogical, scaledSize);
}

void EffectSpacing::appendTo(std::string& buffer) const {
    if (empty()) {
        throw ConfigError("can't encode an empty effect spacing");
    }

    std::uint8_t control = 0;
    if (arePadsLogical) {
        control |= kPadsLogicalBit;
    }
    if (isMinWidthLogical) {
        control |= kMinWidthLogicalBit;
    }

    const bool hasMinWidth = minWidth != 0;
    const bool hasPads = prePad != 0 || postPad != 0;
    const bool hasLinePads = lineStartPad != 0 || lineBreakPad != 0;

    std::uint8_t parts = 0;
    if (hasLinePads) {
        parts = hasMinWidth ? 5 : 4;
    } else if (hasPads) {
        parts = hasMinWidth ? 3 : 2;
    } else {
        parts = 1;
    }

    buffer.push_back(static_cast<char>(control | parts));
    if (hasMinWidth) {
        appendUnit24(buffer, minWidth);
    }
    if (parts >= 2) {
        appendUnit24(buffer, prePad);
        appendUnit24(buffer, postPad);
    }
    if (parts >= 4) {
        appendUnit24(buffer, lineStartPad);
        appendUnit24(buffer, lineBreakPad);
    }
}

EffectSpacing EffectSpacing::decode(std::string_view buffer, std::size_t& pos) {
    if (pos >= buffer.size()) {
        throw MalformedTwineError("effect spacing: missing control byte");
    }

    const std::uint8_t control = static_cast<std::uint8_t>(buffer[pos]);
    const std::uint8_t parts = control & kPartsMask;
    if (parts == 0 || parts > kMaxParts) {
        throw MalformedTwineError("effect spacing: invalid part count " + std::to_string(parts));
    }
    if (buffer.size() - pos < 1 + std::size_t(parts) * 3) {
        throw MalformedTwineError("effect spacing: truncated block");
    }

    EffectSpacing spacing;
    spacing.arePadsLogical = (control & kPadsLogicalBit) != 0;
    spacing.isMinWidthLogical = (control & kMinWidthLogicalBit) != 0;

    std::size_t at = pos + 1;
    auto next = [&]() {
        fract::Unit value = readUnit24(buffer, at);
        at += 3;
        return value;
    };

    if (parts == 1 || parts == 3 || parts == 5) {
        spacing.minWidth = next();
    }
    if (parts >= 2) {
        spacing.prePad = next();
        spacing.postPad = next();
    }
    if (parts >= 4) {
        spacing.lineStartPad = next();
        spacing.lineBreakPad = next();
    }

    pos = at;
    return spacing;
}

bool operator==(const EffectSpacing& a, const EffectSpacing& b) {
    return a.prePad == b.prePad && a.postPad == b.postPad && a.minWidth == b.minWidth
        && a.lineStartPad == b.lineStartPad && a.lineBreakPad == b.lineBreakPad
        && a.arePadsLogical == b.arePadsLogical && a.isMinWidthLogical == b.isMinWidthLogical;
}

void appendUnit24(std::string& buffer, fract::Unit value) {
    if (value > kMaxEncodedUnit || value < -kMaxEncodedUnit) {
        throw ConfigError("value " + fract::toString(value) + " out of the encodable range");
    }
    const std::uint32_t bits = static_cast<std::uint32_t>(value);
    buffer.push_back(static_cast<char>(bits & 0xFF));
    buffer.push_back(static_cast<char>((bits >> 8) & 0xFF));
    buffer.push_back(static_cast<char>((bits >> 16) & 0xFF));
}

fract::Unit readUnit24(std::string_view buffer, std::size_t pos) {
    std::uint32_t bits = static_cast<std::uint8_t>(buffer[pos]);
    bits |= std::uint32_t(static_cast<std::uint8_t>(buffer[pos + 1])) << 8;
    bits |= std::uint32_t(static_cast<std::uint8_t>(buffer[pos + 2])) << 16;
    // sign extend from 24 bits
    if (bits & 0x800000u) {
        bits |= 0xFF000000u;
    }
    return static_cast<fract::Unit>(bits);
}

} // namespace weft
