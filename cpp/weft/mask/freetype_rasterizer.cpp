#include "weft/mask/freetype_rasterizer.h"
#include "weft/core/logging.h"
#include "weft/text/font_manager.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <cstring>

namespace weft {

std::shared_ptr<const GlyphMask> FreeTypeRasterizer::rasterize(
    const Font& font, GlyphIndex glyph, fract::Unit size, fract::Point origin
) {
    const FontHandle& handle = requireFontHandle(font);
    if (!handle.setSize(size)) {
        return nullptr;
    }

    FT_Face face = handle.ftFace();
    FT_Int32 loadFlags = FT_LOAD_NO_BITMAP;
    if (!config_.hinting) {
        loadFlags |= FT_LOAD_NO_HINTING;
    }
    FT_Error error = FT_Load_Glyph(face, glyph, loadFlags);
    if (error) {
        WEFT_LOG_WARN("FT_Load_Glyph(%u) failed (error %d)", static_cast<unsigned>(glyph), static_cast<int>(error));
        return nullptr;
    }

    FT_GlyphSlot slot = face->glyph;
    if (slot->format != FT_GLYPH_FORMAT_OUTLINE) {
        WEFT_LOG_WARN("glyph %u has no outline", static_cast<unsigned>(glyph));
        return nullptr;
    }

    // y grows downwards on targets and upwards on outlines
    FT_Outline_Translate(&slot->outline, fract::fractShift(origin.x), -fract::fractShift(origin.y));

    error = FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL);
    if (error) {
        WEFT_LOG_WARN("FT_Render_Glyph(%u) failed (error %d)", static_cast<unsigned>(glyph), static_cast<int>(error));
        return nullptr;
    }

    const FT_Bitmap& bitmap = slot->bitmap;
    auto mask = std::make_shared<GlyphMask>();
    mask->offsetX = slot->bitmap_left;
    mask->offsetY = -slot->bitmap_top;
    mask->width = static_cast<int>(bitmap.width);
    mask->height = static_cast<int>(bitmap.rows);
    mask->alpha.resize(static_cast<std::size_t>(mask->width) * static_cast<std::size_t>(mask->height));

    for (int row = 0; row < mask->height; ++row) {
        const unsigned char* src = bitmap.buffer + static_cast<std::ptrdiff_t>(row) * bitmap.pitch;
        std::memcpy(mask->alpha.data() + static_cast<std::size_t>(row) * mask->width, src, static_cast<std::size_t>(mask->width));
    }

    return mask;
}

std::uint64_t FreeTypeRasterizer::signature() const {
    // 'FTRS' tag in the high bits, configuration in the low ones
    std::uint64_t sig = 0x4654525300000000ull;
    if (config_.hinting) sig |= 1;
    return sig;
}

void FreeTypeRasterizer::setConfig(const Config& config) {
    bool changed = config.hinting != config_.hinting;
    config_ = config;
    if (changed) {
        notifyConfigChange();
    }
}

} // namespace weft
