#include "weft/text/font_manager.h"
#include "weft/core/errors.h"
#include "weft/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>

namespace weft {

GlyphIndex FontHandle::glyphIndexOf(char32_t codePoint) const {
    if (!ftFace_) return 0;
    FT_UInt index = FT_Get_Char_Index(ftFace_, static_cast<FT_ULong>(codePoint));
    if (index > 0xFFFF) return 0;
    return static_cast<GlyphIndex>(index);
}

bool FontHandle::setSize(fract::Unit size) const {
    if (!ftFace_ || size <= 0) {
        return false;
    }
    if (size == activeSize_) {
        return true;
    }

    FT_Error error = FT_Set_Char_Size(
        ftFace_,
        0,                              // char_width (0 = same as height)
        static_cast<FT_F26Dot6>(size),  // char_height in 1/64ths
        72,
        72
    );
    if (error) {
        WEFT_LOG_WARN("FT_Set_Char_Size(%d) failed for font %u", static_cast<int>(size), id_);
        return false;
    }

    if (hbFont_) {
        hb_font_set_scale(hbFont_, static_cast<int>(size), static_cast<int>(size));
    }
    activeSize_ = size;
    return true;
}

const FontHandle& requireFontHandle(const Font& font) {
    const FontHandle* handle = dynamic_cast<const FontHandle*>(&font);
    if (!handle || !handle->ftFace()) {
        throw ConfigError("font " + std::to_string(font.id()) + " is not backed by a FreeType face");
    }
    return *handle;
}

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        WEFT_LOG_WARN("FT_Init_FreeType failed (error %d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) {
            releaseHandle(*handle);
        }
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from the buffer for as long as the face lives
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,  // face index
        &face
    );

    if (error || !face) {
        WEFT_LOG_WARN("FT_New_Memory_Face failed (error %d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family);

    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    WEFT_LOG_DEBUG("loaded font %u (%s)", fontId, family.c_str());
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        WEFT_LOG_DEBUG("can't open font file %s", filePath.c_str());
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        WEFT_LOG_WARN("failed reading font file %s", filePath.c_str());
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), "");
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) {
        releaseHandle(*it->second);
    }
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }

    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;

    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    if (fontId == 0) {
        return defaultFontId_ != 0 && fonts_.find(defaultFontId_) != fonts_.end();
    }
    return fonts_.find(fontId) != fonts_.end();
}

std::vector<std::uint32_t> FontManager::getLoadedFontIds() const {
    std::vector<std::uint32_t> ids;
    ids.reserve(fonts_.size());
    for (const auto& [id, _] : fonts_) {
        ids.push_back(id);
    }
    return ids;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id_ = id;
    handle->familyName_ = familyName;
    handle->ftFace_ = face;
    handle->fontData_ = std::move(fontData);

    handle->hbFont_ = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont_) {
        WEFT_LOG_WARN("hb_ft_font_create failed for font %u", id);
        return nullptr;
    }

    handle->metrics_ = extractMetrics(face);
    return handle;
}

FontMetrics FontManager::extractMetrics(FT_Face face) const {
    FontMetrics metrics{};

    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF && os2->version >= 2) {
        metrics.xHeight = static_cast<float>(os2->sxHeight);
        metrics.capHeight = static_cast<float>(os2->sCapHeight);
    }

    return metrics;
}

void FontManager::releaseHandle(FontHandle& handle) {
    if (handle.hbFont_) {
        hb_font_destroy(handle.hbFont_);
        handle.hbFont_ = nullptr;
    }
    if (handle.ftFace_) {
        FT_Done_Face(handle.ftFace_);
        handle.ftFace_ = nullptr;
    }
}

} // namespace weft
