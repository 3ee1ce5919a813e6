#ifndef WEFT_TEXT_FONT_MANAGER_H
#define WEFT_TEXT_FONT_MANAGER_H

#include "weft/text/text_types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace weft {

/**
 * Unscaled font metrics in font design units.
 */
struct FontMetrics {
    float unitsPerEM = 1000.0f;
    float ascender = 0.0f;
    float descender = 0.0f;  // negative below the baseline
    float lineGap = 0.0f;
    float xHeight = 0.0f;    // 0 if the font doesn't declare it
    float capHeight = 0.0f;  // 0 if the font doesn't declare it
};

/**
 * FontHandle: a loaded font with its FreeType face and HarfBuzz font.
 * The face and the HarfBuzz font are released by the FontManager.
 */
class FontHandle : public Font {
public:
    std::uint32_t id() const override { return id_; }
    GlyphIndex glyphIndexOf(char32_t codePoint) const override;

    const std::string& familyName() const { return familyName_; }
    const FontMetrics& metrics() const { return metrics_; }
    FT_Face ftFace() const { return ftFace_; }
    hb_font_t* hbFont() const { return hbFont_; }

    /**
     * Set the size used by the FreeType face and the HarfBuzz font.
     * Repeated calls with the same size are free.
     * @param size Pixel size in fractional units (26.6, 72 DPI)
     * @return True if successful
     */
    bool setSize(fract::Unit size) const;

private:
    friend class FontManager;

    std::uint32_t id_ = 0;
    std::string familyName_;
    FT_Face ftFace_ = nullptr;
    hb_font_t* hbFont_ = nullptr;
    FontMetrics metrics_;
    mutable fract::Unit activeSize_ = 0;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData_;
};

/**
 * Returns the FontHandle behind a Font, for the FreeType backed sizers and
 * rasterizers.
 * @throws ConfigError if the font wasn't loaded by a FontManager
 */
const FontHandle& requireFontHandle(const Font& font);

/**
 * FontManager: owns the FreeType library and every loaded font.
 *
 * Responsibilities:
 * - Initialize/cleanup FreeType library
 * - Load fonts from memory or file
 * - Keep loaded fonts by ID
 * - Manage the default font
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize the font system. Must be called before any other operations.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Release every font and the FreeType library. Fonts obtained from
     * getFont() become dangling.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by the FontManager)
     * @param dataSize Size of font data in bytes
     * @param familyName Optional family name override
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = ""
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath);

    /**
     * Unload a font by ID.
     * @return True if font was found and unloaded
     */
    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Font Access
    // =========================================================================

    /**
     * @param fontId Font ID (0 = default font)
     * @return Pointer to the font, or nullptr if not found
     */
    const FontHandle* getFont(std::uint32_t fontId) const;

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }
    void setDefaultFontId(std::uint32_t fontId) { defaultFontId_ = fontId; }

    bool hasFont(std::uint32_t fontId) const;
    std::vector<std::uint32_t> getLoadedFontIds() const;

private:
    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName
    );

    FontMetrics extractMetrics(FT_Face face) const;
    void releaseHandle(FontHandle& handle);

    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;
    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace weft

#endif // WEFT_TEXT_FONT_MANAGER_H
