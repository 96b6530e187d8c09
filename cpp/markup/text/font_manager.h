#ifndef MARKUP_TEXT_FONT_MANAGER_H
#define MARKUP_TEXT_FONT_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace markup::text {

/**
 * FontHandle: a loaded face with its HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;

    FT_Face ftFace;
    hb_font_t* hbFont;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and the faces loaded for text
 * measurement.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory. The data is copied.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize);

    // =========================================================================
    // Font Access
    // =========================================================================

    /** @param fontId Font ID (0 = default font) */
    const FontHandle* getFont(std::uint32_t fontId) const;
    bool hasFont(std::uint32_t fontId) const;

    /**
     * Set the pixel size used for subsequent shaping with this font.
     * @return True if successful
     */
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData
    );
    static void releaseHandle(FontHandle& handle);

    FT_Library ftLibrary_ = nullptr;
    bool initialized_ = false;
    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace markup::text

#endif // MARKUP_TEXT_FONT_MANAGER_H
