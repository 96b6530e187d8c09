#include "markup/text/font_manager.h"
#include "markup/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

namespace markup::text {

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }
    if (FT_Init_FreeType(&ftLibrary_)) {
        MARKUP_LOG_WARN("FontManager: FT_Init_FreeType failed");
        return false;
    }
    initialized_ = true;
    return true;
}

void FontManager::releaseHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }
    for (auto& entry : fonts_) {
        if (entry.second) releaseHandle(*entry.second);
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }
    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from the buffer for the lifetime of the face
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    const FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face
    );
    if (error || !face) {
        MARKUP_LOG_WARN("FontManager: FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    const std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy));
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }
    fonts_[fontId] = std::move(handle);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }
    return fontId;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    const FontHandle* handle = getFont(fontId);
    if (!handle || !handle->ftFace || !(fontSize > 0.0f)) {
        return false;
    }

    // 26.6 fixed point at 72 DPI, so points == pixels
    if (FT_Set_Char_Size(handle->ftFace, 0, static_cast<FT_F26Dot6>(fontSize * 64), 72, 72)) {
        return false;
    }
    if (handle->hbFont) {
        hb_ft_font_changed(handle->hbFont);
        hb_font_set_scale(
            handle->hbFont,
            static_cast<int>(fontSize * 64),
            static_cast<int>(fontSize * 64)
        );
    }
    return true;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->ftFace = face;
    handle->fontData = std::move(fontData);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }
    return handle;
}

} // namespace markup::text
