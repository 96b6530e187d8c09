#pragma once

#include <cstdint>
#include <string_view>

typedef struct hb_buffer_t hb_buffer_t;

namespace markup::text {

class FontManager;

/**
 * TextMeasure: single-line advance width of annotation text.
 *
 * With a loaded font the width is the sum of HarfBuzz advances. Without one
 * (or if shaping fails) it falls back to a per-character estimate so hit
 * boxes stay usable on hosts that never load fonts.
 */
class TextMeasure {
public:
    explicit TextMeasure(FontManager* fonts = nullptr);
    ~TextMeasure();

    TextMeasure(const TextMeasure&) = delete;
    TextMeasure& operator=(const TextMeasure&) = delete;

    void setFontManager(FontManager* fonts) { fonts_ = fonts; }
    void setFontId(std::uint32_t fontId) { fontId_ = fontId; }

    float measureWidth(std::string_view content, float fontSize) const;
    float lineHeight(float fontSize) const;

    bool hasShapedFont() const;

    static float estimateWidth(std::string_view content, float fontSize);

private:
    bool shapeWidth(std::string_view content, float fontSize, float& outWidth) const;

    FontManager* fonts_;
    std::uint32_t fontId_ = 0;
    hb_buffer_t* buffer_ = nullptr;
};

} // namespace markup::text
