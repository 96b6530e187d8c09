#include "markup/text/text_measure.h"
#include "markup/core/string_utils.h"
#include "markup/interaction/interaction_constants.h"
#include "markup/text/font_manager.h"

#include <hb.h>

namespace markup::text {

TextMeasure::TextMeasure(FontManager* fonts)
    : fonts_(fonts), buffer_(hb_buffer_create()) {}

TextMeasure::~TextMeasure() {
    if (buffer_) {
        hb_buffer_destroy(buffer_);
        buffer_ = nullptr;
    }
}

float TextMeasure::estimateWidth(std::string_view content, float fontSize) {
    return static_cast<float>(utf16Length(content)) * fontSize * interaction_constants::TEXT_WIDTH_FACTOR;
}

bool TextMeasure::hasShapedFont() const {
    return fonts_ && fonts_->hasFont(fontId_);
}

float TextMeasure::lineHeight(float fontSize) const {
    return fontSize * interaction_constants::TEXT_LINE_HEIGHT_FACTOR;
}

float TextMeasure::measureWidth(std::string_view content, float fontSize) const {
    if (content.empty()) return 0.0f;
    float width = 0.0f;
    if (hasShapedFont() && shapeWidth(content, fontSize, width)) {
        return width;
    }
    return estimateWidth(content, fontSize);
}

bool TextMeasure::shapeWidth(std::string_view content, float fontSize, float& outWidth) const {
    const FontHandle* handle = fonts_->getFont(fontId_);
    if (!handle || !handle->hbFont || !buffer_) return false;
    if (!fonts_->setFontSize(fontId_, fontSize)) return false;

    hb_buffer_reset(buffer_);
    hb_buffer_add_utf8(buffer_, content.data(), static_cast<int>(content.size()), 0, -1);
    hb_buffer_guess_segment_properties(buffer_);
    hb_shape(handle->hbFont, buffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    const hb_glyph_position_t* pos = hb_buffer_get_glyph_positions(buffer_, &glyphCount);
    if (!pos) return false;

    // 26.6 fixed point
    hb_position_t advance = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += pos[i].x_advance;
    }
    outWidth = static_cast<float>(advance) / 64.0f;
    return true;
}

} // namespace markup::text
