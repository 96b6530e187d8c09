#ifndef MARKUP_ENTITY_MARKUP_TYPES_H
#define MARKUP_ENTITY_MARKUP_TYPES_H

#include "markup/core/types.h"
#include "markup/core/color.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace markup {

enum class MarkupTool : std::uint8_t {
    None = 0,
    Line = 1,
    Angle = 2,
    Text = 3,
    Measure = 4,
};

/**
 * Per-item display duration override.
 * TypeDefault defers to the configured default for the item's kind.
 */
struct DisplayDuration {
    enum class Mode : std::uint8_t {
        TypeDefault = 0,
        Persistent = 1,
        Seconds = 2,
    };

    Mode mode{Mode::TypeDefault};
    float seconds{0.0f};

    static DisplayDuration typeDefault() { return DisplayDuration{}; }
    static DisplayDuration persistent() { return DisplayDuration{Mode::Persistent, 0.0f}; }
    static DisplayDuration forSeconds(float s) { return DisplayDuration{Mode::Seconds, s}; }
};

inline bool operator==(const DisplayDuration& a, const DisplayDuration& b) {
    if (a.mode != b.mode) return false;
    return a.mode != DisplayDuration::Mode::Seconds || a.seconds == b.seconds;
}
inline bool operator!=(const DisplayDuration& a, const DisplayDuration& b) { return !(a == b); }

// Points are stored in normalized content space ([0,1] over the content box).

struct MarkupLine {
    std::uint32_t id{0};
    Point2 p1{0.0f, 0.0f};
    Point2 p2{0.0f, 0.0f};
    Color color{kColorYellow};
    float width{2.0f};
    bool showAngle{false};
    std::string name;
    std::optional<double> createdAt;
    DisplayDuration displayDuration;
    std::optional<float> referenceLength;
    std::string unit;
    bool isMeasurement{false};
};

struct MarkupAngle {
    std::uint32_t id{0};
    Point2 p1{0.0f, 0.0f};
    Point2 vertex{0.0f, 0.0f};
    Point2 p2{0.0f, 0.0f};
    Color color{kColorYellow};
    float width{2.0f};
    float angleDeg{0.0f};
    std::string name;
    std::optional<double> createdAt;
    DisplayDuration displayDuration;
};

struct MarkupText {
    std::uint32_t id{0};
    Point2 pos{0.0f, 0.0f};
    std::string content;
    float size{18.0f};
    Color color{kColorYellow};
    std::optional<Color> backgroundColor;
    float boxWidth{0.0f}; // normalized; 0 = single line, auto width
    std::string name;
    std::optional<double> createdAt;
    DisplayDuration displayDuration;
};

enum class GridMode : std::uint8_t {
    Both = 0,
    Horizontal = 1,
    Vertical = 2,
};

// Grid spacing and origin are surface pixels, not content space.
struct GridSettings {
    bool show{false};
    GridMode mode{GridMode::Both};
    float spacingPx{50.0f};
    Color color{kColorWhite};
    float opacity{0.35f};
    float originX{0.0f};
    float originY{0.0f};
};

struct MarkupSnap {
    std::vector<MarkupLine> lines;
    std::vector<MarkupAngle> angles;
    std::vector<MarkupText> texts;
    GridSettings grid;
    bool hidden{false};
};

// =============================================================================
// Partial updates (field-level merge)
// =============================================================================

struct LineUpdate {
    std::optional<Point2> p1;
    std::optional<Point2> p2;
    std::optional<Color> color;
    std::optional<float> width;
    std::optional<bool> showAngle;
    std::optional<std::string> name;
    std::optional<DisplayDuration> displayDuration;
    std::optional<bool> isMeasurement;
};

struct AngleUpdate {
    std::optional<Point2> p1;
    std::optional<Point2> vertex;
    std::optional<Point2> p2;
    std::optional<Color> color;
    std::optional<float> width;
    std::optional<float> angleDeg;
    std::optional<std::string> name;
    std::optional<DisplayDuration> displayDuration;
};

struct TextUpdate {
    std::optional<Point2> pos;
    std::optional<std::string> content;
    std::optional<float> size;
    std::optional<Color> color;
    std::optional<std::optional<Color>> backgroundColor;
    std::optional<float> boxWidth;
    std::optional<std::string> name;
    std::optional<DisplayDuration> displayDuration;
};

struct GridUpdate {
    std::optional<bool> show;
    std::optional<GridMode> mode;
    std::optional<float> spacingPx;
    std::optional<Color> color;
    std::optional<float> opacity;
    std::optional<float> originX;
    std::optional<float> originY;
};

} // namespace markup

#endif // MARKUP_ENTITY_MARKUP_TYPES_H
