#pragma once

#include "markup/config/markup_config.h"
#include "markup/entity/markup_types.h"
#include <optional>
#include <vector>

namespace markup {

class AnnotationStore;

// Borrowed views of the annotations visible at one playback instant.
struct VisibleSet {
    std::vector<const MarkupLine*> lines;
    std::vector<const MarkupAngle*> angles;
    std::vector<const MarkupText*> texts;

    bool empty() const { return lines.empty() && angles.empty() && texts.empty(); }
};

/**
 * VisibilityFilter: decides whether an annotation is drawn at a given
 * playback time.
 *
 * Items without a creation timestamp are always visible. Otherwise the
 * effective duration is the item's override or the per-kind default;
 * persistent items are visible from their timestamp onwards, timed items
 * exactly while timestamp <= t <= timestamp + duration.
 */
class VisibilityFilter {
public:
    explicit VisibilityFilter(const DisplayDurationDefaults& defaults = DisplayDurationDefaults{});

    void setDefaults(const DisplayDurationDefaults& defaults) { defaults_ = defaults; }
    const DisplayDurationDefaults& defaults() const { return defaults_; }

    bool visible(const MarkupLine& line, double t) const;
    bool visible(const MarkupAngle& angle, double t) const;
    bool visible(const MarkupText& text, double t) const;

    /** Resolve TypeDefault against the per-kind default. */
    DisplayDuration effective(EntityKind kind, const DisplayDuration& override) const;

    /**
     * Collect the visible subset of a store. Nothing is visible while the
     * store's hidden flag is set.
     */
    VisibleSet collect(const AnnotationStore& store, double t) const;

    bool isVisible(const AnnotationStore& store, const EntityRef& ref, double t) const;

    static bool inWindow(const std::optional<double>& createdAt, const DisplayDuration& duration, double t);

private:
    DisplayDurationDefaults defaults_;
};

} // namespace markup
