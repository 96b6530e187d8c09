#include "markup/visibility/visibility_filter.h"
#include "markup/entity/annotation_store.h"

namespace markup {

VisibilityFilter::VisibilityFilter(const DisplayDurationDefaults& defaults)
    : defaults_(defaults) {}

DisplayDuration VisibilityFilter::effective(EntityKind kind, const DisplayDuration& override) const {
    if (override.mode != DisplayDuration::Mode::TypeDefault) return override;
    switch (kind) {
        case EntityKind::Line: return defaults_.line;
        case EntityKind::Angle: return defaults_.angle;
        case EntityKind::Text: return defaults_.text;
    }
    return DisplayDuration::persistent();
}

bool VisibilityFilter::inWindow(const std::optional<double>& createdAt, const DisplayDuration& duration, double t) {
    if (!createdAt) return true;
    const double start = *createdAt;
    switch (duration.mode) {
        case DisplayDuration::Mode::Seconds:
            return t >= start && t <= start + static_cast<double>(duration.seconds);
        case DisplayDuration::Mode::Persistent:
        case DisplayDuration::Mode::TypeDefault:
            break;
    }
    return t >= start;
}

bool VisibilityFilter::visible(const MarkupLine& line, double t) const {
    return inWindow(line.createdAt, effective(EntityKind::Line, line.displayDuration), t);
}

bool VisibilityFilter::visible(const MarkupAngle& angle, double t) const {
    return inWindow(angle.createdAt, effective(EntityKind::Angle, angle.displayDuration), t);
}

bool VisibilityFilter::visible(const MarkupText& text, double t) const {
    return inWindow(text.createdAt, effective(EntityKind::Text, text.displayDuration), t);
}

VisibleSet VisibilityFilter::collect(const AnnotationStore& store, double t) const {
    VisibleSet out;
    if (store.hidden()) return out;
    for (const auto& l : store.lines()) {
        if (visible(l, t)) out.lines.push_back(&l);
    }
    for (const auto& a : store.angles()) {
        if (visible(a, t)) out.angles.push_back(&a);
    }
    for (const auto& x : store.texts()) {
        if (visible(x, t)) out.texts.push_back(&x);
    }
    return out;
}

bool VisibilityFilter::isVisible(const AnnotationStore& store, const EntityRef& ref, double t) const {
    if (store.hidden()) return false;
    switch (ref.kind) {
        case EntityKind::Line: {
            const MarkupLine* l = store.findLine(ref.id);
            return l && visible(*l, t);
        }
        case EntityKind::Angle: {
            const MarkupAngle* a = store.findAngle(ref.id);
            return a && visible(*a, t);
        }
        case EntityKind::Text: {
            const MarkupText* x = store.findText(ref.id);
            return x && visible(*x, t);
        }
    }
    return false;
}

} // namespace markup
