#pragma once

#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace markup {

class AnnotationStore;
class CoordinateMapper;

// A reference line waiting for the user to type its real-world length.
struct PendingReference {
    std::uint32_t lineId;
    Point2 anchor; // visual midpoint of the line when the capture opened
};

/**
 * CalibrationEngine: converts measured pixel distances into real-world
 * units using the single reference line of a store.
 *
 * Pixel lengths are always taken between visual (post-transform) endpoints.
 */
class CalibrationEngine {
public:
    CalibrationEngine(AnnotationStore& store, const CoordinateMapper& mapper);

    float pixelLength(const MarkupLine& line) const;

    /**
     * Real-world length of a measurement line. Empty when the line is not a
     * measurement, is itself the reference, or no usable reference exists.
     */
    std::optional<float> scaledLength(const MarkupLine& line) const;

    /** Unit of the current reference, empty when none. */
    std::string referenceUnit() const;

    /**
     * Text shown next to a measurement or reference line, empty for plain
     * lines and for measurements without a reference.
     */
    std::string label(const MarkupLine& line) const;

    // =========================================================================
    // Reference capture
    // =========================================================================

    /**
     * A capture counts as open only while its line exists; one left behind
     * by undo or removal is treated as absent.
     */
    bool hasPendingReference() const;
    const PendingReference* pendingReference() const;

    /**
     * Open the one-time length input for a freshly drawn line.
     * Fails if a live capture is already open or the line does not exist.
     */
    bool beginReferenceCapture(std::uint32_t lineId);

    /**
     * Parse and apply the typed length. Non-numeric or non-positive values
     * return InvalidInput and keep the capture open. If the line vanished the
     * capture is dropped and StaleReference is returned.
     */
    MarkupError submitReference(std::string_view value, std::string_view unit);
    MarkupError submitReference(float value, std::string_view unit);

    /**
     * Drop the pending capture; the line itself is kept.
     * @return False if no live capture was open
     */
    bool cancelReferenceCapture();

    static bool parseLength(std::string_view text, float& out);
    static std::string formatLength(float value, std::string_view unit);

private:
    AnnotationStore& store_;
    const CoordinateMapper& mapper_;
    std::optional<PendingReference> pending_;
};

} // namespace markup
