#include "markup/persistence/snapshot.h"
#include "markup/core/string_utils.h"

namespace markup {

namespace {

std::uint64_t hashPoint(std::uint64_t h, const Point2& p) {
    h = hashF32(h, p.x);
    return hashF32(h, p.y);
}

std::uint64_t hashDuration(std::uint64_t h, const DisplayDuration& d) {
    h = hashU32(h, static_cast<std::uint32_t>(d.mode));
    return hashF32(h, d.mode == DisplayDuration::Mode::Seconds ? d.seconds : 0.0f);
}

std::uint64_t hashCreatedAt(std::uint64_t h, const std::optional<double>& t) {
    h = hashU32(h, t ? 1u : 0u);
    return t ? hashF64(h, *t) : h;
}

} // namespace

SnapDigest computeSnapDigest(const MarkupSnap& snap) {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, static_cast<std::uint32_t>(snap.lines.size()));
    for (const MarkupLine& l : snap.lines) {
        h = hashU32(h, l.id);
        h = hashPoint(h, l.p1);
        h = hashPoint(h, l.p2);
        h = hashU32(h, l.color);
        h = hashF32(h, l.width);
        h = hashU32(h, l.showAngle ? 1u : 0u);
        h = hashU32(h, l.isMeasurement ? 1u : 0u);
        h = hashString(h, l.name);
        h = hashCreatedAt(h, l.createdAt);
        h = hashDuration(h, l.displayDuration);
        h = hashU32(h, l.referenceLength ? 1u : 0u);
        h = hashF32(h, l.referenceLength.value_or(0.0f));
        h = hashString(h, l.unit);
    }

    h = hashU32(h, static_cast<std::uint32_t>(snap.angles.size()));
    for (const MarkupAngle& a : snap.angles) {
        h = hashU32(h, a.id);
        h = hashPoint(h, a.p1);
        h = hashPoint(h, a.vertex);
        h = hashPoint(h, a.p2);
        h = hashU32(h, a.color);
        h = hashF32(h, a.width);
        h = hashF32(h, a.angleDeg);
        h = hashString(h, a.name);
        h = hashCreatedAt(h, a.createdAt);
        h = hashDuration(h, a.displayDuration);
    }

    h = hashU32(h, static_cast<std::uint32_t>(snap.texts.size()));
    for (const MarkupText& t : snap.texts) {
        h = hashU32(h, t.id);
        h = hashPoint(h, t.pos);
        h = hashString(h, t.content);
        h = hashF32(h, t.size);
        h = hashU32(h, t.color);
        h = hashU32(h, t.backgroundColor ? 1u : 0u);
        h = hashU32(h, t.backgroundColor.value_or(0u));
        h = hashF32(h, t.boxWidth);
        h = hashString(h, t.name);
        h = hashCreatedAt(h, t.createdAt);
        h = hashDuration(h, t.displayDuration);
    }

    const GridSettings& g = snap.grid;
    h = hashU32(h, g.show ? 1u : 0u);
    h = hashU32(h, static_cast<std::uint32_t>(g.mode));
    h = hashF32(h, g.spacingPx);
    h = hashU32(h, g.color);
    h = hashF32(h, g.opacity);
    h = hashF32(h, g.originX);
    h = hashF32(h, g.originY);
    h = hashU32(h, snap.hidden ? 1u : 0u);

    return SnapDigest{
        static_cast<std::uint32_t>(h & 0xFFFFFFFFull),
        static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFull),
    };
}

} // namespace markup
