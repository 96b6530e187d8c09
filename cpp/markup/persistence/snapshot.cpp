#include "markup/persistence/snapshot.h"
#include "markup/core/logging.h"
#include "markup/core/util.h"
#include "markup/persistence/snapshot_internal.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace markup {
using namespace snapshot::detail;

namespace {

struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};

class SectionReader {
public:
    explicit SectionReader(const SectionView& view) : view_(view) {}

    bool has(std::size_t n) const { return requireBytes(o_, n, view_.size); }

    // Callers check has() for fixed-size reads
    std::uint32_t u32() { const std::uint32_t v = readU32(view_.data, o_); o_ += 4; return v; }
    float f32() { const float v = readF32(view_.data, o_); o_ += 4; return v; }
    double f64() { const double v = readF64(view_.data, o_); o_ += 8; return v; }
    Point2 point() {
        const float x = f32();
        const float y = f32();
        return Point2{x, y};
    }

    MarkupError str(std::string& out) {
        if (!has(4)) return MarkupError::BufferTruncated;
        const std::uint32_t len = u32();
        if (!has(len)) return MarkupError::BufferTruncated;
        out.assign(reinterpret_cast<const char*>(view_.data + o_), len);
        o_ += len;
        return MarkupError::Ok;
    }

    MarkupError duration(DisplayDuration& out) {
        const std::uint32_t mode = u32();
        const float seconds = f32();
        if (mode > static_cast<std::uint32_t>(DisplayDuration::Mode::Seconds)) {
            return MarkupError::InvalidPayloadSize;
        }
        out.mode = static_cast<DisplayDuration::Mode>(mode);
        if (out.mode == DisplayDuration::Mode::Seconds && !(std::isfinite(seconds) && seconds >= 0.0f)) {
            return MarkupError::InvalidPayloadSize;
        }
        out.seconds = seconds;
        return MarkupError::Ok;
    }

    // Record count with a lower bound on the bytes it needs.
    MarkupError count(std::size_t minRecordBytes, std::uint32_t& out) {
        if (!has(4)) return MarkupError::BufferTruncated;
        out = u32();
        std::size_t need = 0;
        if (!tryMul(static_cast<std::size_t>(out), minRecordBytes, need)) {
            return MarkupError::InvalidPayloadSize;
        }
        if (!has(need)) return MarkupError::BufferTruncated;
        return MarkupError::Ok;
    }

private:
    const SectionView& view_;
    std::size_t o_ = 0;
};

MarkupError parseLines(const SectionView& view, std::vector<MarkupLine>& out) {
    SectionReader r(view);
    std::uint32_t n = 0;
    MarkupError err = r.count(lineSnapshotBytes + 8, n);
    if (err != MarkupError::Ok) return err;
    out.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        if (!r.has(lineSnapshotBytes)) return MarkupError::BufferTruncated;
        MarkupLine l;
        l.id = r.u32();
        const std::uint32_t flags = r.u32();
        l.p1 = r.point();
        l.p2 = r.point();
        l.color = r.u32();
        l.width = r.f32();
        const double createdAt = r.f64();
        err = r.duration(l.displayDuration);
        if (err != MarkupError::Ok) return err;
        const float reference = r.f32();
        err = r.str(l.name);
        if (err != MarkupError::Ok) return err;
        err = r.str(l.unit);
        if (err != MarkupError::Ok) return err;
        l.showAngle = (flags & FLAG_SHOW_ANGLE) != 0;
        l.isMeasurement = (flags & FLAG_MEASUREMENT) != 0;
        if (flags & FLAG_HAS_CREATED_AT) l.createdAt = createdAt;
        if (flags & FLAG_HAS_REFERENCE) l.referenceLength = reference;
        out.push_back(std::move(l));
    }
    return MarkupError::Ok;
}

MarkupError parseAngles(const SectionView& view, std::vector<MarkupAngle>& out) {
    SectionReader r(view);
    std::uint32_t n = 0;
    MarkupError err = r.count(angleSnapshotBytes + 4, n);
    if (err != MarkupError::Ok) return err;
    out.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        if (!r.has(angleSnapshotBytes)) return MarkupError::BufferTruncated;
        MarkupAngle a;
        a.id = r.u32();
        const std::uint32_t flags = r.u32();
        a.p1 = r.point();
        a.vertex = r.point();
        a.p2 = r.point();
        a.color = r.u32();
        a.width = r.f32();
        a.angleDeg = r.f32();
        const double createdAt = r.f64();
        err = r.duration(a.displayDuration);
        if (err != MarkupError::Ok) return err;
        err = r.str(a.name);
        if (err != MarkupError::Ok) return err;
        if (flags & FLAG_HAS_CREATED_AT) a.createdAt = createdAt;
        out.push_back(std::move(a));
    }
    return MarkupError::Ok;
}

MarkupError parseTexts(const SectionView& view, std::vector<MarkupText>& out) {
    SectionReader r(view);
    std::uint32_t n = 0;
    MarkupError err = r.count(textSnapshotBytes + 8, n);
    if (err != MarkupError::Ok) return err;
    out.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        if (!r.has(textSnapshotBytes)) return MarkupError::BufferTruncated;
        MarkupText t;
        t.id = r.u32();
        const std::uint32_t flags = r.u32();
        t.pos = r.point();
        t.size = r.f32();
        t.color = r.u32();
        const Color background = r.u32();
        t.boxWidth = r.f32();
        const double createdAt = r.f64();
        err = r.duration(t.displayDuration);
        if (err != MarkupError::Ok) return err;
        err = r.str(t.content);
        if (err != MarkupError::Ok) return err;
        err = r.str(t.name);
        if (err != MarkupError::Ok) return err;
        if (flags & FLAG_HAS_CREATED_AT) t.createdAt = createdAt;
        if (flags & FLAG_HAS_BACKGROUND) t.backgroundColor = background;
        out.push_back(std::move(t));
    }
    return MarkupError::Ok;
}

template <typename T>
bool idsUnique(const std::vector<T>& items) {
    std::unordered_set<std::uint32_t> seen;
    seen.reserve(items.size());
    for (const auto& item : items) {
        if (!seen.insert(item.id).second) return false;
    }
    return true;
}

MarkupError parseGrid(const SectionView& view, GridSettings& out) {
    SectionReader r(view);
    if (!r.has(gridSnapshotBytes)) return MarkupError::BufferTruncated;
    out.show = r.u32() != 0;
    const std::uint32_t mode = r.u32();
    if (mode > static_cast<std::uint32_t>(GridMode::Vertical)) return MarkupError::InvalidPayloadSize;
    out.mode = static_cast<GridMode>(mode);
    out.spacingPx = r.f32();
    out.color = r.u32();
    out.opacity = r.f32();
    out.originX = r.f32();
    out.originY = r.f32();
    return MarkupError::Ok;
}

} // namespace

MarkupError parseSnapshot(const std::uint8_t* src, std::uint32_t byteCount, MarkupSnap& out) {
    if (!src || byteCount < snapshotHeaderBytesMsnp) {
        return MarkupError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicMsnp) return MarkupError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionMsnp) return MarkupError::UnsupportedVersion;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t headerBytes = snapshotHeaderBytesMsnp;
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return MarkupError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(headerBytes, tableBytes, headerPlusTable)) {
        return MarkupError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return MarkupError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return MarkupError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return MarkupError::InvalidPayloadSize;
        if (end > byteCount) return MarkupError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) {
            MARKUP_LOG_WARN("parseSnapshot: crc mismatch in section %u", i);
            return MarkupError::InvalidPayloadSize;
        }
        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* line = findSection(TAG_LINE);
    const SectionView* angl = findSection(TAG_ANGL);
    const SectionView* text = findSection(TAG_TEXT);
    const SectionView* grid = findSection(TAG_GRID);
    const SectionView* flag = findSection(TAG_FLAG);
    if (!line || !angl || !text || !grid || !flag) {
        return MarkupError::InvalidPayloadSize;
    }

    MarkupSnap parsed;
    MarkupError err = parseLines(*line, parsed.lines);
    if (err != MarkupError::Ok) return err;
    err = parseAngles(*angl, parsed.angles);
    if (err != MarkupError::Ok) return err;
    err = parseTexts(*text, parsed.texts);
    if (err != MarkupError::Ok) return err;
    err = parseGrid(*grid, parsed.grid);
    if (err != MarkupError::Ok) return err;

    if (!idsUnique(parsed.lines) || !idsUnique(parsed.angles) || !idsUnique(parsed.texts)) {
        MARKUP_LOG_WARN("parseSnapshot: duplicate annotation id");
        return MarkupError::InvalidPayloadSize;
    }
    const auto references = std::count_if(parsed.lines.begin(), parsed.lines.end(),
        [](const MarkupLine& l) { return l.referenceLength.has_value(); });
    if (references > 1) {
        MARKUP_LOG_WARN("parseSnapshot: %d reference lines", static_cast<int>(references));
        return MarkupError::InvalidPayloadSize;
    }
    if (flag->size < flagSnapshotBytes) return MarkupError::BufferTruncated;
    parsed.hidden = readU32(flag->data, 0) != 0;

    out = std::move(parsed);
    return MarkupError::Ok;
}

} // namespace markup
