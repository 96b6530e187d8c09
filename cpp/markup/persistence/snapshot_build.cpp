#include "markup/persistence/snapshot.h"
#include "markup/core/util.h"
#include "markup/persistence/snapshot_internal.h"
#include <cstring>
#include <string>

namespace markup {
using namespace snapshot::detail;

namespace {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(out) {}

    void u32(std::uint32_t v) {
        const std::size_t o = grow(4);
        writeU32LE(out_.data(), o, v);
    }
    void f32(float v) {
        const std::size_t o = grow(4);
        writeF32LE(out_.data(), o, v);
    }
    void f64(double v) {
        const std::size_t o = grow(8);
        writeF64LE(out_.data(), o, v);
    }
    void str(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        const std::size_t o = grow(s.size());
        if (!s.empty()) std::memcpy(out_.data() + o, s.data(), s.size());
    }
    void point(const Point2& p) {
        f32(p.x);
        f32(p.y);
    }
    void duration(const DisplayDuration& d) {
        u32(static_cast<std::uint32_t>(d.mode));
        f32(d.seconds);
    }

private:
    std::size_t grow(std::size_t n) {
        const std::size_t o = out_.size();
        out_.resize(o + n);
        return o;
    }

    std::vector<std::uint8_t>& out_;
};

} // namespace

std::vector<std::uint8_t> buildSnapshotBytes(const MarkupSnap& snap) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(5);

    // LINE
    {
        SectionBytes sec{TAG_LINE, {}};
        ByteWriter w(sec.bytes);
        w.u32(static_cast<std::uint32_t>(snap.lines.size()));
        for (const MarkupLine& l : snap.lines) {
            std::uint32_t flags = 0;
            if (l.showAngle) flags |= FLAG_SHOW_ANGLE;
            if (l.isMeasurement) flags |= FLAG_MEASUREMENT;
            if (l.createdAt) flags |= FLAG_HAS_CREATED_AT;
            if (l.referenceLength) flags |= FLAG_HAS_REFERENCE;
            w.u32(l.id);
            w.u32(flags);
            w.point(l.p1);
            w.point(l.p2);
            w.u32(l.color);
            w.f32(l.width);
            w.f64(l.createdAt.value_or(0.0));
            w.duration(l.displayDuration);
            w.f32(l.referenceLength.value_or(0.0f));
            w.str(l.name);
            w.str(l.unit);
        }
        sections.push_back(std::move(sec));
    }

    // ANGL
    {
        SectionBytes sec{TAG_ANGL, {}};
        ByteWriter w(sec.bytes);
        w.u32(static_cast<std::uint32_t>(snap.angles.size()));
        for (const MarkupAngle& a : snap.angles) {
            w.u32(a.id);
            w.u32(a.createdAt ? FLAG_HAS_CREATED_AT : 0u);
            w.point(a.p1);
            w.point(a.vertex);
            w.point(a.p2);
            w.u32(a.color);
            w.f32(a.width);
            w.f32(a.angleDeg);
            w.f64(a.createdAt.value_or(0.0));
            w.duration(a.displayDuration);
            w.str(a.name);
        }
        sections.push_back(std::move(sec));
    }

    // TEXT
    {
        SectionBytes sec{TAG_TEXT, {}};
        ByteWriter w(sec.bytes);
        w.u32(static_cast<std::uint32_t>(snap.texts.size()));
        for (const MarkupText& t : snap.texts) {
            std::uint32_t flags = 0;
            if (t.createdAt) flags |= FLAG_HAS_CREATED_AT;
            if (t.backgroundColor) flags |= FLAG_HAS_BACKGROUND;
            w.u32(t.id);
            w.u32(flags);
            w.point(t.pos);
            w.f32(t.size);
            w.u32(t.color);
            w.u32(t.backgroundColor.value_or(0u));
            w.f32(t.boxWidth);
            w.f64(t.createdAt.value_or(0.0));
            w.duration(t.displayDuration);
            w.str(t.content);
            w.str(t.name);
        }
        sections.push_back(std::move(sec));
    }

    // GRID
    {
        SectionBytes sec{TAG_GRID, {}};
        ByteWriter w(sec.bytes);
        w.u32(snap.grid.show ? 1u : 0u);
        w.u32(static_cast<std::uint32_t>(snap.grid.mode));
        w.f32(snap.grid.spacingPx);
        w.u32(snap.grid.color);
        w.f32(snap.grid.opacity);
        w.f32(snap.grid.originX);
        w.f32(snap.grid.originY);
        sections.push_back(std::move(sec));
    }

    // FLAG
    {
        SectionBytes sec{TAG_FLAG, {}};
        ByteWriter w(sec.bytes);
        w.u32(snap.hidden ? 1u : 0u);
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = snapshotHeaderBytesMsnp;
    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t total = headerBytes + tableBytes;
    for (const auto& sec : sections) total += sec.bytes.size();

    std::vector<std::uint8_t> out(total, 0);
    writeU32LE(out.data(), 0, snapshotMagicMsnp);
    writeU32LE(out.data(), 4, snapshotVersionMsnp);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t offset = headerBytes + tableBytes;
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const auto& sec = sections[i];
        const std::size_t entry = headerBytes + i * snapshotSectionEntryBytes;
        writeU32LE(out.data(), entry + 0, sec.tag);
        writeU32LE(out.data(), entry + 4, static_cast<std::uint32_t>(offset));
        writeU32LE(out.data(), entry + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), entry + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + offset, sec.bytes.data(), sec.bytes.size());
        }
        offset += sec.bytes.size();
    }
    return out;
}

} // namespace markup
