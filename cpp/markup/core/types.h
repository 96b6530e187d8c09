#ifndef MARKUP_CORE_TYPES_H
#define MARKUP_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared across the markup engine.

namespace markup {

// Snapshot format constants
static constexpr std::uint32_t snapshotMagicMsnp = 0x504E534D; // "MSNP"
static constexpr std::uint32_t snapshotVersionMsnp = 1;
static constexpr std::size_t snapshotHeaderBytesMsnp = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32

struct Point2 { float x; float y; };

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

enum class MarkupError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    StaleReference = 5,
    InvalidInput = 6,
    EmptyContent = 7,
    DegenerateGeometry = 8,
};

inline const char* markupErrorName(MarkupError e) {
    switch (e) {
        case MarkupError::Ok: return "Ok";
        case MarkupError::InvalidMagic: return "InvalidMagic";
        case MarkupError::UnsupportedVersion: return "UnsupportedVersion";
        case MarkupError::BufferTruncated: return "BufferTruncated";
        case MarkupError::InvalidPayloadSize: return "InvalidPayloadSize";
        case MarkupError::StaleReference: return "StaleReference";
        case MarkupError::InvalidInput: return "InvalidInput";
        case MarkupError::EmptyContent: return "EmptyContent";
        case MarkupError::DegenerateGeometry: return "DegenerateGeometry";
    }
    return "Unknown";
}

enum class EntityKind : std::uint8_t {
    Line = 1,
    Angle = 2,
    Text = 3,
};

struct EntityRef {
    EntityKind kind;
    std::uint32_t id;
};

inline bool operator==(const EntityRef& a, const EntityRef& b) { return a.kind == b.kind && a.id == b.id; }
inline bool operator!=(const EntityRef& a, const EntityRef& b) { return !(a == b); }

} // namespace markup

#endif // MARKUP_CORE_TYPES_H
