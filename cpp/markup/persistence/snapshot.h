#ifndef MARKUP_PERSISTENCE_SNAPSHOT_H
#define MARKUP_PERSISTENCE_SNAPSHOT_H

#include "markup/core/types.h"
#include "markup/entity/markup_types.h"
#include <cstdint>
#include <vector>

namespace markup {

/**
 * Binary form of a MarkupSnap for a persistence collaborator.
 *
 * Layout: 16-byte header (magic "MSNP", version, section count, reserved)
 * followed by a section table of {tag, offset, size, crc32} and the section
 * payloads (LINE, ANGL, TEXT, GRID, FLAG). Little-endian throughout.
 */

// Parse MSNP bytes. `out` is only written on success.
MarkupError parseSnapshot(const std::uint8_t* src, std::uint32_t byteCount, MarkupSnap& out);

std::vector<std::uint8_t> buildSnapshotBytes(const MarkupSnap& snap);

// Order-sensitive FNV-1a digest of every persisted field.
struct SnapDigest {
    std::uint32_t lo;
    std::uint32_t hi;
};

SnapDigest computeSnapDigest(const MarkupSnap& snap);

inline bool operator==(const SnapDigest& a, const SnapDigest& b) { return a.lo == b.lo && a.hi == b.hi; }
inline bool operator!=(const SnapDigest& a, const SnapDigest& b) { return !(a == b); }

} // namespace markup

#endif // MARKUP_PERSISTENCE_SNAPSHOT_H
