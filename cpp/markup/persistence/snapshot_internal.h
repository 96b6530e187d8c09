#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace markup::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_LINE = fourCC('L', 'I', 'N', 'E');
constexpr std::uint32_t TAG_ANGL = fourCC('A', 'N', 'G', 'L');
constexpr std::uint32_t TAG_TEXT = fourCC('T', 'E', 'X', 'T');
constexpr std::uint32_t TAG_GRID = fourCC('G', 'R', 'I', 'D');
constexpr std::uint32_t TAG_FLAG = fourCC('F', 'L', 'A', 'G');

// Record flag bits
constexpr std::uint32_t FLAG_SHOW_ANGLE = 1u << 0;
constexpr std::uint32_t FLAG_MEASUREMENT = 1u << 1;
constexpr std::uint32_t FLAG_HAS_CREATED_AT = 1u << 2;
constexpr std::uint32_t FLAG_HAS_REFERENCE = 1u << 3;
constexpr std::uint32_t FLAG_HAS_BACKGROUND = 1u << 4;

// Fixed-size part of each record; variable-length strings follow.
constexpr std::size_t lineSnapshotBytes = 8 + 4 * 4 + 4 + 4 + 8 + 4 + 4 + 4;   // + name, unit
constexpr std::size_t angleSnapshotBytes = 8 + 6 * 4 + 4 + 4 + 4 + 8 + 4 + 4;  // + name
constexpr std::size_t textSnapshotBytes = 8 + 2 * 4 + 4 + 4 + 4 + 4 + 8 + 4 + 4; // + content, name
constexpr std::size_t gridSnapshotBytes = 7 * 4;
constexpr std::size_t flagSnapshotBytes = 4;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static std::uint32_t table[256];
    static bool tableReady = false;
    if (!tableReady) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        tableReady = true;
    }

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

} // namespace markup::snapshot::detail
