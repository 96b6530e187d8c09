#pragma once

#include <cstdint>
#include <cstring>
#include <cmath>
#include <algorithm>
#include <string_view>

namespace markup {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    auto cont = [&](std::size_t i) {
        return (static_cast<unsigned char>(content[pos + i]) & 0xC0) == 0x80;
    };
    auto bits = [&](std::size_t i) -> std::uint32_t {
        return static_cast<unsigned char>(content[pos + i]) & 0x3F;
    };

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n && cont(1)) {
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | bits(1);
    }
    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n && cont(1) && cont(2)) {
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | (bits(1) << 6) | bits(2);
    }
    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n && cont(1) && cont(2) && cont(3)) {
        byteLen = 4;
        return ((c0 & 0x07) << 18) | (bits(1) << 12) | (bits(2) << 6) | bits(3);
    }

    byteLen = 1;
    return 0xFFFD;
}

/**
 * Length of a UTF-8 string in UTF-16 code units, which is how the host
 * measures text content for width estimates.
 */
inline std::uint32_t utf16Length(std::string_view content) {
    std::uint32_t units = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        units += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return units;
}

inline bool isBlank(std::string_view content) {
    return std::all_of(content.begin(), content.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    if (std::isnan(v)) return hashU32(hashU32(h, 0x7ff80000u), 0u);
    if (v == 0.0) v = 0.0;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    h = hashU32(h, static_cast<std::uint32_t>(bits & 0xFFFFFFFFull));
    return hashU32(h, static_cast<std::uint32_t>(bits >> 32));
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace markup
