#ifndef MARKUP_CORE_UTIL_H
#define MARKUP_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    double v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

#endif // MARKUP_CORE_UTIL_H
