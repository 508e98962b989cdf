#ifndef DOCLAYOUT_CORE_UTIL_H
#define DOCLAYOUT_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

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

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void appendU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    const std::size_t o = out.size();
    out.resize(o + 4);
    writeU32LE(out.data(), o, v);
}

static inline void appendF32(std::vector<std::uint8_t>& out, float v) {
    const std::size_t o = out.size();
    out.resize(o + 4);
    writeF32LE(out.data(), o, v);
}

// Length-prefixed (u32) UTF-8 string.
static inline void appendString(std::vector<std::uint8_t>& out, const std::string& s) {
    appendU32(out, static_cast<std::uint32_t>(s.size()));
    const std::size_t o = out.size();
    out.resize(o + s.size());
    if (!s.empty()) {
        std::memcpy(out.data() + o, s.data(), s.size());
    }
}

// Reads a length-prefixed string at `offset`, advancing it. Returns false when
// the buffer is too short.
static inline bool readString(const std::uint8_t* src, std::size_t size, std::size_t& offset, std::string& out) {
    if (offset + 4 > size) return false;
    const std::uint32_t len = readU32(src, offset);
    if (static_cast<std::size_t>(len) > size - offset - 4) return false;
    offset += 4;
    out.assign(reinterpret_cast<const char*>(src + offset), len);
    offset += len;
    return true;
}

#endif // DOCLAYOUT_CORE_UTIL_H
