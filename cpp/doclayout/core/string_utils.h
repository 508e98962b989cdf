#pragma once

#include <cstdint>
#include <cstring>
#include <cmath>
#include <string>
#include <string_view>

namespace doclayout {

// =============================================================================
// Decimal Parsing
// =============================================================================

inline bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * Parse an unsigned decimal run. Saturates instead of overflowing so that a
 * pathological counter still orders after every smaller one.
 */
inline std::uint64_t parseDecimalSaturating(std::string_view digits) {
    constexpr std::uint64_t kMax = ~static_cast<std::uint64_t>(0);
    std::uint64_t v = 0;
    for (const char c : digits) {
        if (!isAsciiDigit(c)) break;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (kMax - d) / 10) return kMax;
        v = v * 10 + d;
    }
    return v;
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

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
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

} // namespace doclayout
