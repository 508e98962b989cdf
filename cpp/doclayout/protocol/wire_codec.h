#ifndef DOCLAYOUT_PROTOCOL_WIRE_CODEC_H
#define DOCLAYOUT_PROTOCOL_WIRE_CODEC_H

#include "doclayout/core/types.h"
#include "doclayout/core/util.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Little-endian encoding of the records shared by snapshots and command
// payloads. Strings are u32 length + UTF-8 bytes.

namespace doclayout::wire {

// Presence bits for the optional Geometry members, in serialization order.
constexpr std::uint32_t kGeomHasFormat = 1u << 0;
constexpr std::uint32_t kGeomHasFieldType = 1u << 1;
constexpr std::uint32_t kGeomHasLineWidth = 1u << 2;
constexpr std::uint32_t kGeomHasLineColor = 1u << 3;
constexpr std::uint32_t kGeomHasLineStyle = 1u << 4;
constexpr std::uint32_t kGeomHasTextContent = 1u << 5;

// Presence bits for GeometryPatch members, in serialization order.
constexpr std::uint32_t kPatchX = 1u << 0;
constexpr std::uint32_t kPatchY = 1u << 1;
constexpr std::uint32_t kPatchWidth = 1u << 2;
constexpr std::uint32_t kPatchHeight = 1u << 3;
constexpr std::uint32_t kPatchFontSize = 1u << 4;
constexpr std::uint32_t kPatchFontFamily = 1u << 5;
constexpr std::uint32_t kPatchAlignment = 1u << 6;
constexpr std::uint32_t kPatchFormat = 1u << 7;
constexpr std::uint32_t kPatchFieldType = 1u << 8;
constexpr std::uint32_t kPatchLineWidth = 1u << 9;
constexpr std::uint32_t kPatchLineColor = 1u << 10;
constexpr std::uint32_t kPatchLineStyle = 1u << 11;
constexpr std::uint32_t kPatchTextContent = 1u << 12;

// Bounds-checked forward reader over one payload.
struct PayloadReader {
    const std::uint8_t* data{nullptr};
    std::size_t size{0};
    std::size_t offset{0};

    bool u32(std::uint32_t& out) {
        if (offset > size || size - offset < 4) return false;
        out = readU32(data, offset);
        offset += 4;
        return true;
    }

    bool f32(float& out) {
        if (offset > size || size - offset < 4) return false;
        out = readF32(data, offset);
        offset += 4;
        return true;
    }

    bool str(std::string& out) {
        return readString(data, size, offset, out);
    }

    bool done() const { return offset == size; }
};

inline bool decodeAlignment(std::uint32_t v, Alignment& out) {
    if (v > static_cast<std::uint32_t>(Alignment::Right)) return false;
    out = static_cast<Alignment>(v);
    return true;
}

inline bool decodeFieldType(std::uint32_t v, FieldType& out) {
    if (v > static_cast<std::uint32_t>(FieldType::Table)) return false;
    out = static_cast<FieldType>(v);
    return true;
}

inline bool decodeLineStyle(std::uint32_t v, LineStyle& out) {
    if (v > static_cast<std::uint32_t>(LineStyle::Dotted)) return false;
    out = static_cast<LineStyle>(v);
    return true;
}

inline void appendGeometry(std::vector<std::uint8_t>& out, const Geometry& g) {
    appendF32(out, g.x);
    appendF32(out, g.y);
    appendF32(out, g.width);
    appendF32(out, g.height);
    appendF32(out, g.fontSize);
    appendString(out, g.fontFamily);
    appendU32(out, static_cast<std::uint32_t>(g.alignment));

    std::uint32_t mask = 0;
    if (g.format) mask |= kGeomHasFormat;
    if (g.fieldType) mask |= kGeomHasFieldType;
    if (g.lineWidth) mask |= kGeomHasLineWidth;
    if (g.lineColor) mask |= kGeomHasLineColor;
    if (g.lineStyle) mask |= kGeomHasLineStyle;
    if (g.textContent) mask |= kGeomHasTextContent;
    appendU32(out, mask);

    if (g.format) appendString(out, *g.format);
    if (g.fieldType) appendU32(out, static_cast<std::uint32_t>(*g.fieldType));
    if (g.lineWidth) appendF32(out, *g.lineWidth);
    if (g.lineColor) appendString(out, *g.lineColor);
    if (g.lineStyle) appendU32(out, static_cast<std::uint32_t>(*g.lineStyle));
    if (g.textContent) appendString(out, *g.textContent);
}

inline bool readGeometry(PayloadReader& r, Geometry& g) {
    std::uint32_t alignment = 0;
    std::uint32_t mask = 0;
    if (!r.f32(g.x) || !r.f32(g.y) || !r.f32(g.width) || !r.f32(g.height) || !r.f32(g.fontSize)) return false;
    if (!r.str(g.fontFamily) || !r.u32(alignment) || !r.u32(mask)) return false;
    if (!decodeAlignment(alignment, g.alignment)) return false;

    if (mask & kGeomHasFormat) {
        std::string s;
        if (!r.str(s)) return false;
        g.format = std::move(s);
    }
    if (mask & kGeomHasFieldType) {
        std::uint32_t v = 0;
        FieldType t{};
        if (!r.u32(v) || !decodeFieldType(v, t)) return false;
        g.fieldType = t;
    }
    if (mask & kGeomHasLineWidth) {
        float v = 0.0f;
        if (!r.f32(v)) return false;
        g.lineWidth = v;
    }
    if (mask & kGeomHasLineColor) {
        std::string s;
        if (!r.str(s)) return false;
        g.lineColor = std::move(s);
    }
    if (mask & kGeomHasLineStyle) {
        std::uint32_t v = 0;
        LineStyle st{};
        if (!r.u32(v) || !decodeLineStyle(v, st)) return false;
        g.lineStyle = st;
    }
    if (mask & kGeomHasTextContent) {
        std::string s;
        if (!r.str(s)) return false;
        g.textContent = std::move(s);
    }
    return true;
}

inline void appendPatch(std::vector<std::uint8_t>& out, const GeometryPatch& p) {
    std::uint32_t mask = 0;
    if (p.x) mask |= kPatchX;
    if (p.y) mask |= kPatchY;
    if (p.width) mask |= kPatchWidth;
    if (p.height) mask |= kPatchHeight;
    if (p.fontSize) mask |= kPatchFontSize;
    if (p.fontFamily) mask |= kPatchFontFamily;
    if (p.alignment) mask |= kPatchAlignment;
    if (p.format) mask |= kPatchFormat;
    if (p.fieldType) mask |= kPatchFieldType;
    if (p.lineWidth) mask |= kPatchLineWidth;
    if (p.lineColor) mask |= kPatchLineColor;
    if (p.lineStyle) mask |= kPatchLineStyle;
    if (p.textContent) mask |= kPatchTextContent;
    appendU32(out, mask);

    if (p.x) appendF32(out, *p.x);
    if (p.y) appendF32(out, *p.y);
    if (p.width) appendF32(out, *p.width);
    if (p.height) appendF32(out, *p.height);
    if (p.fontSize) appendF32(out, *p.fontSize);
    if (p.fontFamily) appendString(out, *p.fontFamily);
    if (p.alignment) appendU32(out, static_cast<std::uint32_t>(*p.alignment));
    if (p.format) appendString(out, *p.format);
    if (p.fieldType) appendU32(out, static_cast<std::uint32_t>(*p.fieldType));
    if (p.lineWidth) appendF32(out, *p.lineWidth);
    if (p.lineColor) appendString(out, *p.lineColor);
    if (p.lineStyle) appendU32(out, static_cast<std::uint32_t>(*p.lineStyle));
    if (p.textContent) appendString(out, *p.textContent);
}

inline bool readPatch(PayloadReader& r, GeometryPatch& p) {
    std::uint32_t mask = 0;
    if (!r.u32(mask)) return false;

    auto readF = [&](std::uint32_t bit, std::optional<float>& dst) {
        if (!(mask & bit)) return true;
        float v = 0.0f;
        if (!r.f32(v)) return false;
        dst = v;
        return true;
    };
    auto readS = [&](std::uint32_t bit, std::optional<std::string>& dst) {
        if (!(mask & bit)) return true;
        std::string v;
        if (!r.str(v)) return false;
        dst = std::move(v);
        return true;
    };

    if (!readF(kPatchX, p.x) || !readF(kPatchY, p.y)) return false;
    if (!readF(kPatchWidth, p.width) || !readF(kPatchHeight, p.height)) return false;
    if (!readF(kPatchFontSize, p.fontSize) || !readS(kPatchFontFamily, p.fontFamily)) return false;
    if (mask & kPatchAlignment) {
        std::uint32_t v = 0;
        Alignment a{};
        if (!r.u32(v) || !decodeAlignment(v, a)) return false;
        p.alignment = a;
    }
    if (!readS(kPatchFormat, p.format)) return false;
    if (mask & kPatchFieldType) {
        std::uint32_t v = 0;
        FieldType t{};
        if (!r.u32(v) || !decodeFieldType(v, t)) return false;
        p.fieldType = t;
    }
    if (!readF(kPatchLineWidth, p.lineWidth) || !readS(kPatchLineColor, p.lineColor)) return false;
    if (mask & kPatchLineStyle) {
        std::uint32_t v = 0;
        LineStyle st{};
        if (!r.u32(v) || !decodeLineStyle(v, st)) return false;
        p.lineStyle = st;
    }
    return readS(kPatchTextContent, p.textContent);
}

inline void appendRef(std::vector<std::uint8_t>& out, const FieldRef& ref) {
    appendString(out, ref.fieldId);
    appendString(out, ref.sectionId);
}

inline bool readRef(PayloadReader& r, FieldRef& ref) {
    return r.str(ref.fieldId) && r.str(ref.sectionId);
}

} // namespace doclayout::wire

#endif // DOCLAYOUT_PROTOCOL_WIRE_CODEC_H
