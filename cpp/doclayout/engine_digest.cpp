// engine_digest.cpp - Document digest computation for TemplateEngine

#include "doclayout/engine.h"
#include "doclayout/internal/engine_state.h"
#include "doclayout/core/string_utils.h"

using doclayout::kDigestOffset;
using doclayout::hashU32;
using doclayout::hashF32;
using doclayout::hashString;

namespace {

std::uint64_t hashOptionalString(std::uint64_t h, const std::optional<std::string>& v) {
    h = hashU32(h, v ? 1u : 0u);
    return v ? hashString(h, *v) : h;
}

std::uint64_t hashGeometry(std::uint64_t h, const Geometry& g) {
    h = hashF32(h, g.x);
    h = hashF32(h, g.y);
    h = hashF32(h, g.width);
    h = hashF32(h, g.height);
    h = hashF32(h, g.fontSize);
    h = hashString(h, g.fontFamily);
    h = hashU32(h, static_cast<std::uint32_t>(g.alignment));
    h = hashOptionalString(h, g.format);
    h = hashU32(h, g.fieldType ? 1u + static_cast<std::uint32_t>(*g.fieldType) : 0u);
    h = hashU32(h, g.lineWidth ? 1u : 0u);
    if (g.lineWidth) h = hashF32(h, *g.lineWidth);
    h = hashOptionalString(h, g.lineColor);
    h = hashU32(h, g.lineStyle ? 1u + static_cast<std::uint32_t>(*g.lineStyle) : 0u);
    h = hashOptionalString(h, g.textContent);
    return h;
}

} // namespace

TemplateEngine::DocumentDigest TemplateEngine::getDocumentDigest() const noexcept {
    const EngineState& s = state();
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x544C5044u); // "DPLT" marker
    h = hashU32(h, kSnapshotVersion);

    h = hashString(h, s.documentType);
    h = hashString(h, s.name);
    h = hashString(h, s.description);

    const auto& sections = s.store.sections();
    h = hashU32(h, static_cast<std::uint32_t>(sections.size()));
    for (const auto& section : sections) {
        h = hashString(h, section.id);
        h = hashString(h, section.name);
        h = hashF32(h, section.heightInches);
        h = hashU32(h, static_cast<std::uint32_t>(section.fields.size()));
        for (const auto& f : section.fields) {
            h = hashString(h, f.key);
            h = hashGeometry(h, f.geometry);
        }
    }

    const auto groups = s.groups.snapshot();
    h = hashU32(h, static_cast<std::uint32_t>(groups.size()));
    for (const auto& g : groups) {
        h = hashU32(h, g.id);
        h = hashU32(h, static_cast<std::uint32_t>(g.members.size()));
        for (const auto& m : g.members) {
            h = hashString(h, m.sectionId);
            h = hashString(h, m.fieldId);
        }
    }

    return DocumentDigest{
        static_cast<std::uint32_t>(h & 0xFFFFFFFFu),
        static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFu)
    };
}
