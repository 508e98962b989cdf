#include "doclayout/persistence/snapshot.h"
#include "doclayout/core/util.h"
#include "doclayout/core/types.h"
#include "doclayout/persistence/snapshot_internal.h"
#include "doclayout/protocol/wire_codec.h"
#include <cstring>

namespace doclayout {
using namespace snapshot::detail;
using wire::appendGeometry;
using wire::appendRef;

std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data) {
    const std::uint32_t version = snapshotVersionTsnp;
    const Template& tpl = data.tpl;

    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(5);

    // META
    {
        SectionBytes sec{TAG_META, {}};
        auto& out = sec.bytes;
        appendU32(out, tpl.id ? 1u : 0u);
        appendU32(out, tpl.id.value_or(0));
        appendString(out, tpl.documentType);
        appendString(out, tpl.name);
        appendString(out, tpl.description);
        appendF32(out, tpl.pageWidth);
        appendF32(out, tpl.pageHeight);
        sections.push_back(std::move(sec));
    }

    // SECT
    {
        SectionBytes sec{TAG_SECT, {}};
        auto& out = sec.bytes;
        appendU32(out, static_cast<std::uint32_t>(tpl.sections.size()));
        for (const auto& s : tpl.sections) {
            appendString(out, s.id);
            appendString(out, s.name);
            appendF32(out, s.heightInches);
            appendU32(out, static_cast<std::uint32_t>(s.fields.size()));
            for (const auto& f : s.fields) {
                appendString(out, f.key);
                appendGeometry(out, f.geometry);
            }
        }
        sections.push_back(std::move(sec));
    }

    // PREF
    {
        SectionBytes sec{TAG_PREF, {}};
        auto& out = sec.bytes;
        const UiPreferences& prefs = tpl.uiPreferences;
        appendF32(out, prefs.zoom);
        appendU32(out, prefs.showGrid ? 1u : 0u);
        appendU32(out, prefs.snapToGrid ? 1u : 0u);
        appendU32(out, prefs.activeSectionId ? 1u : 0u);
        if (prefs.activeSectionId) appendString(out, *prefs.activeSectionId);
        sections.push_back(std::move(sec));
    }

    // GRPS
    {
        SectionBytes sec{TAG_GRPS, {}};
        auto& out = sec.bytes;
        appendU32(out, data.nextGroupId);
        appendU32(out, static_cast<std::uint32_t>(data.groups.size()));
        for (const auto& g : data.groups) {
            appendU32(out, g.id);
            appendU32(out, static_cast<std::uint32_t>(g.members.size()));
            for (const auto& ref : g.members) appendRef(out, ref);
        }
        sections.push_back(std::move(sec));
    }

    // SELC
    {
        SectionBytes sec{TAG_SELC, {}};
        auto& out = sec.bytes;
        appendU32(out, static_cast<std::uint32_t>(data.selection.size()));
        for (const auto& ref : data.selection) appendRef(out, ref);
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = snapshotHeaderBytesTsnp;
    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();
    const std::size_t totalBytes = headerBytes + tableBytes + payloadBytes;

    std::vector<std::uint8_t> out;
    out.resize(totalBytes);

    writeU32LE(out.data(), 0, snapshotMagicTsnp);
    writeU32LE(out.data(), 4, version);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = headerBytes;
    std::size_t dataOffset = headerBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        }
        tableOffset += snapshotSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }

    return out;
}

} // namespace doclayout
