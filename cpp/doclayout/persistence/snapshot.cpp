#include "doclayout/persistence/snapshot.h"
#include "doclayout/core/util.h"
#include "doclayout/core/types.h"
#include "doclayout/persistence/snapshot_internal.h"
#include "doclayout/protocol/wire_codec.h"
#include <algorithm>
#include <unordered_map>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace
namespace doclayout {
using namespace snapshot::detail;
using wire::PayloadReader;
using wire::readGeometry;
using wire::readRef;

EngineError parseSnapshot(const std::uint8_t* src, std::uint32_t byteCount, SnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytesTsnp) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicTsnp) return EngineError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionTsnp) return EngineError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t headerBytes = snapshotHeaderBytesTsnp;
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return EngineError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(headerBytes, tableBytes, headerPlusTable)) {
        return EngineError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return EngineError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return EngineError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return EngineError::InvalidPayloadSize;
        if (end > byteCount) return EngineError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        const std::uint32_t actualCrc = crc32(payload, size);
        if (actualCrc != expectedCrc) return EngineError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* meta = findSection(TAG_META);
    const SectionView* sect = findSection(TAG_SECT);
    const SectionView* pref = findSection(TAG_PREF);
    const SectionView* grps = findSection(TAG_GRPS);
    const SectionView* selc = findSection(TAG_SELC);
    if (!meta || !sect) {
        return EngineError::InvalidPayloadSize;
    }

    Template& tpl = out.tpl;
    tpl = Template{};

    // META
    {
        PayloadReader r{meta->data, meta->size, 0};
        std::uint32_t hasId = 0;
        std::uint32_t id = 0;
        if (!r.u32(hasId) || !r.u32(id)) return EngineError::BufferTruncated;
        if (hasId) tpl.id = id;
        if (!r.str(tpl.documentType) || !r.str(tpl.name) || !r.str(tpl.description)) {
            return EngineError::BufferTruncated;
        }
        if (!r.f32(tpl.pageWidth) || !r.f32(tpl.pageHeight)) return EngineError::BufferTruncated;
    }

    // SECT
    {
        PayloadReader r{sect->data, sect->size, 0};
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        // Each section needs at least two empty strings, a height and a count.
        if (!requireBytes(r.offset, static_cast<std::size_t>(count) * 16, r.size)) {
            return EngineError::BufferTruncated;
        }
        tpl.sections.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            Section s;
            std::uint32_t fieldCount = 0;
            if (!r.str(s.id) || !r.str(s.name) || !r.f32(s.heightInches) || !r.u32(fieldCount)) {
                return EngineError::BufferTruncated;
            }
            s.fields.reserve(std::min<std::uint32_t>(fieldCount, 1024));
            for (std::uint32_t f = 0; f < fieldCount; ++f) {
                FieldEntry entry;
                if (!r.str(entry.key)) return EngineError::BufferTruncated;
                if (!readGeometry(r, entry.geometry)) return EngineError::InvalidPayloadSize;
                if (s.hasField(entry.key)) return EngineError::InvalidPayloadSize;
                s.fields.push_back(std::move(entry));
            }
            tpl.sections.push_back(std::move(s));
        }
    }

    // PREF (optional)
    if (pref) {
        PayloadReader r{pref->data, pref->size, 0};
        std::uint32_t showGrid = 0;
        std::uint32_t snap = 0;
        std::uint32_t hasActive = 0;
        if (!r.f32(tpl.uiPreferences.zoom) || !r.u32(showGrid) || !r.u32(snap) || !r.u32(hasActive)) {
            return EngineError::BufferTruncated;
        }
        tpl.uiPreferences.showGrid = showGrid != 0;
        tpl.uiPreferences.snapToGrid = snap != 0;
        if (hasActive) {
            std::string active;
            if (!r.str(active)) return EngineError::BufferTruncated;
            tpl.uiPreferences.activeSectionId = std::move(active);
        }
    }

    // GRPS (optional)
    out.groups.clear();
    out.nextGroupId = 1;
    if (grps) {
        PayloadReader r{grps->data, grps->size, 0};
        std::uint32_t groupCount = 0;
        if (!r.u32(out.nextGroupId) || !r.u32(groupCount)) return EngineError::BufferTruncated;
        for (std::uint32_t i = 0; i < groupCount; ++i) {
            GroupSnapshot g{0, {}};
            std::uint32_t memberCount = 0;
            if (!r.u32(g.id) || !r.u32(memberCount)) return EngineError::BufferTruncated;
            for (std::uint32_t m = 0; m < memberCount; ++m) {
                FieldRef ref;
                if (!readRef(r, ref)) return EngineError::BufferTruncated;
                g.members.push_back(std::move(ref));
            }
            out.groups.push_back(std::move(g));
        }
    }

    // SELC (optional)
    out.selection.clear();
    if (selc) {
        PayloadReader r{selc->data, selc->size, 0};
        std::uint32_t count = 0;
        if (!r.u32(count)) return EngineError::BufferTruncated;
        for (std::uint32_t i = 0; i < count; ++i) {
            FieldRef ref;
            if (!readRef(r, ref)) return EngineError::BufferTruncated;
            out.selection.push_back(std::move(ref));
        }
    }

    return EngineError::Ok;
}

} // namespace doclayout
