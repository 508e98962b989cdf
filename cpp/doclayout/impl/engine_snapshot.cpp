// TemplateEngine snapshot save/load

#include "doclayout/engine.h"
#include "doclayout/internal/engine_state.h"
#include "doclayout/persistence/snapshot.h"
#include "doclayout/core/logging.h"

std::vector<std::uint8_t> TemplateEngine::saveSnapshot() const {
    const EngineState& s = state();

    doclayout::SnapshotData data;
    data.tpl = toTemplate();
    for (const auto& rec : s.groups.snapshot()) {
        data.groups.push_back(doclayout::GroupSnapshot{rec.id, rec.members});
    }
    data.nextGroupId = s.groups.nextGroupId();
    data.selection = s.selection.getOrdered();
    data.version = snapshotVersionTsnp;

    s.snapshotBytes = doclayout::buildSnapshotBytes(data);
    return s.snapshotBytes;
}

TemplateEngine::ByteBufferMeta TemplateEngine::getSnapshotBufferMeta() const {
    saveSnapshot();
    const EngineState& s = state();
    return ByteBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.snapshotBytes.size()),
        reinterpret_cast<std::uintptr_t>(s.snapshotBytes.data()),
    };
}

EngineError TemplateEngine::loadSnapshot(const std::uint8_t* src, std::uint32_t byteCount) {
    clearError();
    doclayout::SnapshotData data;
    const EngineError err = doclayout::parseSnapshot(src, byteCount, data);
    if (err != EngineError::Ok) return reject(err, "loadSnapshot");

    loadTemplate(data.tpl);

    EngineState& s = state();
    std::vector<GroupRecord> records;
    records.reserve(data.groups.size());
    for (auto& g : data.groups) {
        records.push_back(GroupRecord{g.id, std::move(g.members)});
    }
    s.groups.loadSnapshot(records, data.nextGroupId);
    s.groups.prune(s.store);
    s.selection.setSelection(data.selection);

    DOCLAYOUT_LOG_DEBUG("loadSnapshot: %zu groups, %zu selected", s.groups.groupCount(), s.selection.size());
    recordGroupsChanged();
    recordSelectionChanged();
    flushPendingEvents();
    return EngineError::Ok;
}
