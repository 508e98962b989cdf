#ifndef DOCLAYOUT_PERSISTENCE_SNAPSHOT_H
#define DOCLAYOUT_PERSISTENCE_SNAPSHOT_H

#include "doclayout/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace doclayout {

struct GroupSnapshot {
    std::uint32_t id;
    std::vector<FieldRef> members;
};

struct SnapshotData {
    Template tpl;
    std::vector<GroupSnapshot> groups;
    std::uint32_t nextGroupId{1};
    std::vector<FieldRef> selection;
    std::uint32_t version{0};
};

// Parse TSNP snapshot bytes into a SnapshotData structure.
// Returns EngineError::Ok on success; `out` is unspecified on failure.
EngineError parseSnapshot(const std::uint8_t* src, std::uint32_t byteCount, SnapshotData& out);

// Build bytes for a TSNP snapshot from SnapshotData.
std::vector<std::uint8_t> buildSnapshotBytes(const SnapshotData& data);

} // namespace doclayout

#endif // DOCLAYOUT_PERSISTENCE_SNAPSHOT_H
