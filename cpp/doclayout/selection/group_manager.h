#pragma once

#include "doclayout/core/types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

class SectionStore; // Forward declaration

using GroupId = std::uint32_t;

struct GroupRecord {
    GroupId id;
    std::vector<FieldRef> members;
};

// Rigid-body groups with a field -> group index. A field belongs to at most
// one group; grouping a field that is already grouped moves it.
class GroupManager {
public:
    GroupManager() = default;

    // Fails with InsufficientSelection for fewer than two members.
    EngineError group(const std::vector<FieldRef>& selection, GroupId& outId);

    // Removes the selected members from every group they belong to. Groups
    // left empty are deleted; partially matched groups keep the remainder.
    EngineError ungroup(const std::vector<FieldRef>& selection, std::size_t& outUngrouped);

    // Same pruning rule as ungroup, for fields that were deleted.
    std::size_t removeMembers(const std::vector<FieldRef>& refs);

    // Drops members whose field no longer exists. Returns true on change.
    bool prune(const SectionStore& store);

    std::optional<GroupId> groupOf(const FieldRef& ref) const;
    const GroupRecord* find(GroupId id) const;

    // Members of the group containing `ref` when that group can move as a
    // rigid body (two or more members); empty otherwise.
    std::vector<FieldRef> rigidBodyOf(const FieldRef& ref) const;

    std::size_t groupCount() const { return groups_.size(); }
    GroupId nextGroupId() const { return nextGroupId_; }

    std::vector<GroupRecord> snapshot() const;
    void loadSnapshot(const std::vector<GroupRecord>& records, GroupId nextId);
    void clear() noexcept;

private:
    bool detach(const FieldRef& ref);

    std::map<GroupId, GroupRecord> groups_;
    std::unordered_map<FieldRef, GroupId, FieldRefHash> index_;
    GroupId nextGroupId_{1};
};
