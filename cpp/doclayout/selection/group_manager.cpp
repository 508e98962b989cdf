#include "doclayout/selection/group_manager.h"
#include "doclayout/section/section_store.h"
#include "doclayout/core/logging.h"
#include <algorithm>
#include <unordered_set>

bool GroupManager::detach(const FieldRef& ref) {
    const auto idx = index_.find(ref);
    if (idx == index_.end()) return false;

    const GroupId gid = idx->second;
    index_.erase(idx);

    auto git = groups_.find(gid);
    if (git == groups_.end()) return true;
    auto& members = git->second.members;
    members.erase(std::remove(members.begin(), members.end(), ref), members.end());
    if (members.empty()) {
        groups_.erase(git);
    }
    return true;
}

EngineError GroupManager::group(const std::vector<FieldRef>& selection, GroupId& outId) {
    std::vector<FieldRef> members;
    members.reserve(selection.size());
    std::unordered_set<FieldRef, FieldRefHash> seen;
    for (const auto& ref : selection) {
        if (seen.insert(ref).second) members.push_back(ref);
    }
    if (members.size() < 2) return EngineError::InsufficientSelection;

    for (const auto& ref : members) {
        if (detach(ref)) {
            DOCLAYOUT_LOG_DEBUG("group: moving %s/%s out of its previous group", ref.sectionId.c_str(), ref.fieldId.c_str());
        }
    }

    const GroupId gid = nextGroupId_++;
    for (const auto& ref : members) {
        index_[ref] = gid;
    }
    groups_.emplace(gid, GroupRecord{gid, std::move(members)});
    outId = gid;
    return EngineError::Ok;
}

EngineError GroupManager::ungroup(const std::vector<FieldRef>& selection, std::size_t& outUngrouped) {
    outUngrouped = 0;
    if (selection.empty()) return EngineError::EmptySelection;

    const std::size_t removed = removeMembers(selection);
    if (removed == 0) return EngineError::NoGroupsAffected;
    outUngrouped = removed;
    return EngineError::Ok;
}

std::size_t GroupManager::removeMembers(const std::vector<FieldRef>& refs) {
    std::size_t removed = 0;
    for (const auto& ref : refs) {
        if (detach(ref)) removed++;
    }
    return removed;
}

bool GroupManager::prune(const SectionStore& store) {
    std::vector<FieldRef> stale;
    for (const auto& kv : index_) {
        if (!store.hasField(kv.first)) stale.push_back(kv.first);
    }
    return removeMembers(stale) > 0;
}

std::optional<GroupId> GroupManager::groupOf(const FieldRef& ref) const {
    const auto it = index_.find(ref);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

const GroupRecord* GroupManager::find(GroupId id) const {
    const auto it = groups_.find(id);
    if (it == groups_.end()) return nullptr;
    return &it->second;
}

std::vector<FieldRef> GroupManager::rigidBodyOf(const FieldRef& ref) const {
    const auto gid = groupOf(ref);
    if (!gid) return {};
    const GroupRecord* rec = find(*gid);
    if (!rec || rec->members.size() < 2) return {};
    return rec->members;
}

std::vector<GroupRecord> GroupManager::snapshot() const {
    std::vector<GroupRecord> out;
    out.reserve(groups_.size());
    for (const auto& kv : groups_) out.push_back(kv.second);
    return out;
}

void GroupManager::loadSnapshot(const std::vector<GroupRecord>& records, GroupId nextId) {
    clear();
    GroupId maxId = 0;
    for (const auto& rec : records) {
        if (groups_.find(rec.id) != groups_.end()) continue;
        GroupRecord kept{rec.id, {}};
        for (const auto& ref : rec.members) {
            // First group wins when a stale snapshot lists a field twice.
            if (index_.find(ref) != index_.end()) continue;
            index_[ref] = rec.id;
            kept.members.push_back(ref);
        }
        if (kept.members.empty()) continue;
        if (rec.id > maxId) maxId = rec.id;
        groups_[rec.id] = std::move(kept);
    }
    nextGroupId_ = std::max(nextId, maxId + 1);
}

void GroupManager::clear() noexcept {
    groups_.clear();
    index_.clear();
    nextGroupId_ = 1;
}
