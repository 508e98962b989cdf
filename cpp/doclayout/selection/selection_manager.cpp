#include "doclayout/selection/selection_manager.h"
#include "doclayout/section/section_store.h"
#include <algorithm>

SelectionManager::SelectionManager(const SectionStore& store)
    : store_(store) {}

void SelectionManager::insert(const FieldRef& ref) {
    if (set_.insert(ref).second) {
        ordered_.push_back(ref);
    }
}

void SelectionManager::erase(const FieldRef& ref) {
    if (set_.erase(ref) == 0) return;
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), ref), ordered_.end());
}

bool SelectionManager::select(const std::optional<std::string>& fieldId, const std::string& sectionId, bool multi) {
    if (!fieldId) {
        return clear();
    }

    const FieldRef ref{*fieldId, sectionId};
    if (!store_.hasField(ref)) return false;

    if (!multi) {
        if (set_.size() == 1 && isSelected(ref)) return false;
        set_.clear();
        ordered_.clear();
        insert(ref);
        generation_++;
        return true;
    }

    if (isSelected(ref)) {
        erase(ref);
    } else {
        insert(ref);
    }
    generation_++;
    return true;
}

bool SelectionManager::setSelection(const std::vector<FieldRef>& refs) {
    std::vector<FieldRef> previous = ordered_;
    set_.clear();
    ordered_.clear();
    for (const auto& ref : refs) {
        if (store_.hasField(ref)) insert(ref);
    }
    if (previous == ordered_) return false;
    generation_++;
    return true;
}

bool SelectionManager::clear() noexcept {
    if (set_.empty()) return false;
    set_.clear();
    ordered_.clear();
    generation_++;
    return true;
}

void SelectionManager::reset() noexcept {
    set_.clear();
    ordered_.clear();
    generation_ = 0;
}

bool SelectionManager::prune() {
    bool changed = false;
    for (auto it = set_.begin(); it != set_.end();) {
        if (!store_.hasField(*it)) {
            it = set_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }

    if (changed) {
        ordered_.erase(
            std::remove_if(ordered_.begin(), ordered_.end(), [&](const FieldRef& ref) {
                return set_.find(ref) == set_.end();
            }),
            ordered_.end());
        generation_++;
    }
    return changed;
}
