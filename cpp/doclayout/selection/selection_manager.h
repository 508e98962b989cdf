#pragma once

#include "doclayout/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

class SectionStore; // Forward declaration

class SelectionManager {
public:
    explicit SelectionManager(const SectionStore& store);

    // Canvas-click semantics: no field clears, plain click replaces,
    // multi toggles. Returns true when the selection changed.
    bool select(const std::optional<std::string>& fieldId, const std::string& sectionId, bool multi);
    bool setSelection(const std::vector<FieldRef>& refs);
    bool clear() noexcept;

    const std::vector<FieldRef>& getOrdered() const { return ordered_; }
    std::uint32_t getGeneration() const { return generation_; }
    bool isEmpty() const { return set_.empty(); }
    std::size_t size() const { return set_.size(); }
    bool isSelected(const FieldRef& ref) const { return set_.find(ref) != set_.end(); }

    // Drops every entry whose field no longer exists in its section.
    bool prune();

    void reset() noexcept; // Clears and restarts the generation counter

private:
    void insert(const FieldRef& ref);
    void erase(const FieldRef& ref);

    const SectionStore& store_;
    std::unordered_set<FieldRef, FieldRefHash> set_;
    std::vector<FieldRef> ordered_;
    std::uint32_t generation_ = 0;
};
