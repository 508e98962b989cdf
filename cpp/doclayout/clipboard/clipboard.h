#pragma once

#include "doclayout/core/types.h"
#include <optional>
#include <string>
#include <vector>

class SectionStore; // Forward declaration

struct ClipboardEntry {
    std::string fieldKey; // base identity
    Geometry position;
};

// Section-independent snapshot of copied fields. Copy replaces the contents
// wholesale; paste never consumes them.
class Clipboard {
public:
    Clipboard(SectionStore& store, const EngineConfig& config);

    EngineError copy(const std::vector<FieldRef>& fields);
    EngineError copyAllFromSection(const std::string& sectionId);

    // Inserts every entry into the target section under fresh keys, in
    // clipboard order. `outKeys` receives the new keys.
    EngineError paste(const std::optional<std::string>& targetSectionId, std::vector<std::string>& outKeys);

    const std::vector<ClipboardEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }
    void load(std::vector<ClipboardEntry> entries) { entries_ = std::move(entries); }

private:
    SectionStore& store_;
    const EngineConfig& config_;
    std::vector<ClipboardEntry> entries_;
};
