#include "doclayout/clipboard/clipboard.h"
#include "doclayout/section/key_allocator.h"
#include "doclayout/section/section_store.h"
#include "doclayout/core/logging.h"

Clipboard::Clipboard(SectionStore& store, const EngineConfig& config)
    : store_(store), config_(config) {}

EngineError Clipboard::copy(const std::vector<FieldRef>& fields) {
    if (fields.empty()) return EngineError::EmptySelection;

    std::vector<ClipboardEntry> resolved;
    resolved.reserve(fields.size());
    for (const auto& ref : fields) {
        const Geometry* g = store_.findField(ref);
        if (!g) continue;
        resolved.push_back(ClipboardEntry{doclayout::baseIdentity(ref.fieldId), *g});
    }
    if (resolved.empty()) return EngineError::EmptySelection;

    entries_ = std::move(resolved);
    return EngineError::Ok;
}

EngineError Clipboard::copyAllFromSection(const std::string& sectionId) {
    const Section* section = store_.findSection(sectionId);
    if (!section) return EngineError::SectionNotFound;
    if (section->fields.empty()) return EngineError::EmptySection;

    std::vector<ClipboardEntry> resolved;
    resolved.reserve(section->fields.size());
    for (const auto& f : section->fields) {
        resolved.push_back(ClipboardEntry{doclayout::baseIdentity(f.key), f.geometry});
    }
    entries_ = std::move(resolved);
    return EngineError::Ok;
}

EngineError Clipboard::paste(const std::optional<std::string>& targetSectionId, std::vector<std::string>& outKeys) {
    outKeys.clear();
    if (entries_.empty()) return EngineError::EmptyClipboard;
    if (!targetSectionId || targetSectionId->empty()) return EngineError::NoActiveSection;
    if (!store_.findSection(*targetSectionId)) return EngineError::SectionNotFound;

    outKeys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        Geometry g = entry.position;
        if (g.x == 0.0f) g.x = config_.defaultFieldX;

        // A zero y means "unplaced"; stack it like addField does.
        std::optional<float> explicitY;
        if (entry.position.y != 0.0f) explicitY = entry.position.y;

        std::string key;
        const EngineError err = store_.addField(*targetSectionId, entry.fieldKey, std::move(g), explicitY, key);
        if (err != EngineError::Ok) {
            DOCLAYOUT_LOG_WARN("paste: insert of %s failed (%s)", entry.fieldKey.c_str(), engineErrorName(err));
            return err;
        }
        outKeys.push_back(std::move(key));
    }
    return EngineError::Ok;
}
