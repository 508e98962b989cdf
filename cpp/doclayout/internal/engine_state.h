#pragma once

#include "doclayout/core/types.h"
#include "doclayout/section/section_store.h"
#include "doclayout/selection/selection_manager.h"
#include "doclayout/selection/group_manager.h"
#include "doclayout/clipboard/clipboard.h"
#include "doclayout/catalog/field_catalog.h"
#include "doclayout/protocol/protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class TemplateEngine;

struct EngineState {
    explicit EngineState(const EngineConfig& cfg);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    EngineConfig config;
    SectionStore store;
    SelectionManager selection;
    GroupManager groups;
    Clipboard clipboard;
    FieldCatalog catalog;

    // Template metadata; sections live in the store.
    std::optional<std::uint32_t> templateId;
    std::string documentType;
    std::string name{"New Template"};
    std::string description;
    UiPreferences uiPreferences;
    std::optional<std::string> activeSectionId;

    std::uint32_t generation{0};
    mutable std::vector<std::uint8_t> snapshotBytes;

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<EngineEvent> eventBuffer_{};

    std::unordered_map<FieldRef, std::uint32_t, FieldRefHash> pendingFieldChanges_{};
    std::unordered_set<FieldRef, FieldRefHash> pendingFieldCreates_{};
    std::unordered_set<FieldRef, FieldRefHash> pendingFieldDeletes_{};
    std::uint32_t pendingDocMask_{0};
    bool pendingSelectionChanged_{false};
    bool pendingGroupsChanged_{false};
    bool pendingClipboardChanged_{false};

    mutable EngineError lastError{EngineError::Ok};
};

inline EngineState::EngineState(const EngineConfig& cfg)
    : config(cfg),
      store(config),
      selection(store),
      groups(),
      clipboard(store, config) {
    eventQueue_.resize(kMaxEvents);
}
