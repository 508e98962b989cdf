#pragma once

#include "doclayout/core/types.h"
#include "doclayout/protocol/protocol_types.h"
#include "doclayout/selection/group_manager.h"
#include "doclayout/clipboard/clipboard.h"
#include "doclayout/layout/layout_compiler.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct EngineState;
class FieldCatalog;

// Properties-panel view of the first selected field.
struct SelectedFieldDetails {
    FieldRef ref;
    std::string baseIdentity;
    std::string label;
    Geometry geometry;
    std::optional<GroupId> groupId;
};

// Editing state engine for one multi-section template. Every command runs to
// completion, reports rejection through its EngineError return (mirrored in
// getLastError()), and leaves state untouched when it fails.
class TemplateEngine {
    friend class TemplateEngineTestAccessor;
public:
    using CommandOp = ::CommandOp;
    using EventType = ::EventType;
    using ChangeMask = ::ChangeMask;
    using EngineEvent = ::EngineEvent;
    using EventBufferMeta = ::EventBufferMeta;

    static constexpr std::uint32_t kCommandVersion = commandVersionDlcb;
    static constexpr std::uint32_t kSnapshotVersion = snapshotVersionTsnp;

    TemplateEngine();
    explicit TemplateEngine(const EngineConfig& config);
    ~TemplateEngine();

    TemplateEngine(const TemplateEngine&) = delete;
    TemplateEngine& operator=(const TemplateEngine&) = delete;

    // Drops the document, selection, groups, clipboard and pending events.
    void clear() noexcept;

    // ---------------------------------------------------------------------
    // Document
    // ---------------------------------------------------------------------

    // Seeds the whole document from `tpl`. Selection, groups and clipboard
    // are reset; the active section follows uiPreferences when it still
    // names a section, else the first section.
    void loadTemplate(const Template& tpl);

    // Value copy of the current document.
    Template toTemplate() const;

    // Replaces sections with a server-confirmed list, keeping selection and
    // groups that still resolve.
    void replaceSections(std::vector<Section> sections);

    const std::vector<Section>& getSections() const;
    const Geometry* getField(const FieldRef& ref) const;
    const EngineConfig& getConfig() const;
    const FieldCatalog& getCatalog() const;
    FieldCatalog& getCatalog();

    std::optional<std::uint32_t> getTemplateId() const;
    void setTemplateId(std::uint32_t id);
    const std::string& getDocumentType() const;
    const std::string& getName() const;
    void setName(const std::string& name);
    const std::string& getDescription() const;
    void setDescription(const std::string& description);
    const UiPreferences& getUiPreferences() const;
    void setUiPreferences(const UiPreferences& prefs);

    // Active section, falling back to the first section. Empty when the
    // document has no sections.
    std::optional<std::string> getActiveSectionId() const;
    EngineError setActiveSection(const std::string& sectionId);

    // ---------------------------------------------------------------------
    // Command surface
    // ---------------------------------------------------------------------

    // Adds to the active section and makes the new field the sole selection.
    EngineError addField(const std::string& baseKey, const Geometry& geometry, std::string* outKey = nullptr);
    EngineError addFieldToSection(
        const std::string& sectionId,
        const std::string& baseKey,
        const Geometry& geometry,
        std::optional<float> explicitY,
        std::string* outKey = nullptr);
    // Catalog lookup for the document type, then addField.
    EngineError addCatalogField(const std::string& baseIdentity, std::string* outKey = nullptr);

    // Moves a field to (x, y). A field in a group of two or more carries the
    // whole group along by the same delta, across sections.
    EngineError moveField(const std::string& fieldId, const std::string& sectionId, float x, float y);
    EngineError resizeField(
        const std::string& fieldId,
        const std::string& sectionId,
        float width,
        float height,
        std::optional<float> x = std::nullopt,
        std::optional<float> y = std::nullopt);

    // With no section, the first section holding the key is used.
    EngineError deleteField(const std::string& fieldId, const std::optional<std::string>& sectionId = std::nullopt);
    EngineError deleteFields(const std::vector<FieldRef>& refs);
    EngineError deleteSelection();

    // No field id clears the selection.
    EngineError select(const std::optional<std::string>& fieldId, const std::string& sectionId, bool multi);
    EngineError setSelection(const std::vector<FieldRef>& refs);

    EngineError groupSelection(GroupId* outId = nullptr);
    EngineError ungroupSelection(std::size_t* outUngrouped = nullptr);

    EngineError copySelection();
    EngineError copyAllFromSection(const std::string& sectionId);
    EngineError paste(std::vector<std::string>* outKeys = nullptr);
    EngineError pasteInto(const std::optional<std::string>& sectionId, std::vector<std::string>* outKeys = nullptr);

    EngineError clearSection(const std::string& sectionId);
    // Empties every section and the clipboard.
    EngineError clearAllSections();

    EngineError updateSelectedFields(const GeometryPatch& patch);

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    const std::vector<FieldRef>& getSelection() const;
    std::uint32_t getSelectionGeneration() const;
    bool isSelected(const std::string& fieldId, const std::string& sectionId) const;
    std::optional<SelectedFieldDetails> selectedFieldDetails() const;

    std::optional<GroupId> groupOf(const std::string& fieldId, const std::string& sectionId) const;
    bool isFieldInGroup(const std::string& fieldId, const std::string& sectionId) const;
    std::vector<GroupRecord> getGroups() const;

    const std::vector<ClipboardEntry>& getClipboard() const;

    CompiledLayout compile() const;

    // ---------------------------------------------------------------------
    // Binary protocol
    // ---------------------------------------------------------------------

    EngineError applyCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount);

    std::vector<std::uint8_t> saveSnapshot() const;

    struct ByteBufferMeta {
        std::uint32_t generation;
        std::uint32_t byteCount;
        std::uintptr_t ptr;
    };
    // Builds the snapshot into an engine-owned buffer; valid until the next call.
    ByteBufferMeta getSnapshotBufferMeta() const;
    EngineError loadSnapshot(const std::uint8_t* src, std::uint32_t byteCount);

    struct DocumentDigest {
        std::uint32_t lo;
        std::uint32_t hi;
    };
    DocumentDigest getDocumentDigest() const noexcept;

    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    std::uint32_t getGeneration() const noexcept;
    EngineError getLastError() const noexcept;

#ifdef EMSCRIPTEN
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);
    void applyCommandBufferPtr(std::uintptr_t ptr, std::uint32_t byteCount);
    void loadSnapshotFromPtr(std::uintptr_t ptr, std::uint32_t byteCount);
#endif

private:
    EngineState& state();
    const EngineState& state() const;

    void clearError() const;
    EngineError setError(EngineError err) const;
    EngineError reject(EngineError err, const char* op) const;

    // Post-mutation validation pass: prunes selection and groups of
    // references to fields that no longer exist.
    void validateAfterMutation();
    void commitMutation();

    // Events (impl/engine_event.cpp)
    void clearEventState();
    void recordDocChanged(std::uint32_t mask);
    void recordFieldChanged(const FieldRef& ref, std::uint32_t mask);
    void recordFieldCreated(const FieldRef& ref);
    void recordFieldDeleted(const FieldRef& ref);
    void recordSelectionChanged();
    void recordGroupsChanged();
    void recordClipboardChanged();
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();

    std::unique_ptr<EngineState> state_;
};
