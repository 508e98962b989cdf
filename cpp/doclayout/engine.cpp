#include "doclayout/engine.h"
#include "doclayout/internal/engine_state.h"
#include "doclayout/command/commands.h"
#include "doclayout/command/command_dispatch.h"
#include "doclayout/section/key_allocator.h"
#include "doclayout/core/logging.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace {

constexpr std::uint32_t kCreateMask =
    static_cast<std::uint32_t>(ChangeMask::Geometry)
    | static_cast<std::uint32_t>(ChangeMask::Style)
    | static_cast<std::uint32_t>(ChangeMask::Structure);

std::uint32_t patchMask(const GeometryPatch& patch) {
    std::uint32_t mask = 0;
    if (patch.x || patch.y || patch.width || patch.height) {
        mask |= static_cast<std::uint32_t>(ChangeMask::Geometry);
    }
    if (patch.fontSize || patch.fontFamily || patch.alignment || patch.format || patch.fieldType
        || patch.lineWidth || patch.lineColor || patch.lineStyle || patch.textContent) {
        mask |= static_cast<std::uint32_t>(ChangeMask::Style);
    }
    return mask;
}

} // namespace

TemplateEngine::TemplateEngine()
    : TemplateEngine(EngineConfig{}) {}

TemplateEngine::TemplateEngine(const EngineConfig& config)
    : state_(std::make_unique<EngineState>(config)) {
    clearEventState();
}

TemplateEngine::~TemplateEngine() = default;

EngineState& TemplateEngine::state() { return *state_; }
const EngineState& TemplateEngine::state() const { return *state_; }

void TemplateEngine::clearError() const { state_->lastError = EngineError::Ok; }

EngineError TemplateEngine::setError(EngineError err) const {
    state_->lastError = err;
    return err;
}

EngineError TemplateEngine::reject(EngineError err, const char* op) const {
    DOCLAYOUT_LOG_WARN("%s rejected: %s", op, engineErrorName(err));
    return setError(err);
}

void TemplateEngine::validateAfterMutation() {
    EngineState& s = state();
    if (s.selection.prune()) recordSelectionChanged();
    if (s.groups.prune(s.store)) recordGroupsChanged();
    if (s.activeSectionId && !s.store.findSection(*s.activeSectionId)) {
        s.activeSectionId.reset();
    }
}

void TemplateEngine::commitMutation() {
    validateAfterMutation();
    state_->generation++;
    flushPendingEvents();
}

void TemplateEngine::clear() noexcept {
    EngineState& s = state();
    s.store.clear();
    s.selection.reset();
    s.groups.clear();
    s.clipboard.clear();
    s.templateId.reset();
    s.documentType.clear();
    s.name = "New Template";
    s.description.clear();
    s.uiPreferences = UiPreferences{};
    s.activeSectionId.reset();
    s.snapshotBytes.clear();
    s.lastError = EngineError::Ok;
    clearEventState();
    s.generation++;
}

// -----------------------------------------------------------------------------
// Document
// -----------------------------------------------------------------------------

void TemplateEngine::loadTemplate(const Template& tpl) {
    clearError();
    EngineState& s = state();
    s.store.load(tpl.sections);
    s.selection.reset();
    s.groups.clear();
    s.clipboard.clear();

    s.templateId = tpl.id;
    s.documentType = tpl.documentType;
    s.name = tpl.name;
    s.description = tpl.description;
    s.uiPreferences = tpl.uiPreferences;

    s.activeSectionId.reset();
    const auto& saved = tpl.uiPreferences.activeSectionId;
    if (saved && s.store.findSection(*saved)) {
        s.activeSectionId = *saved;
    } else if (!s.store.empty()) {
        s.activeSectionId = s.store.sections().front().id;
    }
    s.uiPreferences.activeSectionId = s.activeSectionId;

    DOCLAYOUT_LOG_DEBUG("loadTemplate: %zu sections, %zu fields", s.store.sections().size(), s.store.fieldCount());

    clearEventState();
    recordDocChanged(kCreateMask
        | static_cast<std::uint32_t>(ChangeMask::Preferences)
        | static_cast<std::uint32_t>(ChangeMask::Meta));
    recordSelectionChanged();
    recordGroupsChanged();
    recordClipboardChanged();
    s.generation++;
    flushPendingEvents();
}

Template TemplateEngine::toTemplate() const {
    const EngineState& s = state();
    Template tpl;
    tpl.id = s.templateId;
    tpl.documentType = s.documentType;
    tpl.name = s.name;
    tpl.description = s.description;
    tpl.sections = s.store.sections();
    tpl.pageWidth = s.config.pageWidthPoints;
    tpl.pageHeight = s.config.pageHeightPoints;
    tpl.uiPreferences = s.uiPreferences;
    tpl.uiPreferences.activeSectionId = getActiveSectionId();
    return tpl;
}

void TemplateEngine::replaceSections(std::vector<Section> sections) {
    clearError();
    EngineState& s = state();
    s.store.load(std::move(sections));
    recordDocChanged(kCreateMask);
    commitMutation();
}

const std::vector<Section>& TemplateEngine::getSections() const { return state().store.sections(); }
const Geometry* TemplateEngine::getField(const FieldRef& ref) const { return state().store.findField(ref); }
const EngineConfig& TemplateEngine::getConfig() const { return state().config; }
const FieldCatalog& TemplateEngine::getCatalog() const { return state().catalog; }
FieldCatalog& TemplateEngine::getCatalog() { return state().catalog; }

std::optional<std::uint32_t> TemplateEngine::getTemplateId() const { return state().templateId; }

void TemplateEngine::setTemplateId(std::uint32_t id) {
    state().templateId = id;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Meta));
}

const std::string& TemplateEngine::getDocumentType() const { return state().documentType; }
const std::string& TemplateEngine::getName() const { return state().name; }

void TemplateEngine::setName(const std::string& name) {
    state().name = name;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Meta));
    state().generation++;
}

const std::string& TemplateEngine::getDescription() const { return state().description; }

void TemplateEngine::setDescription(const std::string& description) {
    state().description = description;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Meta));
    state().generation++;
}

const UiPreferences& TemplateEngine::getUiPreferences() const { return state().uiPreferences; }

void TemplateEngine::setUiPreferences(const UiPreferences& prefs) {
    EngineState& s = state();
    s.uiPreferences = prefs;
    if (prefs.activeSectionId && s.store.findSection(*prefs.activeSectionId)) {
        s.activeSectionId = prefs.activeSectionId;
    }
    s.uiPreferences.activeSectionId = getActiveSectionId();
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Preferences));
    s.generation++;
}

std::optional<std::string> TemplateEngine::getActiveSectionId() const {
    const EngineState& s = state();
    if (s.activeSectionId && s.store.findSection(*s.activeSectionId)) return s.activeSectionId;
    if (s.store.empty()) return std::nullopt;
    return s.store.sections().front().id;
}

EngineError TemplateEngine::setActiveSection(const std::string& sectionId) {
    clearError();
    EngineState& s = state();
    if (!s.store.findSection(sectionId)) return reject(EngineError::SectionNotFound, "setActiveSection");
    s.activeSectionId = sectionId;
    s.uiPreferences.activeSectionId = sectionId;
    recordDocChanged(static_cast<std::uint32_t>(ChangeMask::Preferences));
    commitMutation();
    return EngineError::Ok;
}

// -----------------------------------------------------------------------------
// Command surface
// -----------------------------------------------------------------------------

EngineError TemplateEngine::addField(const std::string& baseKey, const Geometry& geometry, std::string* outKey) {
    clearError();
    const auto target = getActiveSectionId();
    if (!target) return reject(EngineError::NoSections, "addField");
    return addFieldToSection(*target, baseKey, geometry, std::nullopt, outKey);
}

EngineError TemplateEngine::addFieldToSection(
    const std::string& sectionId,
    const std::string& baseKey,
    const Geometry& geometry,
    std::optional<float> explicitY,
    std::string* outKey
) {
    clearError();
    EngineState& s = state();
    if (baseKey.empty()) return reject(EngineError::InvalidOperation, "addField");

    std::string key;
    const EngineError err = s.store.addField(sectionId, baseKey, geometry, explicitY, key);
    if (err != EngineError::Ok) return reject(err, "addField");

    const FieldRef ref{key, sectionId};
    recordFieldCreated(ref);
    if (s.selection.setSelection({ref})) recordSelectionChanged();
    commitMutation();

    if (outKey) *outKey = key;
    return EngineError::Ok;
}

EngineError TemplateEngine::addCatalogField(const std::string& baseIdentity, std::string* outKey) {
    clearError();
    EngineState& s = state();
    const FieldDefinition* def = s.catalog.find(s.documentType, baseIdentity);
    if (!def) return reject(EngineError::FieldNotFound, "addCatalogField");
    return addField(def->id, doclayout::makeInitialGeometry(*def, s.config), outKey);
}

EngineError TemplateEngine::moveField(const std::string& fieldId, const std::string& sectionId, float x, float y) {
    clearError();
    EngineState& s = state();
    const FieldRef ref{fieldId, sectionId};
    const Geometry* g = s.store.findField(ref);
    if (!g) return reject(EngineError::FieldNotFound, "moveField");

    const float dx = x - g->x;
    const float dy = y - g->y;
    const std::uint32_t mask = static_cast<std::uint32_t>(ChangeMask::Geometry);

    const std::vector<FieldRef> body = s.groups.rigidBodyOf(ref);
    if (s.store.setFieldPosition(ref, x, y) == EngineError::Ok) {
        recordFieldChanged(ref, mask);
    }
    for (const auto& member : body) {
        if (member == ref) continue;
        if (s.store.translateField(member, dx, dy) == EngineError::Ok) {
            recordFieldChanged(member, mask);
        }
    }
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::resizeField(
    const std::string& fieldId,
    const std::string& sectionId,
    float width,
    float height,
    std::optional<float> x,
    std::optional<float> y
) {
    clearError();
    const FieldRef ref{fieldId, sectionId};
    const EngineError err = state().store.resizeField(ref, width, height, x, y);
    if (err != EngineError::Ok) return reject(err, "resizeField");
    recordFieldChanged(ref, static_cast<std::uint32_t>(ChangeMask::Geometry));
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::deleteField(const std::string& fieldId, const std::optional<std::string>& sectionId) {
    clearError();
    if (sectionId) return deleteFields({FieldRef{fieldId, *sectionId}});

    const Section* owner = state().store.findOwningSection(fieldId);
    if (!owner) return reject(EngineError::FieldNotFound, "deleteField");
    return deleteFields({FieldRef{fieldId, owner->id}});
}

EngineError TemplateEngine::deleteFields(const std::vector<FieldRef>& refs) {
    clearError();
    EngineState& s = state();
    if (refs.empty()) return reject(EngineError::NoTargets, "deleteFields");

    const std::vector<FieldRef> removed = s.store.deleteFields(refs);
    if (removed.empty()) return reject(EngineError::FieldNotFound, "deleteFields");

    for (const auto& ref : removed) recordFieldDeleted(ref);
    if (s.groups.removeMembers(removed) > 0) recordGroupsChanged();
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::deleteSelection() {
    clearError();
    const std::vector<FieldRef> targets = state().selection.getOrdered();
    if (targets.empty()) return reject(EngineError::NoTargets, "deleteSelection");
    return deleteFields(targets);
}

EngineError TemplateEngine::select(const std::optional<std::string>& fieldId, const std::string& sectionId, bool multi) {
    clearError();
    EngineState& s = state();
    if (fieldId && !s.store.hasField(FieldRef{*fieldId, sectionId})) {
        return reject(EngineError::FieldNotFound, "select");
    }
    if (s.selection.select(fieldId, sectionId, multi)) recordSelectionChanged();
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::setSelection(const std::vector<FieldRef>& refs) {
    clearError();
    if (state().selection.setSelection(refs)) recordSelectionChanged();
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::groupSelection(GroupId* outId) {
    clearError();
    EngineState& s = state();
    GroupId id = 0;
    const EngineError err = s.groups.group(s.selection.getOrdered(), id);
    if (err != EngineError::Ok) return reject(err, "group");
    recordGroupsChanged();
    commitMutation();
    if (outId) *outId = id;
    return EngineError::Ok;
}

EngineError TemplateEngine::ungroupSelection(std::size_t* outUngrouped) {
    clearError();
    EngineState& s = state();
    std::size_t count = 0;
    const EngineError err = s.groups.ungroup(s.selection.getOrdered(), count);
    if (err != EngineError::Ok) return reject(err, "ungroup");
    recordGroupsChanged();
    commitMutation();
    if (outUngrouped) *outUngrouped = count;
    return EngineError::Ok;
}

EngineError TemplateEngine::copySelection() {
    clearError();
    EngineState& s = state();
    const EngineError err = s.clipboard.copy(s.selection.getOrdered());
    if (err != EngineError::Ok) return reject(err, "copy");
    recordClipboardChanged();
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::copyAllFromSection(const std::string& sectionId) {
    clearError();
    const EngineError err = state().clipboard.copyAllFromSection(sectionId);
    if (err != EngineError::Ok) return reject(err, "copyAll");
    recordClipboardChanged();
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::paste(std::vector<std::string>* outKeys) {
    return pasteInto(getActiveSectionId(), outKeys);
}

EngineError TemplateEngine::pasteInto(const std::optional<std::string>& sectionId, std::vector<std::string>* outKeys) {
    clearError();
    EngineState& s = state();
    std::vector<std::string> keys;
    const EngineError err = s.clipboard.paste(sectionId, keys);
    if (err != EngineError::Ok) return reject(err, "paste");

    for (const auto& key : keys) recordFieldCreated(FieldRef{key, *sectionId});
    commitMutation();
    if (outKeys) *outKeys = std::move(keys);
    return EngineError::Ok;
}

EngineError TemplateEngine::clearSection(const std::string& sectionId) {
    clearError();
    EngineState& s = state();
    const Section* section = s.store.findSection(sectionId);
    if (!section) return reject(EngineError::SectionNotFound, "clearSection");

    for (const auto& f : section->fields) recordFieldDeleted(FieldRef{f.key, sectionId});
    const EngineError err = s.store.clearSection(sectionId);
    if (err != EngineError::Ok) return reject(err, "clearSection");
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::clearAllSections() {
    clearError();
    EngineState& s = state();
    for (const auto& section : s.store.sections()) {
        for (const auto& f : section.fields) recordFieldDeleted(FieldRef{f.key, section.id});
    }
    s.store.clearAll();
    if (!s.clipboard.empty()) {
        s.clipboard.clear();
        recordClipboardChanged();
    }
    commitMutation();
    return EngineError::Ok;
}

EngineError TemplateEngine::updateSelectedFields(const GeometryPatch& patch) {
    clearError();
    EngineState& s = state();
    const std::vector<FieldRef> targets = s.selection.getOrdered();
    if (targets.empty()) return reject(EngineError::EmptySelection, "updateSelectedFields");

    const std::uint32_t mask = patchMask(patch);
    for (const auto& ref : targets) {
        if (s.store.patchField(ref, patch) == EngineError::Ok && mask != 0) {
            recordFieldChanged(ref, mask);
        }
    }
    commitMutation();
    return EngineError::Ok;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

const std::vector<FieldRef>& TemplateEngine::getSelection() const { return state().selection.getOrdered(); }
std::uint32_t TemplateEngine::getSelectionGeneration() const { return state().selection.getGeneration(); }

bool TemplateEngine::isSelected(const std::string& fieldId, const std::string& sectionId) const {
    return state().selection.isSelected(FieldRef{fieldId, sectionId});
}

std::optional<SelectedFieldDetails> TemplateEngine::selectedFieldDetails() const {
    const EngineState& s = state();
    const auto& ordered = s.selection.getOrdered();
    if (ordered.empty()) return std::nullopt;

    const FieldRef& ref = ordered.front();
    const Geometry* g = s.store.findField(ref);
    if (!g) return std::nullopt;

    SelectedFieldDetails out;
    out.ref = ref;
    out.baseIdentity = doclayout::baseIdentity(ref.fieldId);
    out.label = s.catalog.labelFor(s.documentType, out.baseIdentity);
    out.geometry = *g;
    out.groupId = s.groups.groupOf(ref);
    return out;
}

std::optional<GroupId> TemplateEngine::groupOf(const std::string& fieldId, const std::string& sectionId) const {
    return state().groups.groupOf(FieldRef{fieldId, sectionId});
}

bool TemplateEngine::isFieldInGroup(const std::string& fieldId, const std::string& sectionId) const {
    return groupOf(fieldId, sectionId).has_value();
}

std::vector<GroupRecord> TemplateEngine::getGroups() const { return state().groups.snapshot(); }

const std::vector<ClipboardEntry>& TemplateEngine::getClipboard() const { return state().clipboard.entries(); }

CompiledLayout TemplateEngine::compile() const {
    const EngineState& s = state();
    return doclayout::compileLayout(toTemplate(), s.config, &s.catalog);
}

// -----------------------------------------------------------------------------
// Binary protocol
// -----------------------------------------------------------------------------

EngineError TemplateEngine::applyCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount) {
    clearError();
    auto commandCallback = [](void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        return doclayout::dispatchCommand(reinterpret_cast<TemplateEngine*>(ctx), op, payload, payloadByteCount);
    };

    const EngineError err = doclayout::parseCommandBuffer(src, byteCount, commandCallback, this);
    if (err != EngineError::Ok) return reject(err, "applyCommandBuffer");
    return EngineError::Ok;
}

std::uint32_t TemplateEngine::getGeneration() const noexcept { return state_->generation; }
EngineError TemplateEngine::getLastError() const noexcept { return state_->lastError; }

#ifdef EMSCRIPTEN
std::uintptr_t TemplateEngine::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void TemplateEngine::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

void TemplateEngine::applyCommandBufferPtr(std::uintptr_t ptr, std::uint32_t byteCount) {
    applyCommandBuffer(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}

void TemplateEngine::loadSnapshotFromPtr(std::uintptr_t ptr, std::uint32_t byteCount) {
    loadSnapshot(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}
#endif
