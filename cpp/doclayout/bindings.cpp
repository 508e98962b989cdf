#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "doclayout/engine.h"
#include "doclayout/catalog/field_catalog.h"

#ifdef EMSCRIPTEN
namespace {

std::optional<float> optionalCoord(bool has, float v) {
    return has ? std::optional<float>(v) : std::nullopt;
}

// Selection as a flat [fieldId, sectionId, fieldId, sectionId, ...] array.
emscripten::val selectionToJs(const TemplateEngine& self) {
    emscripten::val out = emscripten::val::array();
    for (const auto& ref : self.getSelection()) {
        out.call<void>("push", ref.fieldId);
        out.call<void>("push", ref.sectionId);
    }
    return out;
}

} // namespace

EMSCRIPTEN_BINDINGS(doclayout_module) {
    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("NoSections", EngineError::NoSections)
        .value("SectionNotFound", EngineError::SectionNotFound)
        .value("FieldNotFound", EngineError::FieldNotFound)
        .value("NoTargets", EngineError::NoTargets)
        .value("InsufficientSelection", EngineError::InsufficientSelection)
        .value("NoGroupsAffected", EngineError::NoGroupsAffected)
        .value("EmptySelection", EngineError::EmptySelection)
        .value("EmptySection", EngineError::EmptySection)
        .value("EmptyClipboard", EngineError::EmptyClipboard)
        .value("NoActiveSection", EngineError::NoActiveSection)
        .value("InvalidMagic", EngineError::InvalidMagic)
        .value("UnsupportedVersion", EngineError::UnsupportedVersion)
        .value("BufferTruncated", EngineError::BufferTruncated)
        .value("InvalidPayloadSize", EngineError::InvalidPayloadSize)
        .value("UnknownCommand", EngineError::UnknownCommand)
        .value("InvalidOperation", EngineError::InvalidOperation)
        .value("NotHydrated", EngineError::NotHydrated)
        .value("PersistenceFailed", EngineError::PersistenceFailed);

    emscripten::class_<TemplateEngine>("TemplateEngine")
        .constructor<>()
        .function("clear", &TemplateEngine::clear)
        .function("allocBytes", &TemplateEngine::allocBytes)
        .function("freeBytes", &TemplateEngine::freeBytes)
        .function("applyCommandBuffer", &TemplateEngine::applyCommandBufferPtr)
        .function("loadSnapshotFromPtr", &TemplateEngine::loadSnapshotFromPtr)
        .function("getSnapshotBufferMeta", &TemplateEngine::getSnapshotBufferMeta)
        .function("pollEvents", &TemplateEngine::pollEvents)
        .function("ackResync", &TemplateEngine::ackResync)
        .function("getGeneration", &TemplateEngine::getGeneration)
        .function("getLastError", &TemplateEngine::getLastError)
        .function("getDocumentDigest", &TemplateEngine::getDocumentDigest)
        .function("setActiveSection", &TemplateEngine::setActiveSection)
        .function("getActiveSectionId", emscripten::optional_override([](const TemplateEngine& self) {
            return self.getActiveSectionId().value_or(std::string());
        }))
        .function("addCatalogField", emscripten::optional_override([](TemplateEngine& self, const std::string& baseIdentity) {
            std::string key;
            if (self.addCatalogField(baseIdentity, &key) != EngineError::Ok) return std::string();
            return key;
        }))
        .function("moveField", &TemplateEngine::moveField)
        .function("resizeField", emscripten::optional_override([](TemplateEngine& self, const std::string& fieldId, const std::string& sectionId, float w, float h, bool hasX, float x, bool hasY, float y) {
            return self.resizeField(fieldId, sectionId, w, h, optionalCoord(hasX, x), optionalCoord(hasY, y));
        }))
        .function("deleteField", emscripten::optional_override([](TemplateEngine& self, const std::string& fieldId, const std::string& sectionId) {
            return self.deleteField(fieldId, sectionId.empty() ? std::nullopt : std::optional<std::string>(sectionId));
        }))
        .function("deleteSelection", &TemplateEngine::deleteSelection)
        .function("select", emscripten::optional_override([](TemplateEngine& self, const std::string& fieldId, const std::string& sectionId, bool multi) {
            return self.select(fieldId.empty() ? std::nullopt : std::optional<std::string>(fieldId), sectionId, multi);
        }))
        .function("getSelection", emscripten::optional_override([](const TemplateEngine& self) {
            return selectionToJs(self);
        }))
        .function("isSelected", &TemplateEngine::isSelected)
        .function("isFieldInGroup", &TemplateEngine::isFieldInGroup)
        .function("groupSelection", emscripten::optional_override([](TemplateEngine& self) {
            return self.groupSelection();
        }))
        .function("ungroupSelection", emscripten::optional_override([](TemplateEngine& self) {
            return self.ungroupSelection();
        }))
        .function("copySelection", &TemplateEngine::copySelection)
        .function("copyAllFromSection", &TemplateEngine::copyAllFromSection)
        .function("paste", emscripten::optional_override([](TemplateEngine& self, const std::string& sectionId) {
            if (sectionId.empty()) return self.paste();
            return self.pasteInto(sectionId);
        }))
        .function("clearSection", &TemplateEngine::clearSection)
        .function("clearAllSections", &TemplateEngine::clearAllSections)
        .function("getTotalHeight", emscripten::optional_override([](const TemplateEngine& self) {
            return self.compile().totalHeight;
        }));

    emscripten::value_object<TemplateEngine::ByteBufferMeta>("ByteBufferMeta")
        .field("generation", &TemplateEngine::ByteBufferMeta::generation)
        .field("byteCount", &TemplateEngine::ByteBufferMeta::byteCount)
        .field("ptr", &TemplateEngine::ByteBufferMeta::ptr);

    emscripten::value_object<TemplateEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &TemplateEngine::EventBufferMeta::generation)
        .field("count", &TemplateEngine::EventBufferMeta::count)
        .field("ptr", &TemplateEngine::EventBufferMeta::ptr);

    emscripten::value_object<TemplateEngine::DocumentDigest>("DocumentDigest")
        .field("lo", &TemplateEngine::DocumentDigest::lo)
        .field("hi", &TemplateEngine::DocumentDigest::hi);
}
#endif
