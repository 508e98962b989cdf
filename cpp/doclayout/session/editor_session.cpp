#include "doclayout/session/editor_session.h"
#include "doclayout/catalog/field_catalog.h"
#include "doclayout/core/logging.h"

#include <exception>
#include <utility>

EditorSession::EditorSession(TemplateRepository& repository, const EngineConfig& config)
    : repository_(repository),
      engine_(config) {}

EngineError EditorSession::open(std::uint32_t templateId) {
    if (closed_) return EngineError::InvalidOperation;

    Template fetched;
    try {
        fetched = repository_.fetchTemplate(templateId);
    } catch (const std::exception& e) {
        return persistenceFailed("fetchTemplate", e.what());
    }
    return onFetched(fetched);
}

EngineError EditorSession::openDefault(const std::string& documentType) {
    if (closed_) return EngineError::InvalidOperation;

    Template fetched;
    try {
        fetched = repository_.fetchDefaultTemplate(documentType);
    } catch (const std::exception& e) {
        return persistenceFailed("fetchDefaultTemplate", e.what());
    }
    if (fetched.documentType.empty()) fetched.documentType = documentType;
    if (fetched.sections.empty()) {
        const Template builtin = doclayout::makeDefaultTemplate(fetched.documentType, engine_.getConfig());
        fetched.sections = builtin.sections;
        if (!fetched.uiPreferences.activeSectionId) {
            fetched.uiPreferences.activeSectionId = builtin.uiPreferences.activeSectionId;
        }
    }
    return onFetched(fetched);
}

EngineError EditorSession::openNew(const std::string& documentType) {
    if (closed_) return EngineError::InvalidOperation;
    return onFetched(doclayout::makeDefaultTemplate(documentType, engine_.getConfig()));
}

EngineError EditorSession::onFetched(const Template& tpl) {
    if (closed_) {
        DOCLAYOUT_LOG_WARN("fetch completed after close; ignored");
        return EngineError::InvalidOperation;
    }
    if (!hydrated_) {
        hydrate(tpl);
        return EngineError::Ok;
    }
    // Refetch after save: live edits win.
    if (tpl.id && engine_.getTemplateId() != tpl.id) {
        engine_.setTemplateId(*tpl.id);
    }
    DOCLAYOUT_LOG_DEBUG("refetch ignored for hydrated session");
    return EngineError::Ok;
}

void EditorSession::hydrate(const Template& tpl) {
    engine_.loadTemplate(tpl);
    hydrated_ = true;
    DOCLAYOUT_LOG_DEBUG("hydrated template '%s' (%zu sections)", tpl.name.c_str(), tpl.sections.size());
}

EngineError EditorSession::save() {
    if (closed_) return EngineError::InvalidOperation;
    if (!hydrated_) {
        DOCLAYOUT_LOG_WARN("save rejected: %s", engineErrorName(EngineError::NotHydrated));
        return EngineError::NotHydrated;
    }

    Template snapshot = engine_.toTemplate();
    snapshot.pageWidth = engine_.getConfig().pageWidthPoints;
    snapshot.pageHeight = engine_.getConfig().pageHeightPoints;

    Template response;
    try {
        if (snapshot.id) {
            TemplateUpdate update;
            update.name = snapshot.name;
            update.description = snapshot.description;
            update.sections = snapshot.sections;
            update.pageWidth = snapshot.pageWidth;
            update.pageHeight = snapshot.pageHeight;
            update.uiPreferences = snapshot.uiPreferences;
            response = repository_.updateTemplate(*snapshot.id, update);
        } else {
            response = repository_.createTemplate(snapshot);
        }
    } catch (const std::exception& e) {
        return persistenceFailed(snapshot.id ? "updateTemplate" : "createTemplate", e.what());
    }

    lastPersistenceMessage_.clear();
    DOCLAYOUT_LOG_DEBUG("saved template (%zu sections)", snapshot.sections.size());
    return onSaved(response);
}

EngineError EditorSession::onSaved(const Template& response) {
    if (closed_) {
        DOCLAYOUT_LOG_WARN("save completed after close; ignored");
        return EngineError::InvalidOperation;
    }
    if (response.id) engine_.setTemplateId(*response.id);
    if (!response.sections.empty()) engine_.replaceSections(response.sections);
    if (!response.name.empty()) engine_.setName(response.name);
    engine_.setDescription(response.description);
    return EngineError::Ok;
}

EngineError EditorSession::persistenceFailed(const char* op, const char* what) {
    lastPersistenceMessage_ = what ? what : "";
    DOCLAYOUT_LOG_WARN("%s failed: %s", op, lastPersistenceMessage_.c_str());
    return EngineError::PersistenceFailed;
}
