#pragma once

#include "doclayout/engine.h"
#include "doclayout/persistence/template_repository.h"

#include <cstdint>
#include <string>

// One editor instance bound to one template. Owns the engine, talks to the
// repository, and applies the initial-load gate: the first fetched template
// seeds the engine, later fetches only echo the server id.
class EditorSession {
public:
    explicit EditorSession(TemplateRepository& repository, const EngineConfig& config = EngineConfig{});

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    TemplateEngine& engine() { return engine_; }
    const TemplateEngine& engine() const { return engine_; }

    EngineError open(std::uint32_t templateId);
    // Server default for the type. A default with no sections gets the
    // built-in section layout for that type.
    EngineError openDefault(const std::string& documentType);
    // Unsaved template from the built-in layout; no repository round trip.
    EngineError openNew(const std::string& documentType);

    // Fetch completion.
    EngineError onFetched(const Template& tpl);

    // Creates or updates the remote template from the in-memory state.
    EngineError save();
    // Save completion.
    EngineError onSaved(const Template& response);

    // Late completions after close are refused.
    void close() noexcept { closed_ = true; }

    bool isHydrated() const noexcept { return hydrated_; }
    bool isClosed() const noexcept { return closed_; }
    const std::string& lastPersistenceMessage() const { return lastPersistenceMessage_; }

private:
    void hydrate(const Template& tpl);
    EngineError persistenceFailed(const char* op, const char* what);

    TemplateRepository& repository_;
    TemplateEngine engine_;
    bool hydrated_{false};
    bool closed_{false};
    std::string lastPersistenceMessage_;
};
