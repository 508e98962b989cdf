#pragma once

#include "doclayout/engine.h"
#include "doclayout/internal/engine_state.h"

class TemplateEngineTestAccessor {
public:
    static const SectionStore& store(const TemplateEngine& engine) {
        return engine.state().store;
    }

    static const GroupManager& groups(const TemplateEngine& engine) {
        return engine.state().groups;
    }

    static EngineError lastError(const TemplateEngine& engine) {
        return engine.state().lastError;
    }

    static std::uint32_t generation(const TemplateEngine& engine) {
        return engine.state().generation;
    }

    static std::size_t queuedEvents(const TemplateEngine& engine) {
        return engine.state().eventCount_;
    }
};
