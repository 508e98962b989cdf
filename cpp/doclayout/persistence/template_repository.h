#pragma once

#include "doclayout/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Fields sent on update. The sections list always travels whole.
struct TemplateUpdate {
    std::string name;
    std::string description;
    std::vector<Section> sections;
    float pageWidth{612.0f};
    float pageHeight{792.0f};
    UiPreferences uiPreferences;
};

// Remote template store. Implementations report transport failures by
// throwing std::runtime_error; the editor session maps them to
// EngineError::PersistenceFailed.
class TemplateRepository {
public:
    virtual ~TemplateRepository() = default;

    virtual Template fetchTemplate(std::uint32_t id) = 0;
    virtual Template fetchDefaultTemplate(const std::string& documentType) = 0;
    virtual Template createTemplate(const Template& tpl) = 0;
    virtual Template updateTemplate(std::uint32_t id, const TemplateUpdate& update) = 0;
};
