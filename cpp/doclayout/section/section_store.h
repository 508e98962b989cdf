#pragma once

#include "doclayout/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Canonical section/field data. Mutations are section-scoped; selection and
// group bookkeeping is the caller's job (see TemplateEngine::validateAfterMutation).
class SectionStore {
public:
    explicit SectionStore(const EngineConfig& config);

    void clear() noexcept;
    void load(std::vector<Section> sections);

    const std::vector<Section>& sections() const { return sections_; }
    bool empty() const { return sections_.empty(); }
    std::size_t fieldCount() const noexcept;

    Section* findSection(const std::string& sectionId);
    const Section* findSection(const std::string& sectionId) const;
    std::int32_t sectionIndex(const std::string& sectionId) const;

    Geometry* findField(const FieldRef& ref);
    const Geometry* findField(const FieldRef& ref) const;
    bool hasField(const FieldRef& ref) const { return findField(ref) != nullptr; }

    // First section (in order) holding `fieldId`, or nullptr.
    const Section* findOwningSection(const std::string& fieldId) const;

    // Y for a field stacked under every existing field of the section.
    float nextStackY(const Section& section) const;

    // Inserts under a freshly allocated key. When `explicitY` is empty the
    // field is stacked below the section's existing fields.
    EngineError addField(
        const std::string& sectionId,
        const std::string& baseKey,
        Geometry geometry,
        std::optional<float> explicitY,
        std::string& outKey);

    EngineError setFieldPosition(const FieldRef& ref, float x, float y);
    EngineError translateField(const FieldRef& ref, float dx, float dy);

    // Width/height are clamped to EngineConfig::minFieldSize.
    EngineError resizeField(
        const FieldRef& ref,
        float width,
        float height,
        std::optional<float> x,
        std::optional<float> y);

    EngineError patchField(const FieldRef& ref, const GeometryPatch& patch);

    // Returns the refs that were actually removed.
    std::vector<FieldRef> deleteFields(const std::vector<FieldRef>& refs);

    EngineError clearSection(const std::string& sectionId);
    void clearAll() noexcept;

private:
    const EngineConfig& config_;
    std::vector<Section> sections_;
};
