#include "doclayout/layout/layout_compiler.h"
#include "doclayout/catalog/field_catalog.h"
#include "doclayout/section/key_allocator.h"
#include <algorithm>
#include <cmath>

namespace doclayout {

namespace {

float sectionHeightPoints(const Section& section, const EngineConfig& config) {
    if (!std::isfinite(section.heightInches) || section.heightInches <= 0.0f) return 0.0f;
    return section.heightInches * config.pointsPerInch;
}

} // namespace

CompiledLayout compileLayout(const Template& tpl, const EngineConfig& config, const FieldCatalog* catalog) {
    CompiledLayout out;
    out.pageWidth = config.pageWidthPoints;
    out.bands.reserve(tpl.sections.size());

    std::size_t total = 0;
    for (const auto& s : tpl.sections) total += s.fields.size();
    out.fields.reserve(total);

    float yOffset = 0.0f;
    for (std::size_t i = 0; i < tpl.sections.size(); ++i) {
        const Section& section = tpl.sections[i];
        const float heightPts = sectionHeightPoints(section, config);

        for (const auto& entry : section.fields) {
            const std::string base = baseIdentity(entry.key);
            const FieldDefinition* def = catalog ? catalog->find(tpl.documentType, base) : nullptr;

            CompiledField f;
            f.id = section.id + "-" + entry.key;
            f.fieldKey = entry.key;
            f.baseIdentity = base;
            f.sectionId = section.id;
            f.label = def ? def->label : base;

            const bool isStatic = entry.geometry.fieldType == FieldType::Static || (def && def->isStatic);
            if (isStatic && entry.geometry.textContent && !entry.geometry.textContent->empty()) {
                f.displayValue = *entry.geometry.textContent;
            } else {
                f.displayValue = "{" + f.label + "}";
            }

            f.geometry = entry.geometry;
            f.absoluteY = entry.geometry.y + yOffset;
            f.geometry.y = f.absoluteY;
            out.fields.push_back(std::move(f));
        }

        out.bands.push_back(SectionBand{section.id, section.name, yOffset, heightPts});
        yOffset += heightPts;
        if (i + 1 < tpl.sections.size()) {
            out.separators.push_back(yOffset);
        }
    }

    out.totalHeight = yOffset;
    return out;
}

} // namespace doclayout
