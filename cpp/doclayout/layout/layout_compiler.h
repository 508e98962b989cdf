#ifndef DOCLAYOUT_LAYOUT_LAYOUT_COMPILER_H
#define DOCLAYOUT_LAYOUT_LAYOUT_COMPILER_H

#include "doclayout/core/types.h"
#include <string>
#include <vector>

class FieldCatalog; // Forward declaration

// One field in document-absolute coordinates. geometry.y already includes
// the section offset and equals absoluteY.
struct CompiledField {
    std::string id;           // sectionId + "-" + fieldKey
    std::string fieldKey;
    std::string baseIdentity;
    std::string sectionId;
    std::string label;
    std::string displayValue;
    float absoluteY{0.0f};
    Geometry geometry;
};

struct SectionBand {
    std::string id;
    std::string name;
    float yOffset{0.0f};
    float heightPoints{0.0f};
};

struct CompiledLayout {
    std::vector<CompiledField> fields;
    std::vector<SectionBand> bands;
    std::vector<float> separators; // boundary after every section but the last
    float pageWidth{0.0f};
    float totalHeight{0.0f};
};

namespace doclayout {

// Flattens sections in order; fields keep insertion order within a section.
// `catalog` may be null, in which case labels fall back to base identities.
CompiledLayout compileLayout(const Template& tpl, const EngineConfig& config, const FieldCatalog* catalog);

} // namespace doclayout

#endif // DOCLAYOUT_LAYOUT_LAYOUT_COMPILER_H
