#ifndef DOCLAYOUT_CATALOG_FIELD_CATALOG_H
#define DOCLAYOUT_CATALOG_FIELD_CATALOG_H

#include "doclayout/core/types.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Palette entry for one base identity. Width/height of 0 mean "unset".
struct FieldDefinition {
    std::string id;
    std::string label;
    std::string category;
    float defaultWidth{0.0f};
    float defaultHeight{0.0f};
    std::optional<std::string> format;
    std::optional<FieldType> fieldType;
    bool isStatic{false};
};

// Read-only reference data: document type -> field definitions.
class FieldCatalog {
public:
    FieldCatalog(); // Loads the built-in cheque and invoice tables

    void registerDocumentType(const std::string& documentType, std::vector<FieldDefinition> defs);

    const FieldDefinition* find(const std::string& documentType, const std::string& baseIdentity) const;

    // Catalog label, or the base identity itself when unknown.
    std::string labelFor(const std::string& documentType, const std::string& baseIdentity) const;

    const std::vector<FieldDefinition>& definitionsFor(const std::string& documentType) const;
    bool hasDocumentType(const std::string& documentType) const;

private:
    std::unordered_map<std::string, std::vector<FieldDefinition>> tables_;
};

namespace doclayout {

// Initial geometry for a palette insert. y is left at 0; the store stacks it.
Geometry makeInitialGeometry(const FieldDefinition& def, const EngineConfig& config);

// Section layout used for a document type that has no saved template yet.
Template makeDefaultTemplate(const std::string& documentType, const EngineConfig& config);

} // namespace doclayout

#endif // DOCLAYOUT_CATALOG_FIELD_CATALOG_H
