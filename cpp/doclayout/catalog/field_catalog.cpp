#include "doclayout/catalog/field_catalog.h"

namespace {

FieldDefinition def(
    const char* id,
    const char* label,
    const char* category,
    float w,
    float h,
    std::optional<std::string> format = std::nullopt,
    std::optional<FieldType> fieldType = std::nullopt,
    bool isStatic = false
) {
    return FieldDefinition{id, label, category, w, h, std::move(format), fieldType, isStatic};
}

std::vector<FieldDefinition> chequeDefinitions() {
    return {
        def("date", "Date", "Essential", 120, 30, "date"),
        def("payeeName", "Pay to the Order of", "Essential", 400, 30),
        def("amountNumeric", "Amount ($)", "Essential", 100, 30, "currency"),
        def("amountWords", "Amount in Words", "Essential", 450, 30),
        def("memo", "Memo", "Essential", 350, 30),
        def("signature", "Signature Line", "Essential", 120, 30),
        def("companyName", "Company Name", "Optional", 300, 30),
        def("companyAddress", "Company Address", "Optional", 300, 50),
        def("chequeNumber", "Cheque Number", "Optional", 80, 30),
        def("bankName", "Bank Name", "Optional", 200, 30),
        def("transitNumber", "Transit Number", "Optional", 100, 30),
        def("accountNumber", "Account Number", "Optional", 150, 30),
        def("billId", "Bill ID / Reference", "Line Items", 100, 25, "text"),
        def("subtotal", "Subtotal (Without Tax)", "Line Items", 120, 25, "currency"),
        def("taxAmount", "Tax Amount", "Line Items", 120, 25, "currency"),
        def("totalAmount", "Total Amount (With Tax)", "Line Items", 120, 25, "currency"),
        def("horizontalLine", "Horizontal Line", "Visual Elements", 400, 1, std::nullopt, FieldType::Line),
        def("verticalLine", "Vertical Line", "Visual Elements", 1, 200, std::nullopt, FieldType::Line),
        def("box", "Box / Border", "Visual Elements", 200, 100, std::nullopt, FieldType::Box),
        def("micrLine", "MICR Line", "Visual Elements", 500, 15, std::nullopt, FieldType::Micr),
        def("staticText", "Static Text", "Visual Elements", 200, 30, std::nullopt, FieldType::Static, true),
        def("stubHours", "Hours", "Pay Stub", 80, 25, "number"),
        def("stubRate", "Rate", "Pay Stub", 80, 25, "currency"),
        def("stubGrossPay", "Gross Pay", "Pay Stub", 100, 25, "currency"),
        def("stubDeductions", "Deductions", "Pay Stub", 100, 25, "currency"),
        def("stubNetPay", "Net Pay", "Pay Stub", 100, 25, "currency"),
        def("stubYtdGross", "YTD Gross", "Pay Stub", 100, 25, "currency"),
        def("stubYtdDeductions", "YTD Deductions", "Pay Stub", 100, 25, "currency"),
        def("stubYtdNet", "YTD Net", "Pay Stub", 100, 25, "currency"),
    };
}

std::vector<FieldDefinition> invoiceDefinitions() {
    return {
        def("logo", "Company Logo", "Header", 100, 50, std::nullopt, FieldType::Image),
        def("companyName", "Company Name", "Header", 200, 30),
        def("companyAddress", "Company Address", "Header", 200, 50),
        def("companyPhone", "Company Phone", "Header", 150, 20),
        def("invoiceTitle", "Invoice Title", "Header", 150, 30, std::nullopt, FieldType::Static),
        def("invoiceNumber", "Invoice Number", "Invoice Details", 120, 25),
        def("invoiceDate", "Invoice Date", "Invoice Details", 120, 25, "date"),
        def("poNumber", "P.O. Number", "Invoice Details", 120, 25),
        def("businessNumber", "Business Number", "Invoice Details", 150, 25),
        def("dueDate", "Due Date", "Invoice Details", 120, 25, "date"),
        def("servicesProvidedToLabel", "Services Provided to:", "Client Information", 150, 20, std::nullopt, FieldType::Static),
        def("clientName", "Client Name", "Client Information", 200, 30),
        def("clientAddress", "Client Address", "Client Information", 200, 50),
        def("itemsTable", "Items Table", "Line Items", 500, 200, std::nullopt, FieldType::Table),
        def("itemDescription", "Item Description", "Line Items", 250, 25),
        def("itemSubDescription", "Item Sub Description", "Line Items", 250, 25),
        def("itemQuantity", "Quantity", "Line Items", 80, 25, "number"),
        def("itemRate", "Rate", "Line Items", 80, 25, "currency"),
        def("itemAmount", "Amount", "Line Items", 100, 25, "currency"),
        def("netInvoice", "Net Invoice", "Summary", 120, 25, "currency"),
        def("taxLabel", "Tax Label (e.g., HST)", "Summary", 80, 25, std::nullopt, FieldType::Static),
        def("taxAmount", "Tax Amount", "Summary", 120, 25, "currency"),
        def("totalAmount", "Total Amount", "Summary", 120, 30, "currency"),
        def("subtotal", "Subtotal", "Summary", 120, 25, "currency"),
        def("paymentTerms", "Payment Terms", "Additional", 200, 30),
        def("notes", "Notes", "Additional", 300, 50),
        def("horizontalLine", "Horizontal Line", "Visual Elements", 400, 1, std::nullopt, FieldType::Line),
        def("verticalLine", "Vertical Line", "Visual Elements", 1, 200, std::nullopt, FieldType::Line),
        def("box", "Box / Border", "Visual Elements", 200, 100, std::nullopt, FieldType::Box),
        def("staticText", "Static Text", "Visual Elements", 200, 30, std::nullopt, FieldType::Static, true),
    };
}

const std::vector<FieldDefinition> kNoDefinitions{};

} // namespace

FieldCatalog::FieldCatalog() {
    tables_.emplace("cheque", chequeDefinitions());
    tables_.emplace("invoice", invoiceDefinitions());
}

void FieldCatalog::registerDocumentType(const std::string& documentType, std::vector<FieldDefinition> defs) {
    tables_[documentType] = std::move(defs);
}

const FieldDefinition* FieldCatalog::find(const std::string& documentType, const std::string& baseIdentity) const {
    const auto it = tables_.find(documentType);
    if (it == tables_.end()) return nullptr;
    for (const auto& d : it->second) {
        if (d.id == baseIdentity) return &d;
    }
    return nullptr;
}

std::string FieldCatalog::labelFor(const std::string& documentType, const std::string& baseIdentity) const {
    const FieldDefinition* d = find(documentType, baseIdentity);
    return d ? d->label : baseIdentity;
}

const std::vector<FieldDefinition>& FieldCatalog::definitionsFor(const std::string& documentType) const {
    const auto it = tables_.find(documentType);
    if (it == tables_.end()) return kNoDefinitions;
    return it->second;
}

bool FieldCatalog::hasDocumentType(const std::string& documentType) const {
    return tables_.find(documentType) != tables_.end();
}

namespace doclayout {

Geometry makeInitialGeometry(const FieldDefinition& def, const EngineConfig& config) {
    Geometry g;
    g.x = config.defaultFieldX;
    g.y = 0.0f;
    g.width = def.defaultWidth > 0.0f ? def.defaultWidth : 100.0f;
    g.height = def.defaultHeight > 0.0f ? def.defaultHeight : 30.0f;
    g.fontSize = config.defaultFontSize;
    g.fontFamily = config.defaultFontFamily;
    g.alignment = Alignment::Left;
    g.format = def.format;
    g.fieldType = def.fieldType;
    if (def.fieldType == FieldType::Line || def.fieldType == FieldType::Box) {
        g.lineWidth = 0.5f;
        g.lineColor = std::string("#000000");
        g.lineStyle = LineStyle::Solid;
    }
    if (def.isStatic) {
        g.textContent = def.label;
    }
    return g;
}

Template makeDefaultTemplate(const std::string& documentType, const EngineConfig& config) {
    Template t;
    t.documentType = documentType;
    t.pageWidth = config.pageWidthPoints;
    t.pageHeight = config.pageHeightPoints;

    if (documentType == "cheque") {
        t.sections.push_back(Section{"cheque", "Cheque", 3.5f, {}});
        t.sections.push_back(Section{"stub1", "Stub 1", 3.5f, {}});
        t.sections.push_back(Section{"stub2", "Stub 2", 3.5f, {}});
    } else if (documentType == "invoice") {
        t.sections.push_back(Section{"body", "Invoice", 11.0f, {}});
    } else {
        t.sections.push_back(Section{"main", "Main", 11.0f, {}});
    }
    t.uiPreferences.activeSectionId = t.sections.front().id;
    return t;
}

} // namespace doclayout
