#include <gtest/gtest.h>
#include "doclayout/catalog/field_catalog.h"

TEST(FieldCatalogTest, BuiltInTablesResolveDefinitions) {
    FieldCatalog catalog;
    const FieldDefinition* date = catalog.find("cheque", "date");
    ASSERT_NE(date, nullptr);
    EXPECT_EQ(date->label, "Date");
    EXPECT_FLOAT_EQ(date->defaultWidth, 120.0f);
    EXPECT_EQ(date->format, std::optional<std::string>("date"));

    EXPECT_NE(catalog.find("invoice", "itemsTable"), nullptr);
    EXPECT_EQ(catalog.find("cheque", "itemsTable"), nullptr);
    EXPECT_EQ(catalog.find("receipt", "date"), nullptr);
}

TEST(FieldCatalogTest, LabelFallsBackToBaseIdentity) {
    FieldCatalog catalog;
    EXPECT_EQ(catalog.labelFor("cheque", "payeeName"), "Pay to the Order of");
    EXPECT_EQ(catalog.labelFor("cheque", "custom"), "custom");
}

TEST(FieldCatalogTest, RegisteredDocumentTypeIsQueryable) {
    FieldCatalog catalog;
    EXPECT_FALSE(catalog.hasDocumentType("receipt"));
    catalog.registerDocumentType("receipt", {FieldDefinition{"total", "Total", "Summary", 90.0f, 20.0f, std::nullopt, std::nullopt, false}});
    EXPECT_TRUE(catalog.hasDocumentType("receipt"));
    EXPECT_EQ(catalog.definitionsFor("receipt").size(), 1u);
    EXPECT_TRUE(catalog.definitionsFor("unknown").empty());
}

TEST(FieldCatalogTest, InitialGeometryForLineAndStaticFields) {
    FieldCatalog catalog;
    const EngineConfig config;

    const Geometry line = doclayout::makeInitialGeometry(*catalog.find("cheque", "horizontalLine"), config);
    EXPECT_FLOAT_EQ(line.x, 50.0f);
    EXPECT_FLOAT_EQ(line.width, 400.0f);
    EXPECT_FLOAT_EQ(line.height, 1.0f);
    EXPECT_EQ(line.fieldType, std::optional<FieldType>(FieldType::Line));
    EXPECT_EQ(line.lineWidth, std::optional<float>(0.5f));
    EXPECT_EQ(line.lineColor, std::optional<std::string>("#000000"));
    EXPECT_FALSE(line.textContent.has_value());

    const Geometry text = doclayout::makeInitialGeometry(*catalog.find("cheque", "staticText"), config);
    EXPECT_EQ(text.textContent, std::optional<std::string>("Static Text"));
    EXPECT_EQ(text.fontFamily, "Helvetica");
    EXPECT_FLOAT_EQ(text.fontSize, 12.0f);
}

TEST(FieldCatalogTest, UnsetSizesDefaultTo100By30) {
    const FieldDefinition def{"custom", "Custom", "Optional", 0.0f, 0.0f, std::nullopt, std::nullopt, false};
    const Geometry g = doclayout::makeInitialGeometry(def, EngineConfig{});
    EXPECT_FLOAT_EQ(g.width, 100.0f);
    EXPECT_FLOAT_EQ(g.height, 30.0f);
}

TEST(FieldCatalogTest, DefaultTemplatesPerDocumentType) {
    const EngineConfig config;
    const Template cheque = doclayout::makeDefaultTemplate("cheque", config);
    ASSERT_EQ(cheque.sections.size(), 3u);
    EXPECT_EQ(cheque.sections[0].id, "cheque");
    EXPECT_EQ(cheque.uiPreferences.activeSectionId, std::optional<std::string>("cheque"));

    const Template invoice = doclayout::makeDefaultTemplate("invoice", config);
    ASSERT_EQ(invoice.sections.size(), 1u);
    EXPECT_FLOAT_EQ(invoice.sections[0].heightInches, 11.0f);

    const Template other = doclayout::makeDefaultTemplate("letter", config);
    ASSERT_EQ(other.sections.size(), 1u);
    EXPECT_EQ(other.documentType, "letter");
}
