#include "tests/engine_test_common.h"

using namespace engine_test;

class TemplateEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine.loadTemplate(twoSectionTemplate());
    }

    std::string add(const std::string& sectionId, const std::string& base, float x, float y) {
        std::string key;
        EXPECT_EQ(engine.addFieldToSection(sectionId, base, geom(x, y), y, &key), EngineError::Ok);
        return key;
    }

    TemplateEngine engine;
};

TEST_F(TemplateEngineTest, AddFieldWithoutSectionsFails) {
    TemplateEngine empty;
    EXPECT_EQ(empty.addField("date", geom(0, 0)), EngineError::NoSections);
    EXPECT_EQ(empty.getLastError(), EngineError::NoSections);
    EXPECT_EQ(engine.addFieldToSection("missing", "date", geom(0, 0), std::nullopt), EngineError::SectionNotFound);
    EXPECT_EQ(engine.addFieldToSection("top", "", geom(0, 0), std::nullopt), EngineError::InvalidOperation);
}

TEST_F(TemplateEngineTest, AddFieldTargetsActiveSectionAndSelectsIt) {
    ASSERT_EQ(engine.setActiveSection("bottom"), EngineError::Ok);
    std::string key;
    ASSERT_EQ(engine.addField("date", geom(0, 0), &key), EngineError::Ok);
    EXPECT_EQ(key, "date");
    EXPECT_TRUE(engine.getSections()[0].fields.empty());
    EXPECT_TRUE(engine.isSelected("date", "bottom"));
    EXPECT_EQ(engine.getSelection().size(), 1u);
    EXPECT_EQ(engine.setActiveSection("nope"), EngineError::SectionNotFound);
}

TEST_F(TemplateEngineTest, RepeatedAddsYieldSequentialKeys) {
    std::vector<std::string> keys;
    for (int i = 0; i < 5; ++i) {
        std::string key;
        ASSERT_EQ(engine.addField("date", geom(0, 0), &key), EngineError::Ok);
        keys.push_back(key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"date", "date-1", "date-2", "date-3", "date-4"}));
}

TEST_F(TemplateEngineTest, AddCatalogFieldSeedsGeometry) {
    std::string key;
    ASSERT_EQ(engine.addCatalogField("horizontalLine", &key), EngineError::Ok);
    const Geometry* g = engine.getField({key, "top"});
    ASSERT_NE(g, nullptr);
    EXPECT_FLOAT_EQ(g->width, 400.0f);
    EXPECT_FLOAT_EQ(g->height, 1.0f);
    EXPECT_FLOAT_EQ(g->y, 40.0f);
    EXPECT_EQ(engine.addCatalogField("notInCatalog"), EngineError::FieldNotFound);
}

TEST_F(TemplateEngineTest, MoveUngroupedFieldMovesOnlyThatField) {
    add("top", "a", 10, 10);
    add("top", "b", 50, 50);
    ASSERT_EQ(engine.moveField("a", "top", 20, 30), EngineError::Ok);
    EXPECT_FLOAT_EQ(engine.getField({"a", "top"})->x, 20.0f);
    EXPECT_FLOAT_EQ(engine.getField({"a", "top"})->y, 30.0f);
    EXPECT_FLOAT_EQ(engine.getField({"b", "top"})->x, 50.0f);
    EXPECT_FLOAT_EQ(engine.getField({"b", "top"})->y, 50.0f);
}

TEST_F(TemplateEngineTest, MoveGroupedFieldTranslatesWholeGroupAcrossSections) {
    add("top", "a", 10, 10);
    add("bottom", "b", 100, 5);
    add("top", "c", 0, 0);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "bottom"}}), EngineError::Ok);
    ASSERT_EQ(engine.groupSelection(), EngineError::Ok);

    ASSERT_EQ(engine.moveField("a", "top", 25, 0), EngineError::Ok);
    EXPECT_FLOAT_EQ(engine.getField({"a", "top"})->x, 25.0f);
    EXPECT_FLOAT_EQ(engine.getField({"a", "top"})->y, 0.0f);
    EXPECT_FLOAT_EQ(engine.getField({"b", "bottom"})->x, 115.0f);
    EXPECT_FLOAT_EQ(engine.getField({"b", "bottom"})->y, -5.0f);
    EXPECT_FLOAT_EQ(engine.getField({"c", "top"})->x, 0.0f);
}

TEST_F(TemplateEngineTest, MoveMissingFieldFailsWithoutSideEffects) {
    const std::uint32_t gen = engine.getGeneration();
    EXPECT_EQ(engine.moveField("ghost", "top", 1, 1), EngineError::FieldNotFound);
    EXPECT_EQ(engine.getGeneration(), gen);
}

TEST_F(TemplateEngineTest, ResizeClampsAndOptionallyRepositions) {
    add("top", "box", 10, 10);
    ASSERT_EQ(engine.resizeField("box", "top", 5, 5), EngineError::Ok);
    EXPECT_FLOAT_EQ(engine.getField({"box", "top"})->width, 20.0f);
    EXPECT_FLOAT_EQ(engine.getField({"box", "top"})->height, 20.0f);

    ASSERT_EQ(engine.resizeField("box", "top", 60, 40, 1.0f, 2.0f), EngineError::Ok);
    const Geometry* g = engine.getField({"box", "top"});
    EXPECT_FLOAT_EQ(g->width, 60.0f);
    EXPECT_FLOAT_EQ(g->x, 1.0f);
    EXPECT_FLOAT_EQ(g->y, 2.0f);
    EXPECT_EQ(engine.resizeField("ghost", "top", 60, 40), EngineError::FieldNotFound);
}

TEST_F(TemplateEngineTest, GroupWithOneSelectedFails) {
    add("top", "a", 0, 0);
    EXPECT_EQ(engine.groupSelection(), EngineError::InsufficientSelection);
    EXPECT_TRUE(engine.getGroups().empty());
}

TEST_F(TemplateEngineTest, UngroupPrunesOrDeletes) {
    add("top", "a", 0, 0);
    add("top", "b", 0, 40);
    add("top", "c", 0, 80);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "top"}, {"c", "top"}}), EngineError::Ok);
    GroupId id = 0;
    ASSERT_EQ(engine.groupSelection(&id), EngineError::Ok);

    ASSERT_EQ(engine.select(std::string("b"), "top", false), EngineError::Ok);
    std::size_t ungrouped = 0;
    ASSERT_EQ(engine.ungroupSelection(&ungrouped), EngineError::Ok);
    EXPECT_EQ(ungrouped, 1u);
    ASSERT_EQ(engine.getGroups().size(), 1u);
    EXPECT_EQ(engine.getGroups()[0].members.size(), 2u);
    EXPECT_FALSE(engine.isFieldInGroup("b", "top"));

    EXPECT_EQ(engine.ungroupSelection(), EngineError::NoGroupsAffected);

    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"c", "top"}}), EngineError::Ok);
    ASSERT_EQ(engine.ungroupSelection(), EngineError::Ok);
    EXPECT_TRUE(engine.getGroups().empty());
}

TEST_F(TemplateEngineTest, DeletingFieldShrinksGroupAndSelection) {
    add("top", "a", 0, 0);
    add("top", "b", 0, 40);
    add("bottom", "c", 0, 0);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "top"}, {"c", "bottom"}}), EngineError::Ok);
    ASSERT_EQ(engine.groupSelection(), EngineError::Ok);

    ASSERT_EQ(engine.deleteField("c"), EngineError::Ok);
    EXPECT_EQ(engine.getSelection().size(), 2u);
    ASSERT_EQ(engine.getGroups().size(), 1u);
    EXPECT_EQ(engine.getGroups()[0].members.size(), 2u);

    ASSERT_EQ(engine.deleteSelection(), EngineError::Ok);
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_TRUE(engine.getGroups().empty());
    EXPECT_EQ(engine.deleteSelection(), EngineError::NoTargets);
    EXPECT_EQ(engine.deleteFields({}), EngineError::NoTargets);
    EXPECT_EQ(engine.deleteField("ghost"), EngineError::FieldNotFound);
}

TEST_F(TemplateEngineTest, SelectToggleAndClear) {
    add("top", "a", 0, 0);
    add("top", "b", 0, 40);
    ASSERT_EQ(engine.select(std::string("a"), "top", true), EngineError::Ok);
    EXPECT_EQ(engine.getSelection().size(), 2u);
    ASSERT_EQ(engine.select(std::string("b"), "top", true), EngineError::Ok);
    EXPECT_EQ(engine.getSelection().size(), 1u);
    ASSERT_EQ(engine.select(std::nullopt, "", false), EngineError::Ok);
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_EQ(engine.select(std::string("ghost"), "top", false), EngineError::FieldNotFound);
}

TEST_F(TemplateEngineTest, CopyPasteIntoSameSectionProducesFreshKeyAndSameStyle) {
    Geometry styled = geom(30, 60, 150, 25);
    styled.fontSize = 16.0f;
    styled.fontFamily = "Times";
    styled.alignment = Alignment::Center;
    ASSERT_EQ(engine.addFieldToSection("top", "payeeName", styled, std::nullopt), EngineError::Ok);

    ASSERT_EQ(engine.copySelection(), EngineError::Ok);
    std::vector<std::string> keys;
    ASSERT_EQ(engine.pasteInto(std::string("top"), &keys), EngineError::Ok);
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_NE(keys[0], "payeeName");

    const Geometry* src = engine.getField({"payeeName", "top"});
    const Geometry* dst = engine.getField({keys[0], "top"});
    ASSERT_NE(dst, nullptr);
    EXPECT_FLOAT_EQ(dst->fontSize, src->fontSize);
    EXPECT_EQ(dst->fontFamily, src->fontFamily);
    EXPECT_EQ(dst->alignment, src->alignment);
    EXPECT_EQ(engine.getClipboard().size(), 1u);
}

TEST_F(TemplateEngineTest, ClipboardErrors) {
    EXPECT_EQ(engine.copySelection(), EngineError::EmptySelection);
    EXPECT_EQ(engine.copyAllFromSection("top"), EngineError::EmptySection);
    EXPECT_EQ(engine.paste(), EngineError::EmptyClipboard);

    add("top", "a", 0, 0);
    ASSERT_EQ(engine.copyAllFromSection("top"), EngineError::Ok);
    EXPECT_EQ(engine.pasteInto(std::nullopt), EngineError::NoActiveSection);
    EXPECT_EQ(engine.pasteInto(std::string("zzz")), EngineError::SectionNotFound);
}

TEST_F(TemplateEngineTest, ClearSectionOnEmptySectionSucceeds) {
    EXPECT_EQ(engine.clearSection("bottom"), EngineError::Ok);
    EXPECT_EQ(engine.clearSection("zzz"), EngineError::SectionNotFound);
}

TEST_F(TemplateEngineTest, ClearSectionPrunesSelection) {
    add("top", "a", 0, 0);
    add("bottom", "b", 0, 0);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "bottom"}}), EngineError::Ok);
    ASSERT_EQ(engine.clearSection("top"), EngineError::Ok);
    ASSERT_EQ(engine.getSelection().size(), 1u);
    EXPECT_EQ(engine.getSelection()[0], (FieldRef{"b", "bottom"}));
}

TEST_F(TemplateEngineTest, ClearAllEmptiesSectionsAndClipboard) {
    add("top", "a", 0, 0);
    add("bottom", "b", 0, 0);
    ASSERT_EQ(engine.copyAllFromSection("top"), EngineError::Ok);
    ASSERT_EQ(engine.clearAllSections(), EngineError::Ok);
    for (const auto& s : engine.getSections()) EXPECT_TRUE(s.fields.empty());
    EXPECT_TRUE(engine.getClipboard().empty());
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_EQ(engine.clearAllSections(), EngineError::Ok);
}

TEST_F(TemplateEngineTest, UpdateSelectedAppliesPatchToEverySelectedField) {
    add("top", "a", 0, 0);
    add("bottom", "b", 0, 0);
    GeometryPatch patch;
    EXPECT_EQ(engine.updateSelectedFields(patch), EngineError::Ok);

    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "bottom"}}), EngineError::Ok);
    patch.fontFamily = std::string("Courier");
    patch.textContent = std::string("VOID");
    ASSERT_EQ(engine.updateSelectedFields(patch), EngineError::Ok);
    EXPECT_EQ(engine.getField({"a", "top"})->fontFamily, "Courier");
    EXPECT_EQ(engine.getField({"b", "bottom"})->textContent, std::optional<std::string>("VOID"));

    ASSERT_EQ(engine.select(std::nullopt, "", false), EngineError::Ok);
    EXPECT_EQ(engine.updateSelectedFields(patch), EngineError::EmptySelection);
}

TEST_F(TemplateEngineTest, SelectedFieldDetailsUsesCatalogLabel) {
    EXPECT_FALSE(engine.selectedFieldDetails().has_value());
    add("top", "payeeName", 0, 0);
    add("top", "payeeName", 0, 40);

    const auto details = engine.selectedFieldDetails();
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->ref, (FieldRef{"payeeName-1", "top"}));
    EXPECT_EQ(details->baseIdentity, "payeeName");
    EXPECT_EQ(details->label, "Pay to the Order of");
    EXPECT_FALSE(details->groupId.has_value());
}

TEST_F(TemplateEngineTest, CompileMatchesDocumentState) {
    add("top", "date", 10, 10);
    add("bottom", "memo", 0, 5);
    const CompiledLayout layout = engine.compile();
    ASSERT_EQ(layout.fields.size(), 2u);
    EXPECT_FLOAT_EQ(layout.fields[1].absoluteY, 257.0f);
    EXPECT_EQ(layout.fields[0].label, "Date");
    EXPECT_FLOAT_EQ(layout.totalHeight, 396.0f);
}

TEST_F(TemplateEngineTest, LoadTemplateResetsTransientState) {
    add("top", "a", 0, 0);
    add("top", "b", 0, 40);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "top"}}), EngineError::Ok);
    ASSERT_EQ(engine.groupSelection(), EngineError::Ok);
    ASSERT_EQ(engine.copySelection(), EngineError::Ok);

    engine.loadTemplate(engine.toTemplate());
    EXPECT_TRUE(engine.getSelection().empty());
    EXPECT_TRUE(engine.getGroups().empty());
    EXPECT_TRUE(engine.getClipboard().empty());
    EXPECT_EQ(engine.getSections()[0].fields.size(), 2u);
}

TEST_F(TemplateEngineTest, ReplaceSectionsKeepsResolvableSelection) {
    add("top", "a", 0, 0);
    add("top", "b", 0, 40);
    ASSERT_EQ(engine.setSelection({{"a", "top"}, {"b", "top"}}), EngineError::Ok);

    std::vector<Section> confirmed = engine.getSections();
    confirmed[0].fields.erase(confirmed[0].fields.begin());
    engine.replaceSections(confirmed);

    ASSERT_EQ(engine.getSelection().size(), 1u);
    EXPECT_TRUE(engine.isSelected("b", "top"));
}

TEST_F(TemplateEngineTest, GenerationAdvancesOnlyOnSuccess) {
    const std::uint32_t start = engine.getGeneration();
    add("top", "a", 0, 0);
    EXPECT_EQ(engine.getGeneration(), start + 1);
    EXPECT_EQ(engine.clearSection("zzz"), EngineError::SectionNotFound);
    EXPECT_EQ(engine.getGeneration(), start + 1);
    EXPECT_EQ(TemplateEngineTestAccessor::lastError(engine), EngineError::SectionNotFound);
}
