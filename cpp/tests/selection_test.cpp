#include "tests/engine_test_common.h"
#include "doclayout/section/section_store.h"
#include "doclayout/selection/selection_manager.h"

using namespace engine_test;

class SelectionTest : public ::testing::Test {
protected:
    SelectionTest() : store(config), selection(store) {
        Section a = section("a", 3.5f);
        a.fields.push_back(FieldEntry{"date", geom(0, 0)});
        a.fields.push_back(FieldEntry{"memo", geom(0, 40)});
        Section b = section("b", 2.0f);
        b.fields.push_back(FieldEntry{"date", geom(0, 0)});
        store.load({a, b});
    }

    EngineConfig config;
    SectionStore store;
    SelectionManager selection;
};

TEST_F(SelectionTest, PlainSelectReplacesSelection) {
    EXPECT_TRUE(selection.select(std::string("date"), "a", false));
    EXPECT_TRUE(selection.select(std::string("memo"), "a", false));
    ASSERT_EQ(selection.size(), 1u);
    EXPECT_TRUE(selection.isSelected({"memo", "a"}));
}

TEST_F(SelectionTest, MultiSelectToggles) {
    selection.select(std::string("date"), "a", true);
    selection.select(std::string("date"), "b", true);
    EXPECT_EQ(selection.size(), 2u);

    selection.select(std::string("date"), "a", true);
    EXPECT_EQ(selection.size(), 1u);
    EXPECT_FALSE(selection.isSelected({"date", "a"}));
    EXPECT_TRUE(selection.isSelected({"date", "b"}));
}

TEST_F(SelectionTest, SameKeyInDifferentSectionsIsDistinct) {
    selection.select(std::string("date"), "a", true);
    EXPECT_FALSE(selection.isSelected({"date", "b"}));
}

TEST_F(SelectionTest, NoFieldClearsEverything) {
    selection.select(std::string("date"), "a", true);
    selection.select(std::string("memo"), "a", true);
    EXPECT_TRUE(selection.select(std::nullopt, "", false));
    EXPECT_TRUE(selection.isEmpty());
    EXPECT_FALSE(selection.select(std::nullopt, "", false));
}

TEST_F(SelectionTest, OrderFollowsInsertion) {
    selection.select(std::string("memo"), "a", true);
    selection.select(std::string("date"), "b", true);
    selection.select(std::string("date"), "a", true);
    const auto& ordered = selection.getOrdered();
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0], (FieldRef{"memo", "a"}));
    EXPECT_EQ(ordered[1], (FieldRef{"date", "b"}));
    EXPECT_EQ(ordered[2], (FieldRef{"date", "a"}));
}

TEST_F(SelectionTest, UnknownFieldIsIgnored) {
    EXPECT_FALSE(selection.select(std::string("ghost"), "a", false));
    EXPECT_TRUE(selection.isEmpty());
}

TEST_F(SelectionTest, PruneDropsDeletedFields) {
    selection.setSelection({{"date", "a"}, {"memo", "a"}, {"date", "b"}});
    const std::uint32_t gen = selection.getGeneration();

    store.deleteFields({{"memo", "a"}});
    EXPECT_TRUE(selection.prune());
    EXPECT_EQ(selection.size(), 2u);
    EXPECT_FALSE(selection.isSelected({"memo", "a"}));
    EXPECT_GT(selection.getGeneration(), gen);

    EXPECT_FALSE(selection.prune());
}

TEST_F(SelectionTest, SetSelectionSkipsMissingAndDuplicateRefs) {
    EXPECT_TRUE(selection.setSelection({{"date", "a"}, {"date", "a"}, {"ghost", "a"}}));
    EXPECT_EQ(selection.size(), 1u);
    EXPECT_FALSE(selection.setSelection({{"date", "a"}}));
}
