#include "tests/engine_test_common.h"
#include "doclayout/section/section_store.h"
#include "doclayout/selection/group_manager.h"

using namespace engine_test;

class GroupTest : public ::testing::Test {
protected:
    GroupTest() : store(config) {
        Section a = section("a", 3.5f);
        a.fields.push_back(FieldEntry{"f1", geom(0, 0)});
        a.fields.push_back(FieldEntry{"f2", geom(0, 40)});
        a.fields.push_back(FieldEntry{"f3", geom(0, 80)});
        Section b = section("b", 2.0f);
        b.fields.push_back(FieldEntry{"f1", geom(0, 0)});
        store.load({a, b});
    }

    const std::vector<FieldRef> three{{"f1", "a"}, {"f2", "a"}, {"f3", "a"}};

    EngineConfig config;
    SectionStore store;
    GroupManager groups;
};

TEST_F(GroupTest, GroupNeedsTwoMembers) {
    GroupId id = 0;
    EXPECT_EQ(groups.group({{"f1", "a"}}, id), EngineError::InsufficientSelection);
    EXPECT_EQ(groups.group({}, id), EngineError::InsufficientSelection);
    // Duplicates collapse before the size check.
    EXPECT_EQ(groups.group({{"f1", "a"}, {"f1", "a"}}, id), EngineError::InsufficientSelection);
    EXPECT_EQ(groups.groupCount(), 0u);
    EXPECT_EQ(groups.nextGroupId(), 1u);
}

TEST_F(GroupTest, GroupIdsIncreaseMonotonically) {
    GroupId first = 0;
    GroupId second = 0;
    ASSERT_EQ(groups.group({{"f1", "a"}, {"f2", "a"}}, first), EngineError::Ok);
    ASSERT_EQ(groups.group({{"f3", "a"}, {"f1", "b"}}, second), EngineError::Ok);
    EXPECT_LT(first, second);
    EXPECT_EQ(groups.groupOf({"f1", "b"}), second);
}

TEST_F(GroupTest, RegroupingMovesFieldOutOfPreviousGroup) {
    GroupId first = 0;
    GroupId second = 0;
    ASSERT_EQ(groups.group(three, first), EngineError::Ok);
    ASSERT_EQ(groups.group({{"f3", "a"}, {"f1", "b"}}, second), EngineError::Ok);

    EXPECT_EQ(groups.groupOf({"f3", "a"}), second);
    ASSERT_NE(groups.find(first), nullptr);
    EXPECT_EQ(groups.find(first)->members.size(), 2u);
}

TEST_F(GroupTest, UngroupOneOfThreeLeavesTwo) {
    GroupId id = 0;
    ASSERT_EQ(groups.group(three, id), EngineError::Ok);

    std::size_t removed = 0;
    ASSERT_EQ(groups.ungroup({{"f2", "a"}}, removed), EngineError::Ok);
    EXPECT_EQ(removed, 1u);
    const GroupRecord* rec = groups.find(id);
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->members, (std::vector<FieldRef>{{"f1", "a"}, {"f3", "a"}}));
}

TEST_F(GroupTest, UngroupAllMembersDeletesGroup) {
    GroupId id = 0;
    ASSERT_EQ(groups.group(three, id), EngineError::Ok);
    std::size_t removed = 0;
    ASSERT_EQ(groups.ungroup(three, removed), EngineError::Ok);
    EXPECT_EQ(removed, 3u);
    EXPECT_EQ(groups.find(id), nullptr);
    EXPECT_EQ(groups.groupCount(), 0u);
}

TEST_F(GroupTest, UngroupWithoutOverlapReportsNoGroupsAffected) {
    GroupId id = 0;
    ASSERT_EQ(groups.group({{"f1", "a"}, {"f2", "a"}}, id), EngineError::Ok);
    std::size_t removed = 0;
    EXPECT_EQ(groups.ungroup({{"f3", "a"}}, removed), EngineError::NoGroupsAffected);
    EXPECT_EQ(groups.ungroup({}, removed), EngineError::EmptySelection);
    EXPECT_EQ(groups.groupCount(), 1u);
}

TEST_F(GroupTest, SingleMemberGroupPersistsButIsNotRigid) {
    GroupId id = 0;
    ASSERT_EQ(groups.group({{"f1", "a"}, {"f2", "a"}}, id), EngineError::Ok);
    EXPECT_EQ(groups.rigidBodyOf({"f1", "a"}).size(), 2u);

    std::size_t removed = 0;
    ASSERT_EQ(groups.ungroup({{"f2", "a"}}, removed), EngineError::Ok);
    ASSERT_NE(groups.find(id), nullptr);
    EXPECT_EQ(groups.groupOf({"f1", "a"}), id);
    EXPECT_TRUE(groups.rigidBodyOf({"f1", "a"}).empty());
}

TEST_F(GroupTest, PruneFollowsDeletedFields) {
    GroupId id = 0;
    ASSERT_EQ(groups.group({{"f1", "a"}, {"f1", "b"}}, id), EngineError::Ok);

    store.deleteFields({{"f1", "b"}});
    EXPECT_TRUE(groups.prune(store));
    ASSERT_NE(groups.find(id), nullptr);
    EXPECT_EQ(groups.find(id)->members.size(), 1u);

    store.deleteFields({{"f1", "a"}});
    EXPECT_TRUE(groups.prune(store));
    EXPECT_EQ(groups.groupCount(), 0u);
    EXPECT_FALSE(groups.prune(store));
}

TEST_F(GroupTest, LoadSnapshotKeepsFirstMembershipAndAdvancesNextId) {
    groups.loadSnapshot({
        GroupRecord{4, {{"f1", "a"}, {"f2", "a"}}},
        GroupRecord{7, {{"f2", "a"}, {"f3", "a"}}},
    }, 2);

    EXPECT_EQ(groups.groupOf({"f2", "a"}), 4u);
    ASSERT_NE(groups.find(7), nullptr);
    EXPECT_EQ(groups.find(7)->members.size(), 1u);
    EXPECT_EQ(groups.nextGroupId(), 8u);
}
