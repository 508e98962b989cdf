#include <gtest/gtest.h>
#include "doclayout/section/key_allocator.h"

namespace {

Section sectionWithKeys(std::initializer_list<const char*> keys) {
    Section s{"s", "S", 1.0f, {}};
    for (const char* k : keys) s.fields.push_back(FieldEntry{k, Geometry{}});
    return s;
}

} // namespace

TEST(KeyAllocatorTest, BaseIdentityStripsCounterSuffix) {
    EXPECT_EQ(doclayout::baseIdentity("date"), "date");
    EXPECT_EQ(doclayout::baseIdentity("date-1"), "date");
    EXPECT_EQ(doclayout::baseIdentity("date-12"), "date");
    EXPECT_EQ(doclayout::baseIdentity("amount-words"), "amount-words");
    EXPECT_EQ(doclayout::baseIdentity("date-"), "date-");
    EXPECT_EQ(doclayout::baseIdentity("-5"), "-5");
}

TEST(KeyAllocatorTest, ParseFieldKeyReportsCounter) {
    const auto bare = doclayout::parseFieldKey("memo");
    EXPECT_EQ(bare.base, "memo");
    EXPECT_EQ(bare.counter, 0u);

    const auto dup = doclayout::parseFieldKey("memo-7");
    EXPECT_EQ(dup.base, "memo");
    EXPECT_EQ(dup.counter, 7u);
    EXPECT_EQ(dup.str(), "memo-7");
}

TEST(KeyAllocatorTest, FreshBaseKeyIsReturnedUnchanged) {
    const Section s = sectionWithKeys({"memo", "payeeName"});
    EXPECT_EQ(doclayout::allocateFieldKey(s, "date"), "date");
}

TEST(KeyAllocatorTest, CollidingBaseKeyUsesMaxCounterPlusOne) {
    EXPECT_EQ(doclayout::allocateFieldKey(sectionWithKeys({"date"}), "date"), "date-1");
    EXPECT_EQ(doclayout::allocateFieldKey(sectionWithKeys({"date", "date-1"}), "date"), "date-2");
    // Gaps are not reused.
    EXPECT_EQ(doclayout::allocateFieldKey(sectionWithKeys({"date", "date-5"}), "date"), "date-6");
    // Only the suffixed form left; the bare key still collides by identity.
    EXPECT_EQ(doclayout::allocateFieldKey(sectionWithKeys({"date-3"}), "date"), "date-4");
}

TEST(KeyAllocatorTest, AllocatedKeyDecodesToRequestedBase) {
    Section s = sectionWithKeys({});
    for (int i = 0; i < 5; ++i) {
        const std::string key = doclayout::allocateFieldKey(s, "signature");
        EXPECT_EQ(doclayout::baseIdentity(key), "signature");
        s.fields.push_back(FieldEntry{key, Geometry{}});
    }
    EXPECT_EQ(s.fields.back().key, "signature-4");
}

TEST(KeyAllocatorTest, DigitSuffixedBaseNeverReusesExistingKey) {
    // "line-2" decodes as {line, 2}; inserting it again must still yield a new key.
    const Section s = sectionWithKeys({"line-2"});
    const std::string key = doclayout::allocateFieldKey(s, "line-2");
    EXPECT_NE(key, "line-2");
    EXPECT_FALSE(s.hasField(key));
}

TEST(KeyAllocatorTest, SaturatedCounterFallsBackToLowestFreeSuffix) {
    // Longer digit runs saturate to the same counter as the exact maximum.
    EXPECT_EQ(doclayout::parseFieldKey("date-99999999999999999999").counter,
              ~static_cast<std::uint64_t>(0));

    Section s = sectionWithKeys({"date-18446744073709551615"});
    const std::string first = doclayout::allocateFieldKey(s, "date");
    EXPECT_EQ(first, "date-1");
    s.fields.push_back(FieldEntry{first, Geometry{}});

    const std::string second = doclayout::allocateFieldKey(s, "date");
    EXPECT_EQ(second, "date-2");
    EXPECT_FALSE(s.hasField(second));
}
