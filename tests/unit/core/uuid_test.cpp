#include <gtest/gtest.h>

#include <cstddef>
#include <set>
#include <string>
#include <engram/core/uuid.h>

using namespace engram::core;

namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isLowerHex(char c) {
    return isAsciiDigit(c) || (c >= 'a' && c <= 'f');
}

} // namespace

TEST(GenerateIdTest, HasPrefixTimestampAndHexSuffix) {
    auto id = generateId("mu");
    ASSERT_GT(id.size(), 3u + 1u + 6u);
    EXPECT_EQ(id.rfind("mu-", 0), 0u);

    auto lastDash = id.rfind('-');
    ASSERT_NE(lastDash, std::string::npos);
    auto suffix = id.substr(lastDash + 1);
    ASSERT_EQ(suffix.size(), 6u);
    for (char c : suffix)
        EXPECT_TRUE(isLowerHex(c)) << id;

    auto millis = id.substr(3, lastDash - 3);
    ASSERT_FALSE(millis.empty());
    for (char c : millis)
        EXPECT_TRUE(isAsciiDigit(c)) << id;
}

TEST(GenerateIdTest, IdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(generateId("op"));
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(GenerateIdTest, PrefixIsKept) {
    EXPECT_EQ(generateId("ent").rfind("ent-", 0), 0u);
    EXPECT_EQ(generateId("op").rfind("op-", 0), 0u);
}
