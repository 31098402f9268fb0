#include <gtest/gtest.h>

#include "accesscondition.hpp"

using namespace ::testing;
using namespace ::ferry::location;

TEST(AccessConditionTest, NoneAlwaysSatisfied)
{
    auto c = AccessCondition::none();
    EXPECT_TRUE(c.is_none());
    EXPECT_TRUE(c.is_valid());
    EXPECT_TRUE(c.is_satisfied_by(false, ""));
    EXPECT_TRUE(c.is_satisfied_by(true, "abc"));
}

TEST(AccessConditionTest, DefaultIsNone)
{
    EXPECT_EQ(AccessCondition {}, AccessCondition::none());
}

TEST(AccessConditionTest, IfMatch)
{
    auto c = AccessCondition::if_match("abc");
    EXPECT_TRUE(c.is_valid());
    EXPECT_TRUE(c.is_satisfied_by(true, "abc"));
    EXPECT_FALSE(c.is_satisfied_by(true, "xyz"));
    EXPECT_FALSE(c.is_satisfied_by(false, ""));
}

TEST(AccessConditionTest, IfNoneMatch)
{
    auto c = AccessCondition::if_none_match("abc");
    EXPECT_TRUE(c.is_satisfied_by(true, "xyz"));
    EXPECT_TRUE(c.is_satisfied_by(false, ""));
    EXPECT_FALSE(c.is_satisfied_by(true, "abc"));
}

TEST(AccessConditionTest, Wildcard)
{
    auto match = AccessCondition::if_match(AccessCondition::any_fingerprint);
    EXPECT_TRUE(match.is_satisfied_by(true, "whatever"));
    EXPECT_FALSE(match.is_satisfied_by(false, ""));

    auto none_match = AccessCondition::if_none_match(AccessCondition::any_fingerprint);
    EXPECT_TRUE(none_match.is_satisfied_by(false, ""));
    EXPECT_FALSE(none_match.is_satisfied_by(true, "whatever"));
}

TEST(AccessConditionTest, ExistenceConditions)
{
    EXPECT_TRUE(AccessCondition::if_exists().is_satisfied_by(true, ""));
    EXPECT_FALSE(AccessCondition::if_exists().is_satisfied_by(false, ""));
    EXPECT_TRUE(AccessCondition::if_not_exists().is_satisfied_by(false, ""));
    EXPECT_FALSE(AccessCondition::if_not_exists().is_satisfied_by(true, "abc"));
}

TEST(AccessConditionTest, EmptyFingerprintIsInvalid)
{
    EXPECT_FALSE(AccessCondition::if_match("").is_valid());
    EXPECT_FALSE(AccessCondition::if_none_match("").is_valid());
    EXPECT_TRUE(AccessCondition::if_not_exists().is_valid());
}

TEST(AccessConditionTest, TypeNames)
{
    for (auto t : {AccessCondition::Type::NONE, AccessCondition::Type::IF_MATCH,
             AccessCondition::Type::IF_NONE_MATCH, AccessCondition::Type::IF_NOT_EXISTS,
             AccessCondition::Type::IF_EXISTS})
    {
        AccessCondition::Type parsed;
        ASSERT_TRUE(from_string(to_string(t), parsed));
        EXPECT_EQ(parsed, t);
    }

    AccessCondition::Type parsed;
    EXPECT_FALSE(from_string("if_modified_since", parsed));
    EXPECT_STREQ(to_string(AccessCondition::Type::IF_MATCH), "if_match");
}
