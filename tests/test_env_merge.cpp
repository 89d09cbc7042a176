/**
 * @file test_env_merge.cpp
 * @brief Tests for env override merging using Google Test
 */

#include <gtest/gtest.h>
#include "stackport/EnvMerge.hpp"

using namespace stackport;

using Env = std::vector<StackEnvVar>;

// ============================================================================
// Identity
// ============================================================================

TEST(MergeEnvOverrides, EmptyOverridesReturnExistingUnchanged) {
    Env existing = {{"A", "1"}, {"B", "2"}, {"A", "dup"}};
    EXPECT_EQ(merge_env_overrides(existing, {}), existing);
}

TEST(MergeEnvOverrides, BothEmpty) {
    EXPECT_TRUE(merge_env_overrides({}, {}).empty());
}

TEST(MergeEnvOverrides, OnlyEmptyNamedOverridesKeepExisting) {
    Env existing = {{"A", "1"}};
    EXPECT_EQ(merge_env_overrides(existing, {{"", "x"}, {"", "y"}}), existing);
}

// ============================================================================
// Replace and append
// ============================================================================

TEST(MergeEnvOverrides, ReplacesExistingAndAppendsNew) {
    Env existing = {{"A", "1"}, {"B", "2"}};
    Env overrides = {{"B", "9"}, {"C", "3"}};

    Env expected = {{"A", "1"}, {"B", "9"}, {"C", "3"}};
    EXPECT_EQ(merge_env_overrides(existing, overrides), expected);
}

TEST(MergeEnvOverrides, ExistingOrderIsPreserved) {
    Env existing = {{"Z", "z"}, {"M", "m"}, {"A", "a"}};
    Env overrides = {{"A", "new"}, {"Z", "new"}};

    auto merged = merge_env_overrides(existing, overrides);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0], (StackEnvVar{"Z", "new"}));
    EXPECT_EQ(merged[1], (StackEnvVar{"M", "m"}));
    EXPECT_EQ(merged[2], (StackEnvVar{"A", "new"}));
}

TEST(MergeEnvOverrides, NewNamesAppendedInFirstSeenOrder) {
    Env existing = {{"A", "1"}};
    Env overrides = {{"Y", "1"}, {"X", "2"}, {"Y", "3"}};

    Env expected = {{"A", "1"}, {"Y", "3"}, {"X", "2"}};
    EXPECT_EQ(merge_env_overrides(existing, overrides), expected);
}

TEST(MergeEnvOverrides, LastValueWinsForRepeatedOverride) {
    Env existing = {{"TOKEN", "old"}};
    Env overrides = {{"TOKEN", "first"}, {"TOKEN", "second"}};

    Env expected = {{"TOKEN", "second"}};
    EXPECT_EQ(merge_env_overrides(existing, overrides), expected);
}

TEST(MergeEnvOverrides, EmptyNamedOverridesAreIgnored) {
    Env existing = {{"A", "1"}};
    Env overrides = {{"", "ignored"}, {"B", "2"}};

    Env expected = {{"A", "1"}, {"B", "2"}};
    EXPECT_EQ(merge_env_overrides(existing, overrides), expected);
}

TEST(MergeEnvOverrides, UnrelatedOverrideDropsNothing) {
    Env existing = {{"DYNU_TOKEN", "token"}, {"TELEGRAM_TOKEN", "telegram"}};
    auto merged = merge_env_overrides(existing, {{"NEW", "v"}});

    ASSERT_EQ(merged.size(), existing.size() + 1);
    EXPECT_EQ(merged[0], existing[0]);
    EXPECT_EQ(merged[1], existing[1]);
    EXPECT_EQ(merged[2], (StackEnvVar{"NEW", "v"}));
}

TEST(MergeEnvOverrides, ResultSizeIsExistingPlusNewNames) {
    Env existing = {{"A", "1"}, {"B", "2"}, {"C", "3"}};
    Env overrides = {{"B", "x"}, {"D", "4"}, {"E", "5"}, {"D", "6"}};

    auto merged = merge_env_overrides(existing, overrides);
    EXPECT_EQ(merged.size(), existing.size() + 2);
}

TEST(MergeEnvOverrides, IsDeterministic) {
    Env existing = {{"A", "1"}, {"B", "2"}};
    Env overrides = {{"C", "3"}, {"A", "0"}};
    EXPECT_EQ(merge_env_overrides(existing, overrides), merge_env_overrides(existing, overrides));
}

// ============================================================================
// Name listing
// ============================================================================

TEST(UniqueEnvNames, SkipsBlanksAndRepeats) {
    Env env = {{"A", "1"}, {"", "x"}, {"B", "2"}, {"A", "3"}, {"C", ""}};

    std::vector<std::string> expected = {"A", "B", "C"};
    EXPECT_EQ(unique_env_names(env), expected);
}

TEST(UniqueEnvNames, EmptyEnv) {
    EXPECT_TRUE(unique_env_names({}).empty());
}
