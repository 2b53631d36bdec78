#include "version.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using Quiver::Selector;

TEST(VersionTest, ParseVersionStripsPrefixAndSuffixes) {
    EXPECT_EQ(Quiver::parseVersion("v1.2.3"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(Quiver::parseVersion("2.0.0-beta"), (std::vector<int>{2, 0, 0}));
}

TEST(VersionTest, OversizedComponentsSaturate) {
    std::vector<int> parts;
    EXPECT_NO_THROW(parts = Quiver::parseVersion("1.99999999999.0"));
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], 1);
    EXPECT_GT(parts[1], 0);
    EXPECT_EQ(Quiver::compareVersionSemantics("1.99999999999.0", "1.2.0"), 1);
    EXPECT_TRUE(Selector("^1.0.0")("1.99999999999.0"));
    EXPECT_NO_THROW(Selector("^99999999999999"));
}

TEST(VersionTest, CompareTreatsMissingComponentsAsZero) {
    EXPECT_EQ(Quiver::compareVersionSemantics("1.0", "1.0.0"), 0);
    EXPECT_EQ(Quiver::compareVersionSemantics("1.10.0", "1.9.9"), 1);
    EXPECT_EQ(Quiver::compareVersionSemantics("0.9", "1"), -1);
    EXPECT_TRUE(Quiver::compareVersions("1.2.0", "1.2", ">="));
    EXPECT_FALSE(Quiver::compareVersions("1.2.0", "1.2", "!="));
}

TEST(SelectorTest, EmptyStarAndLatestMatchAnything) {
    EXPECT_TRUE(Selector("").isAny());
    EXPECT_TRUE(Selector("*").isAny());
    EXPECT_TRUE(Selector("latest").isAny());
    EXPECT_TRUE(Selector("*")("0.0.1"));
    EXPECT_EQ(Selector().toString(), "*");
}

TEST(SelectorTest, CaretAllowsUpdatesBelowNextMajor) {
    Selector caret("^1.0.0");
    EXPECT_TRUE(caret("1.0.0"));
    EXPECT_TRUE(caret("1.2.0"));
    EXPECT_FALSE(caret("2.0.0"));
    EXPECT_FALSE(caret("0.9.0"));

    Selector zeroMajor("^0.3.1");
    EXPECT_TRUE(zeroMajor("0.3.9"));
    EXPECT_FALSE(zeroMajor("0.4.0"));
}

TEST(SelectorTest, TildeAllowsPatchUpdates) {
    Selector tilde("~1.2.0");
    EXPECT_TRUE(tilde("1.2.7"));
    EXPECT_FALSE(tilde("1.3.0"));
    EXPECT_EQ(tilde.toString(), "~1.2.0");
}

TEST(SelectorTest, ClausesCombineWithSpaces) {
    Selector range(">= 1.0 <2.0");
    EXPECT_TRUE(range("1.5"));
    EXPECT_FALSE(range("2.0"));
    EXPECT_FALSE(range("0.5"));

    Selector exact("1.4.2");
    EXPECT_TRUE(exact("1.4.2"));
    EXPECT_FALSE(exact("1.4.3"));
}

TEST(SelectorTest, GarbageIsRejected) {
    EXPECT_THROW(Selector("not-a-version"), std::invalid_argument);
    EXPECT_THROW(Selector(">=x"), std::invalid_argument);
}
