#include <gtest/gtest.h>

#include "skymesh/selection.hpp"

using namespace skymesh;

using Indices = std::vector<size_t>;

TEST(SelectionTest, RangesAndSingles) {
    auto s = parse_selection("1-3, 5", 6);
    EXPECT_FALSE(s.quit);
    EXPECT_EQ(s.indices, (Indices{0, 1, 2, 4}));
    EXPECT_TRUE(s.rejected.empty());
}

TEST(SelectionTest, CommaAndSpaceSeparators) {
    EXPECT_EQ(parse_selection("1,2,3", 3).indices, (Indices{0, 1, 2}));
    EXPECT_EQ(parse_selection("3 1  2", 3).indices, (Indices{0, 1, 2}));
}

TEST(SelectionTest, AllIsCaseInsensitive) {
    EXPECT_EQ(parse_selection("all", 3).indices, (Indices{0, 1, 2}));
    EXPECT_EQ(parse_selection(" ALL ", 2).indices, (Indices{0, 1}));
}

TEST(SelectionTest, QuitIsCaseInsensitive) {
    EXPECT_TRUE(parse_selection("q", 4).quit);
    EXPECT_TRUE(parse_selection(" Q\n", 4).quit);
}

TEST(SelectionTest, QuitOnlyCountsAlone) {
    auto s = parse_selection("q 1", 4);
    EXPECT_FALSE(s.quit);
    EXPECT_EQ(s.indices, (Indices{0}));
    EXPECT_EQ(s.rejected, (std::vector<std::string>{"q"}));
}

TEST(SelectionTest, OutOfRangeTokensAreRejected) {
    auto s = parse_selection("0 7 x 2", 6);
    EXPECT_EQ(s.indices, (Indices{1}));
    EXPECT_EQ(s.rejected, (std::vector<std::string>{"0", "7", "x"}));
}

TEST(SelectionTest, ReversedRangeIsRejected) {
    auto s = parse_selection("3-1", 5);
    EXPECT_TRUE(s.indices.empty());
    EXPECT_EQ(s.rejected, (std::vector<std::string>{"3-1"}));
}

TEST(SelectionTest, DuplicatesAreMerged) {
    EXPECT_EQ(parse_selection("1 1-2", 4).indices, (Indices{0, 1}));
}

TEST(SelectionTest, EmptyInputSelectsNothing) {
    auto s = parse_selection("   ", 4);
    EXPECT_FALSE(s.quit);
    EXPECT_TRUE(s.indices.empty());
    EXPECT_TRUE(s.rejected.empty());
}
