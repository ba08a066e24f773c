#include <gtest/gtest.h>
#include "dym.hpp"

#include <string>
#include <vector>

TEST(DidYouMeanTest, EditDistance) {
    EXPECT_EQ(lev_edit_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(lev_edit_distance("", "abc"), 3u);
    EXPECT_EQ(lev_edit_distance("abc", ""), 3u);
    EXPECT_EQ(lev_edit_distance("same", "same"), 0u);
}

TEST(DidYouMeanTest, Similarity) {
    EXPECT_DOUBLE_EQ(similarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(similarity("abcd", "abcd"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("abcd", "wxyz"), 0.0);
    EXPECT_DOUBLE_EQ(similarity("abcd", "abce"), 0.75);
}

TEST(DidYouMeanTest, PicksClosestCandidate) {
    std::vector<std::string> names = {"build-tools;30.0.3", "platform-tools", "platforms;android-33"};
    EXPECT_EQ(did_you_mean("platform-tool", names), "platform-tools");
    EXPECT_EQ(did_you_mean("platforms;android-32", names), "platforms;android-33");
}

TEST(DidYouMeanTest, NoSuggestionWhenNothingIsClose) {
    std::vector<std::string> names = {"build-tools;30.0.3", "platform-tools"};
    EXPECT_FALSE(did_you_mean("xyz", names).has_value());
    EXPECT_FALSE(did_you_mean("anything", std::vector<std::string>{}).has_value());
}
