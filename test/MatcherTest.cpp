// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "Matcher.h"
#include "Lexicon.h"
#include "WordList.h"
#include "gtest/gtest.h"
#include <string>
#include <vector>

using namespace braillefix;

namespace {

using Words = std::vector<std::string>;

class MatcherTest : public ::testing::Test {
protected:
    Lexicon lexicon;
    Matcher matcher{lexicon};

    void SetUp() override
    {
        for (auto & word : GetBuiltinWords()) {
            lexicon.AddWord(word);
        }
    }
};

// ============================================================================
// EDIT DISTANCE
// ============================================================================

TEST(EditDistanceTest, Levenshtein)
{
    EXPECT_EQ(0, EditDistance("same", "same"));
    EXPECT_EQ(3, EditDistance("kitten", "sitting"));
    EXPECT_EQ(2, EditDistance("flaw", "lawn"));
    EXPECT_EQ(1, EditDistance("helo", "hello"));
    EXPECT_EQ(2, EditDistance("wrold", "world"));
    EXPECT_EQ(3, EditDistance("", "abc"));
    EXPECT_EQ(3, EditDistance("abc", ""));
    EXPECT_EQ(0, EditDistance("", ""));
}

TEST(EditDistanceTest, Symmetric)
{
    EXPECT_EQ(EditDistance("computr", "computer"), EditDistance("computer", "computr"));
    EXPECT_EQ(EditDistance("quck", "quick"), EditDistance("quick", "quck"));
}

TEST(EditDistanceTest, MaxDistanceGrowsWithLength)
{
    EXPECT_EQ(1, MaxDistanceFor(0));
    EXPECT_EQ(1, MaxDistanceFor(1));
    EXPECT_EQ(2, MaxDistanceFor(2));
    EXPECT_EQ(2, MaxDistanceFor(3));
    EXPECT_EQ(3, MaxDistanceFor(4));
    EXPECT_EQ(3, MaxDistanceFor(20));
}

// ============================================================================
// SUGGESTIONS
// ============================================================================

TEST_F(MatcherTest, ExactMatchShortCircuits)
{
    EXPECT_EQ(Words{"the"}, matcher.Suggest("the", 1));
    EXPECT_EQ(Words{"the"}, matcher.Suggest("the", 5));
    EXPECT_EQ(Words{"the"}, matcher.Suggest("THE", 3));
}

TEST_F(MatcherTest, ExactMatchRanksFirst)
{
    auto ranked = matcher.Rank("hello");
    ASSERT_EQ(1u, ranked.size());
    EXPECT_EQ("hello", ranked.front().word);
    EXPECT_EQ(0, ranked.front().distance);
}

TEST_F(MatcherTest, LearnedFixTakesPrecedence)
{
    ASSERT_FALSE(matcher.Suggest("teh").empty());
    EXPECT_EQ("tell", matcher.Suggest("teh").front());

    lexicon.LearnCorrection("teh", "the");
    EXPECT_EQ(Words{"the"}, matcher.Suggest("teh", 5));
    EXPECT_EQ(Words{"the"}, matcher.Suggest("Teh", 1));
}

TEST_F(MatcherTest, LearnedFixForHelo)
{
    lexicon.LearnCorrection("helo", "hello");
    EXPECT_EQ(Words{"hello"}, matcher.Suggest("helo", 5));
}

TEST_F(MatcherTest, SuggestCloseWords)
{
    EXPECT_EQ("hello", matcher.Suggest("helo").front());
    EXPECT_EQ("hello", matcher.Suggest("HELO").front());
    EXPECT_EQ("computer", matcher.Suggest("computr").front());
    EXPECT_EQ("system", matcher.Suggest("sytem").front());
    EXPECT_EQ("the", matcher.Suggest("thr").front());
}

TEST_F(MatcherTest, SuggestionCountIsLimited)
{
    EXPECT_EQ(5u, matcher.Suggest("helo").size());
    EXPECT_EQ(2u, matcher.Suggest("helo", 2).size());
    EXPECT_EQ(Words{"hello"}, matcher.Suggest("helo", 1));
    EXPECT_TRUE(matcher.Suggest("helo", 0).empty());
}

TEST_F(MatcherTest, EqualScoresAreOrderedByWord)
{
    const Words expected = {"hello", "her", "here", "tell", "well"};
    EXPECT_EQ(expected, matcher.Suggest("helo", 5));
}

TEST_F(MatcherTest, NoCandidateWithinDistance)
{
    EXPECT_TRUE(matcher.Suggest("b").empty());
    EXPECT_TRUE(matcher.Suggest("zzzzzzzz").empty());
}

TEST_F(MatcherTest, CandidatesNeverExceedMaxDistance)
{
    for (auto query : {"helo", "wrold", "computr", "quck", "xyzzy", "b", "ab", "hel", "brwn", "keybord"}) {
        const auto maxDistance = MaxDistanceFor(std::string(query).size());
        for (auto & suggestion : matcher.Rank(query, 100)) {
            EXPECT_LE(suggestion.distance, maxDistance) << query << " -> " << suggestion.word;
            EXPECT_EQ(EditDistance(query, suggestion.word), suggestion.distance);
        }
    }
}

TEST_F(MatcherTest, RankedScoresAreDescending)
{
    auto ranked = matcher.Rank("hell", 100);
    ASSERT_FALSE(ranked.empty());
    EXPECT_EQ("hello", ranked.front().word);
    for (std::size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_GE(ranked[i - 1].score, ranked[i].score);
    }
}

TEST(MatcherScoreTest, SimilarityAndFrequency)
{
    Lexicon lexicon;
    lexicon.AddWord("cat");
    Matcher matcher(lexicon);

    auto ranked = matcher.Rank("hat");
    ASSERT_EQ(1u, ranked.size());
    EXPECT_EQ("cat", ranked.front().word);
    EXPECT_EQ(1, ranked.front().distance);
    EXPECT_NEAR((1.0 - 1.0 / 3.0) * 0.7 + (1.0 / 100.0) * 0.3, ranked.front().score, 1e-9);
}

TEST(MatcherScoreTest, FrequentWordsRankHigher)
{
    Lexicon lexicon;
    lexicon.AddWord("bat");
    lexicon.AddWord("cat");
    Matcher matcher(lexicon);

    EXPECT_EQ((Words{"bat", "cat"}), matcher.Suggest("hat"));

    for (int i = 0; i < 10; ++i) {
        lexicon.AddWord("cat");
    }
    EXPECT_EQ((Words{"cat", "bat"}), matcher.Suggest("hat"));
}

TEST(MatcherScoreTest, ShortWordsUseLengthBuckets)
{
    Lexicon lexicon;
    lexicon.AddWord("a");
    lexicon.AddWord("abcdefgh");
    Matcher matcher(lexicon);

    EXPECT_EQ(Words{"a"}, matcher.Suggest("b"));
    EXPECT_EQ(Words{"abcdefgh"}, matcher.Suggest("abcdefg"));
}

TEST(MatcherEmptyLexiconTest, NoSuggestions)
{
    Lexicon lexicon;
    Matcher matcher(lexicon);

    EXPECT_TRUE(matcher.Suggest("hello").empty());
    EXPECT_TRUE(matcher.Suggest("").empty());
    EXPECT_TRUE(matcher.Rank("hello", 100).empty());
}

} // end anonymous namespace
