// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "Matcher.h"
#include "Lexicon.h"
#include <algorithm>
#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace braillefix {
namespace {

constexpr double SimilarityWeight = 0.7;
constexpr double FrequencyWeight = 0.3;
constexpr double FrequencyScale = 100.0;
constexpr int DistanceCeiling = 3;

int LevenshteinDistance_ReplacementCost1(
    const std::string& text1,
    const std::string& text2,
    int limit)
{
    // NOTE:
    // This algorithm is based on dynamic programming, using only linear space.
    // It is O(N^2) time and O(N) space algorithm.
    // Once every cell of a row exceeds `limit`, the final distance must
    // exceed it too, so `limit + 1` is returned early.

    const auto rows = static_cast<int>(text1.size()) + 1;
    const auto columns = static_cast<int>(text2.size()) + 1;
    std::vector<int> c1(columns);
    std::vector<int> c2(columns);

    for (int i = 0; i < columns; ++i) {
        c1[i] = i;
    }

    for (int row = 1; row < rows; row++) {
        c2[0] = row;
        int rowMinimum = c2[0];
        for (int column = 1; column < columns; column++) {
            if (text1[row - 1] == text2[column - 1]) {
                c2[column] = c1[column - 1];
            }
            else {
                // NOTE: The cost of 'insertion', 'deletion' and 'substitution' operations is 1, not 2.
                c2[column] = std::min(c1[column - 1], std::min(c1[column], c2[column - 1])) + 1;
            }
            rowMinimum = std::min(rowMinimum, c2[column]);
        }
        if (rowMinimum > limit) {
            return limit + 1;
        }
        // NOTE: Use faster swap() function instead of "c1 = c2;" to faster
        std::swap(c1, c2);
    }
    return c1.back();
}

double ComputeScore(const std::string& word, const std::string& candidate, int distance, int frequency)
{
    const auto maxLength = static_cast<double>(std::max(word.size(), candidate.size()));
    assert(maxLength >= 1.0);
    const auto similarity = 1.0 - (static_cast<double>(distance) / maxLength);
    const auto frequencyScore = static_cast<double>(frequency) / FrequencyScale;
    return similarity * SimilarityWeight + frequencyScore * FrequencyWeight;
}

void SortSuggestions(std::vector<Suggestion>& suggestions)
{
    std::sort(std::begin(suggestions), std::end(suggestions), [](const Suggestion& a, const Suggestion& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.word < b.word;
    });
}

template <typename T>
void ResizeSuggestions(T & suggestions, std::size_t elementCount)
{
    if (suggestions.size() > elementCount) {
        suggestions.resize(elementCount);
    }
}

Suggestion MakeExactSuggestion(std::string word)
{
    Suggestion suggestion;
    suggestion.word = std::move(word);
    suggestion.score = 1.0;
    suggestion.distance = 0;
    return suggestion;
}

} // end anonymous namespace

constexpr int Matcher::DefaultMaxSuggestions;

Matcher::Matcher(const Lexicon& lexiconIn) noexcept
    : lexicon(&lexiconIn)
{
}

std::vector<Suggestion> Matcher::Rank(const std::string& wordIn, int maxSuggestions) const
{
    assert(lexicon != nullptr);
    const auto word = ToLowerAscii(wordIn);

    std::vector<Suggestion> suggestions;
    if (lexicon->Contains(word)) {
        // NOTE: exact matching
        suggestions.push_back(MakeExactSuggestion(word));
        return suggestions;
    }

    if (auto fix = lexicon->LearnedFixFor(word)) {
        suggestions.push_back(MakeExactSuggestion(*fix));
        return suggestions;
    }

    if (maxSuggestions <= 0) {
        return suggestions;
    }

    const auto maxDistance = MaxDistanceFor(word.size());

    // NOTE: A word whose length differs by more than `maxDistance` needs more
    // than `maxDistance` edits, so only the nearby length buckets are scanned.
    const auto gapSizeThreshold = static_cast<std::size_t>(maxDistance);
    const auto minLength = word.size() > gapSizeThreshold ? word.size() - gapSizeThreshold : 1;
    const auto maxLength = word.size() + gapSizeThreshold;

    lexicon->ForEachWord(minLength, maxLength, [&](const std::string& candidate) {
        const auto distance = LevenshteinDistance_ReplacementCost1(word, candidate, maxDistance);
        if (distance > maxDistance) {
            return;
        }
        Suggestion suggestion;
        suggestion.word = candidate;
        suggestion.distance = distance;
        suggestion.score = ComputeScore(word, candidate, distance, lexicon->FrequencyOf(candidate));
        suggestions.push_back(std::move(suggestion));
    });

    SortSuggestions(suggestions);
    ResizeSuggestions(suggestions, static_cast<std::size_t>(maxSuggestions));
    return suggestions;
}

std::vector<std::string> Matcher::Suggest(const std::string& word, int maxSuggestions) const
{
    std::vector<std::string> words;
    for (auto & suggestion : Rank(word, maxSuggestions)) {
        words.push_back(std::move(suggestion.word));
    }
    return words;
}

int EditDistance(const std::string& text1, const std::string& text2)
{
    const auto limit = static_cast<int>(std::max(text1.size(), text2.size()));
    return LevenshteinDistance_ReplacementCost1(text1, text2, limit);
}

int MaxDistanceFor(std::size_t length) noexcept
{
    return std::min(DistanceCeiling, static_cast<int>(length / 2) + 1);
}

} // namespace braillefix
