// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace braillefix {

class Lexicon;

struct Suggestion {
    std::string word;

    ///@brief Weighted similarity and frequency score; higher is better.
    double score = 0.0;

    ///@brief Levenshtein distance from the query.
    int distance = 0;
};

class Matcher final {
public:
    static constexpr int DefaultMaxSuggestions = 5;

    explicit Matcher(const Lexicon& lexicon) noexcept;

    ///@brief Returns correction candidates for `word`, best first.
    ///
    /// A known word is returned as is, and a learned fix takes precedence
    /// over every fuzzy match. An empty result means no candidate is close
    /// enough.
    std::vector<std::string> Suggest(
        const std::string& word,
        int maxSuggestions = DefaultMaxSuggestions) const;

    ///@brief Same as Suggest() but keeps the score and distance of each candidate.
    std::vector<Suggestion> Rank(
        const std::string& word,
        int maxSuggestions = DefaultMaxSuggestions) const;

private:
    const Lexicon* lexicon;
};

///@brief Levenshtein distance where insertion, deletion and substitution cost 1.
int EditDistance(const std::string& text1, const std::string& text2);

///@brief The largest edit distance a candidate may have from a word of `length` characters.
int MaxDistanceFor(std::size_t length) noexcept;

} // namespace braillefix
