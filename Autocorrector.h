// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include "Lexicon.h"
#include <functional>
#include <string>
#include <vector>

namespace braillefix {

struct CorrectionResult {
    ///@brief The token as it appeared in the (decoded) input.
    std::string original;
    std::vector<std::string> suggestions;

    ///@brief The first suggestion, or `original` when there is none.
    std::string bestMatch;
};

class Autocorrector final {
private:
    Lexicon lexicon;
    std::function<void(const CorrectionResult&)> onCorrection;
    int maxSuggestionCount;

public:
    static constexpr int DefaultMaxSuggestionCount = 3;

    Autocorrector();

    ///@brief Decode chorded input if needed, then correct each word.
    std::vector<CorrectionResult> autocorrect(const std::string& text) const;

    std::vector<CorrectionResult> autocorrect(const std::string& text, int maxSuggestionsPerWord) const;

    ///@brief Returns the best matches of autocorrect() joined by single spaces.
    std::string correctText(const std::string& text) const;

    void learnCorrection(const std::string& wrong, const std::string& correct);

    void addWord(const std::string& word);

    void addBuiltinWords();

    Lexicon& getLexicon() noexcept { return lexicon; }

    const Lexicon& getLexicon() const noexcept { return lexicon; }

    void setMaxSuggestionCount(int maxCount);

    int getMaxSuggestionCount() const noexcept { return maxSuggestionCount; }

    ///@brief Called for every token whose best match differs from the token.
    void setCorrectionCallback(std::function<void(const CorrectionResult&)> callback);
};

///@brief Returns `token` without its non-alphabetic characters.
std::string StripNonAlphabetic(const std::string& token);

} // namespace braillefix
