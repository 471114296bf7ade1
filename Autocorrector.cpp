// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "Autocorrector.h"
#include "DotCodec.h"
#include "Matcher.h"
#include "WordList.h"
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace braillefix {
namespace {

bool IsSpace(char c)
{
    return ::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsAlpha(char c)
{
    return ::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> SplitWords(const std::string& text)
{
    std::vector<std::string> words;
    std::string word;
    for (auto c : text) {
        if (IsSpace(c)) {
            if (!word.empty()) {
                words.push_back(std::move(word));
            }
            word.clear();
            continue;
        }
        word += c;
    }
    if (!word.empty()) {
        words.push_back(std::move(word));
    }
    return words;
}

} // end anonymous namespace

constexpr int Autocorrector::DefaultMaxSuggestionCount;

Autocorrector::Autocorrector()
    : maxSuggestionCount(DefaultMaxSuggestionCount)
{
}

std::vector<CorrectionResult> Autocorrector::autocorrect(const std::string& text) const
{
    return autocorrect(text, maxSuggestionCount);
}

std::vector<CorrectionResult> Autocorrector::autocorrect(const std::string& text, int maxSuggestionsPerWord) const
{
    const auto plainText = IsChordInput(text) ? DecodeChords(text) : text;

    Matcher matcher(lexicon);
    std::vector<CorrectionResult> results;

    for (auto & token : SplitWords(plainText)) {
        CorrectionResult result;
        result.original = token;

        const auto cleanWord = StripNonAlphabetic(token);
        if (cleanWord.empty()) {
            // NOTE: Punctuation is passed through unchanged.
            result.suggestions.push_back(token);
            result.bestMatch = token;
        }
        else {
            result.suggestions = matcher.Suggest(cleanWord, maxSuggestionsPerWord);
            result.bestMatch = result.suggestions.empty() ? token : result.suggestions.front();
        }

        if (onCorrection && (result.bestMatch != result.original)) {
            onCorrection(result);
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::string Autocorrector::correctText(const std::string& text) const
{
    std::string corrected;
    for (auto & result : autocorrect(text)) {
        if (!corrected.empty()) {
            corrected += ' ';
        }
        corrected += result.bestMatch;
    }
    return corrected;
}

void Autocorrector::learnCorrection(const std::string& wrong, const std::string& correct)
{
    lexicon.LearnCorrection(wrong, correct);
}

void Autocorrector::addWord(const std::string& word)
{
    lexicon.AddWord(word);
}

void Autocorrector::addBuiltinWords()
{
    for (auto & word : GetBuiltinWords()) {
        lexicon.AddWord(word);
    }
}

std::string StripNonAlphabetic(const std::string& token)
{
    std::string clean;
    for (auto c : token) {
        if (IsAlpha(c)) {
            clean += c;
        }
    }
    return clean;
}

void Autocorrector::setMaxSuggestionCount(int maxCount)
{
    maxSuggestionCount = maxCount;
}

void Autocorrector::setCorrectionCallback(std::function<void(const CorrectionResult&)> callback)
{
    onCorrection = std::move(callback);
}

} // namespace braillefix
