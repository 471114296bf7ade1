// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "Lexicon.h"
#include <algorithm>
#include <cassert>
#include <cctype>
#include <string>
#include <utility>

namespace braillefix {

constexpr std::size_t Lexicon::MaxTopWords;

void Lexicon::AddWord(const std::string& wordIn)
{
    auto word = NormalizeWord(wordIn);
    if (word.empty()) {
        return;
    }

    auto iter = frequencies.find(word);
    if (iter != std::end(frequencies)) {
        // NOTE: The word already exists in a dictionary.
        ++iter->second;
        return;
    }

    auto & words = wordsByLength[word.size()];
    auto wordsIter = std::lower_bound(std::begin(words), std::end(words), word);
    assert((wordsIter == std::end(words)) || (*wordsIter != word));
    words.insert(wordsIter, word);

    frequencies.emplace(std::move(word), 1);
}

void Lexicon::LearnCorrection(const std::string& wrongIn, const std::string& correctIn)
{
    auto wrong = NormalizeWord(wrongIn);
    auto correct = NormalizeWord(correctIn);
    if (correct.empty()) {
        // NOTE: A fix must point at a word the dictionary can hold.
        return;
    }

    learnedFixes[std::move(wrong)] = correct;
    AddWord(correct);
}

bool Lexicon::Contains(const std::string& word) const
{
    return frequencies.find(word) != std::end(frequencies);
}

int Lexicon::FrequencyOf(const std::string& word) const
{
    auto iter = frequencies.find(word);
    if (iter == std::end(frequencies)) {
        return 0;
    }
    return iter->second;
}

std::experimental::optional<std::string> Lexicon::LearnedFixFor(const std::string& word) const
{
    auto iter = learnedFixes.find(word);
    if (iter == std::end(learnedFixes)) {
        return std::experimental::nullopt;
    }
    return iter->second;
}

LexiconStats Lexicon::GetStats() const
{
    LexiconStats stats;
    stats.wordCount = frequencies.size();
    stats.learnedCount = learnedFixes.size();

    std::vector<std::pair<std::string, int>> counts(std::begin(frequencies), std::end(frequencies));
    const auto topCount = std::min(MaxTopWords, counts.size());
    std::partial_sort(
        std::begin(counts),
        std::begin(counts) + topCount,
        std::end(counts),
        [](const std::pair<std::string, int>& a, const std::pair<std::string, int>& b) {
            if (a.second != b.second) {
                return a.second > b.second;
            }
            return a.first < b.first;
        });
    counts.resize(topCount);
    stats.topWords = std::move(counts);
    return stats;
}

void Lexicon::ForEachWord(
    std::size_t minLength,
    std::size_t maxLength,
    const std::function<void(const std::string&)>& callback) const
{
    assert(callback);
    if (minLength > maxLength) {
        return;
    }
    auto first = wordsByLength.lower_bound(minLength);
    auto last = wordsByLength.upper_bound(maxLength);
    for (auto iter = first; iter != last; ++iter) {
        for (auto & word : iter->second) {
            callback(word);
        }
    }
}

std::string ToLowerAscii(const std::string& text)
{
    std::string result = text;
    for (auto & c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string NormalizeWord(const std::string& text)
{
    auto isSpace = [](char c) { return ::isspace(static_cast<unsigned char>(c)) != 0; };
    auto first = std::find_if_not(std::begin(text), std::end(text), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return ToLowerAscii(std::string(first, last));
}

} // namespace braillefix
