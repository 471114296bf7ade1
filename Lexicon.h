// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include <cstddef>
#include <experimental/optional>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace braillefix {

struct LexiconStats {
    std::size_t wordCount = 0;
    std::size_t learnedCount = 0;

    ///@brief The most frequent words, highest count first.
    std::vector<std::pair<std::string, int>> topWords;
};

class Lexicon final {
public:
    static constexpr std::size_t MaxTopWords = 5;

    ///@brief Add a word to the dictionary, or count one more use of it.
    ///@param word Lowercased and trimmed; ignored when blank.
    void AddWord(const std::string& word);

    ///@brief Remember that `wrong` should be corrected to `correct`.
    ///
    /// A later call for the same `wrong` replaces the earlier fix. `correct`
    /// is added to the dictionary.
    void LearnCorrection(const std::string& wrong, const std::string& correct);

    bool Contains(const std::string& word) const;

    ///@brief Returns how many times `word` was added, or 0.
    int FrequencyOf(const std::string& word) const;

    std::experimental::optional<std::string> LearnedFixFor(const std::string& word) const;

    LexiconStats GetStats() const;

    std::size_t GetWordCount() const noexcept { return frequencies.size(); }

    std::size_t GetLearnedCount() const noexcept { return learnedFixes.size(); }

    bool Empty() const noexcept { return frequencies.empty(); }

    ///@brief Visit every word whose length is within [minLength, maxLength].
    ///
    /// Words are visited by ascending length, then in lexicographic order.
    void ForEachWord(
        std::size_t minLength,
        std::size_t maxLength,
        const std::function<void(const std::string&)>& callback) const;

private:
    std::unordered_map<std::string, int> frequencies;
    std::unordered_map<std::string, std::string> learnedFixes;

    // NOTE: Sorted word lists, keyed by word length.
    std::map<std::size_t, std::vector<std::string>> wordsByLength;
};

///@brief Lowercase `text` (ASCII) and strip surrounding whitespace.
std::string NormalizeWord(const std::string& text);

///@brief Lowercase `text` (ASCII).
std::string ToLowerAscii(const std::string& text);

} // namespace braillefix
