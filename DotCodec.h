// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include <cstdint>
#include <string>

namespace braillefix {

///@brief Raised dots of one Braille cell.
///
/// Bit `n - 1` is set when dot `n` (1 to 6) is raised. The mask itself is
/// the canonical form, so two chords typed in a different key order compare
/// equal.
class DotPattern final {
public:
    DotPattern() noexcept = default;

    explicit DotPattern(uint8_t bits) noexcept;

    ///@brief Raise dot `dot`; values outside 1...6 are ignored.
    void Raise(int dot) noexcept;

    bool IsRaised(int dot) const noexcept;

    bool Empty() const noexcept { return bits == 0; }

    void Clear() noexcept { bits = 0; }

    uint8_t GetBits() const noexcept { return bits; }

    ///@brief Dot numbers in ascending order, e.g. "145" for 'd'.
    std::string ToString() const;

    bool operator==(const DotPattern& other) const noexcept { return bits == other.bits; }
    bool operator!=(const DotPattern& other) const noexcept { return bits != other.bits; }

private:
    uint8_t bits = 0;
};

///@brief The letter typed for an unmapped dot pattern.
constexpr char UnknownLetter = '?';

///@brief Returns the dot (1...6) assigned to a chord key, or 0.
///
/// Chord keys are D W Q (dots 1 2 3) and K O P (dots 4 5 6), matched
/// case-insensitively.
int DotOf(char key) noexcept;

///@brief `true` if `c` is one of the six chord keys.
bool IsChordKey(char c) noexcept;

///@brief `true` if `text` should be decoded as chords.
///
/// Chords are typed with the uppercase keys, so only an uppercase chord key
/// marks the input as chorded. Lowercase prose such as "hello" is left alone.
bool IsChordInput(const std::string& text) noexcept;

///@brief Returns the lowercase letter for `pattern`, or `UnknownLetter`.
char LookupLetter(DotPattern pattern) noexcept;

///@brief Returns the dot pattern that types `letter`.
///
/// The result is empty for characters outside a-z.
DotPattern PatternOf(char letter) noexcept;

///@brief Returns the chord keys (uppercase, in dot order) that type `letter`.
///@param letter a-z or A-Z
///@return An empty string if `letter` has no chord.
std::string EncodeLetter(char letter);

///@brief Convert chorded key input into plain text.
///
/// Chord keys accumulate into the current cell. Any other character flushes
/// the cell as a letter, then is copied lowercased. A trailing cell is
/// flushed at the end of input.
std::string Decode(const std::string& rawInput);

///@brief Same as `Decode`, except that only uppercase chord keys form chords.
///
/// Lowercase letters are copied as typed, so "DW hello" decodes to
/// "b hello". `Autocorrector` decodes its input this way.
std::string DecodeChords(const std::string& rawInput);

} // namespace braillefix
