// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "DotCodec.h"
#include <array>
#include <cassert>
#include <cctype>
#include <string>

namespace braillefix {
namespace {

constexpr int MaxDot = 6;
constexpr std::size_t PatternCount = 1 << MaxDot;

struct LetterEntry {
    const char* dots;
    char letter;
};

// NOTE: Grade 1 English Braille, letters a to z.
constexpr LetterEntry LetterEntries[] = {
    {"1", 'a'}, {"12", 'b'}, {"14", 'c'}, {"145", 'd'}, {"15", 'e'},
    {"124", 'f'}, {"1245", 'g'}, {"125", 'h'}, {"24", 'i'}, {"245", 'j'},
    {"13", 'k'}, {"123", 'l'}, {"134", 'm'}, {"1345", 'n'}, {"135", 'o'},
    {"1234", 'p'}, {"12345", 'q'}, {"1235", 'r'}, {"234", 's'}, {"2345", 't'},
    {"136", 'u'}, {"1236", 'v'}, {"2456", 'w'}, {"1346", 'x'}, {"13456", 'y'},
    {"1356", 'z'},
};

// NOTE: The chord key for dot N is ChordKeys[N - 1].
constexpr char ChordKeys[MaxDot] = {'D', 'W', 'Q', 'K', 'O', 'P'};

DotPattern ParseDots(const char* dots) noexcept
{
    DotPattern pattern;
    for (auto p = dots; *p != '\0'; ++p) {
        pattern.Raise(*p - '0');
    }
    return pattern;
}

const std::array<char, PatternCount>& GetLetterTable()
{
    static const std::array<char, PatternCount> table = [] {
        std::array<char, PatternCount> letters;
        letters.fill(UnknownLetter);
        for (auto & entry : LetterEntries) {
            const auto bits = ParseDots(entry.dots).GetBits();
            assert(bits < PatternCount);
            assert(letters[bits] == UnknownLetter);
            letters[bits] = entry.letter;
        }
        return letters;
    }();
    return table;
}

char ToLowerAscii(char c) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char ToUpperAscii(char c) noexcept
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string DecodeKeys(const std::string& rawInput, bool uppercaseChordsOnly)
{
    std::string result;
    result.reserve(rawInput.size());

    DotPattern chord;
    auto flush = [&] {
        if (!chord.Empty()) {
            result += LookupLetter(chord);
            chord.Clear();
        }
    };

    for (auto c : rawInput) {
        const auto dot = DotOf(c);
        if ((dot != 0) && (!uppercaseChordsOnly || (ToUpperAscii(c) == c))) {
            chord.Raise(dot);
            continue;
        }
        // NOTE: A space or any other character closes the current cell.
        flush();
        result += ToLowerAscii(c);
    }
    flush();
    return result;
}

} // end anonymous namespace

DotPattern::DotPattern(uint8_t bitsIn) noexcept
    : bits(static_cast<uint8_t>(bitsIn & (PatternCount - 1)))
{
}

void DotPattern::Raise(int dot) noexcept
{
    if (dot < 1 || dot > MaxDot) {
        return;
    }
    bits = static_cast<uint8_t>(bits | (1 << (dot - 1)));
}

bool DotPattern::IsRaised(int dot) const noexcept
{
    if (dot < 1 || dot > MaxDot) {
        return false;
    }
    return ((bits >> (dot - 1)) & 0b1) == 0b1;
}

std::string DotPattern::ToString() const
{
    std::string dots;
    for (int dot = 1; dot <= MaxDot; ++dot) {
        if (IsRaised(dot)) {
            dots += static_cast<char>('0' + dot);
        }
    }
    return dots;
}

int DotOf(char key) noexcept
{
    const auto upper = ToUpperAscii(key);
    for (int i = 0; i < MaxDot; ++i) {
        if (ChordKeys[i] == upper) {
            return i + 1;
        }
    }
    return 0;
}

bool IsChordKey(char c) noexcept
{
    return DotOf(c) != 0;
}

bool IsChordInput(const std::string& text) noexcept
{
    for (auto c : text) {
        if (IsChordKey(c) && (ToUpperAscii(c) == c)) {
            return true;
        }
    }
    return false;
}

char LookupLetter(DotPattern pattern) noexcept
{
    return GetLetterTable()[pattern.GetBits()];
}

DotPattern PatternOf(char letter) noexcept
{
    const auto lower = ToLowerAscii(letter);
    for (auto & entry : LetterEntries) {
        if (entry.letter == lower) {
            return ParseDots(entry.dots);
        }
    }
    return DotPattern{};
}

std::string EncodeLetter(char letter)
{
    const auto pattern = PatternOf(letter);
    std::string keys;
    for (int dot = 1; dot <= MaxDot; ++dot) {
        if (pattern.IsRaised(dot)) {
            keys += ChordKeys[dot - 1];
        }
    }
    return keys;
}

std::string Decode(const std::string& rawInput)
{
    return DecodeKeys(rawInput, false);
}

std::string DecodeChords(const std::string& rawInput)
{
    return DecodeKeys(rawInput, true);
}

} // namespace braillefix
