// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "WordList.h"
#include <iterator>

namespace braillefix {
namespace {

const char* const BuiltinWords[] = {
    "the", "and", "for", "are", "but", "not", "you", "all", "can", "had",
    "her", "was", "one", "our", "out", "day", "get", "has", "him", "his",
    "how", "man", "new", "now", "old", "see", "two", "way", "who", "boy",
    "did", "its", "let", "put", "say", "she", "too", "use", "good", "have",
    "just", "like", "over", "also", "back", "call", "came", "each", "find",
    "give", "hand", "here", "keep", "kind", "know", "last", "left", "life",
    "live", "look", "made", "make", "most", "move", "must", "name", "need",
    "only", "open", "part", "play", "right", "said", "same", "seem", "show",
    "side", "take", "tell", "turn", "want", "well", "went", "were", "what",
    "when", "where", "which", "will", "with", "word", "work", "world", "year",
    "hello", "computer", "braille", "system", "keyboard", "typing", "input",
};

} // end anonymous namespace

std::vector<std::string> GetBuiltinWords()
{
    return std::vector<std::string>(std::begin(BuiltinWords), std::end(BuiltinWords));
}

} // namespace braillefix
