// Copyright (c) 2016 mogemimi. Distributed under the MIT license.

#include "ConsoleColor.h"
#include "Autocorrector.h"
#include "DotCodec.h"
#include "Matcher.h"

#ifdef _MSC_VER
#pragma warning(disable: 4146 4127 4244 4702 4996)
#else
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wsign-compare"
#pragma GCC diagnostic ignored "-Wconversion"
#endif

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/Signals.h"
#include "llvm/Support/raw_ostream.h"

#ifdef _MSC_VER
#pragma warning(pop)
#else
#pragma GCC diagnostic pop
#endif

#include <functional>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

using namespace llvm;
using braillefix::Autocorrector;
using braillefix::TerminalColor;

namespace {

cl::OptionCategory BraillefixCategory("braillefix options");

cl::list<std::string> InputTexts(
    cl::Positional,
    cl::desc("[text ...]"),
    cl::ZeroOrMore,
    cl::cat(BraillefixCategory));

cl::list<std::string> DictionaryPaths(
    "dict",
    cl::desc("Dictionary file (one word per line)"),
    cl::value_desc("file"),
    cl::ZeroOrMore,
    cl::cat(BraillefixCategory));

cl::opt<bool> NoBuiltinWords(
    "no-builtin",
    cl::desc("Do not add the builtin word list"),
    cl::cat(BraillefixCategory));

cl::opt<int> MaxSuggestions(
    "n",
    cl::desc("Maximum number of suggestions per word"),
    cl::init(Autocorrector::DefaultMaxSuggestionCount),
    cl::cat(BraillefixCategory));

cl::list<std::string> LearnedFixes(
    "learn",
    cl::desc("Teach a correction before processing the input"),
    cl::value_desc("wrong:right"),
    cl::ZeroOrMore,
    cl::cat(BraillefixCategory));

cl::opt<bool> ShowStats(
    "stats",
    cl::desc("Display dictionary statistics"),
    cl::cat(BraillefixCategory));

cl::opt<bool> EncodeMode(
    "encode",
    cl::desc("Display the chord keys that type the input instead of correcting it"),
    cl::cat(BraillefixCategory));

cl::opt<bool> NoColor(
    "no-color",
    cl::desc("Disable colored output"),
    cl::cat(BraillefixCategory));

cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Display the score and distance of each candidate"),
    cl::cat(BraillefixCategory));

bool isColorEnabled = false;

void PrintVersion(raw_ostream & os)
{
    os << "braillefix version 0.1.0 (October 19, 2026)\n";
}

std::string Highlight(const std::string& text, TerminalColor color)
{
    if (!isColorEnabled) {
        return text;
    }
    return braillefix::colorizeText(text, color);
}

bool ReadDictionaryFile(
    const std::string& path,
    const std::function<void(const std::string&)>& callback)
{
    auto buffer = MemoryBuffer::getFile(path);
    if (!buffer) {
        errs() << "error: Cannot open the file '" << path << "': "
            << buffer.getError().message() << "\n";
        return false;
    }

    for (line_iterator line(**buffer, true); !line.is_at_eof(); ++line) {
        auto word = line->rtrim("\r");
        if (!word.empty()) {
            callback(word.str());
        }
    }
    return true;
}

bool ParseLearnedFix(StringRef value, std::string & wrong, std::string & right)
{
    StringRef wrongRef;
    StringRef rightRef;
    std::tie(wrongRef, rightRef) = value.split(':');
    wrongRef = wrongRef.trim();
    rightRef = rightRef.trim();
    if (wrongRef.empty() || rightRef.empty()) {
        return false;
    }
    wrong = wrongRef.str();
    right = rightRef.str();
    return true;
}

void PrintCandidates(const Autocorrector& autocorrector, const braillefix::CorrectionResult& result)
{
    braillefix::Matcher matcher(autocorrector.getLexicon());
    const auto cleanWord = braillefix::StripNonAlphabetic(result.original);
    for (auto & suggestion : matcher.Rank(cleanWord, autocorrector.getMaxSuggestionCount())) {
        outs() << "      " << suggestion.word
            << format(" score=%.3f", suggestion.score)
            << " distance=" << suggestion.distance << "\n";
    }
}

void PrintCorrections(const Autocorrector& autocorrector, const std::string& input)
{
    outs() << "Input: '" << input << "'\n";

    std::string corrected;
    for (auto & result : autocorrector.autocorrect(input)) {
        if (!corrected.empty()) {
            corrected += ' ';
        }
        corrected += result.bestMatch;

        if (result.original == result.bestMatch) {
            continue;
        }
        outs() << "  '" << Highlight(result.original, TerminalColor::Red)
            << "' -> '" << Highlight(result.bestMatch, TerminalColor::Green) << "'\n";

        if (result.suggestions.size() > 1) {
            outs() << "    Other suggestions:";
            for (std::size_t i = 1; i < result.suggestions.size(); ++i) {
                outs() << " " << result.suggestions[i];
            }
            outs() << "\n";
        }
        if (Verbose) {
            PrintCandidates(autocorrector, result);
        }
    }

    outs() << "Corrected: '" << corrected << "'\n";
    outs() << std::string(40, '-') << "\n";
}

void PrintEncoding(const std::string& input)
{
    std::string chords;
    for (auto c : input) {
        if (!chords.empty()) {
            chords += ' ';
        }
        if (c == ' ') {
            chords += '/';
            continue;
        }
        auto keys = braillefix::EncodeLetter(c);
        if (keys.empty()) {
            // NOTE: There is no chord for digits and symbols.
            chords += c;
            continue;
        }
        chords += Highlight(keys, TerminalColor::Cyan);
    }
    outs() << "'" << input << "' -> " << chords << "\n";
}

void PrintStats(const braillefix::Lexicon& lexicon)
{
    auto stats = lexicon.GetStats();
    outs() << "Total words in dictionary: " << stats.wordCount << "\n";
    outs() << "Learned corrections: " << stats.learnedCount << "\n";
    outs() << "Most common words:";
    for (auto & entry : stats.topWords) {
        outs() << " " << entry.first << " (" << entry.second << ")";
    }
    outs() << "\n";
}

void ProcessInput(const Autocorrector& autocorrector, const std::string& input)
{
    if (EncodeMode) {
        PrintEncoding(input);
        return;
    }
    PrintCorrections(autocorrector, input);
}

void RunInteractive(Autocorrector & autocorrector)
{
    std::string line;
    while (std::getline(std::cin, line)) {
        const auto command = StringRef(line).trim();
        if (command.empty()) {
            continue;
        }
        if (command == ":quit") {
            break;
        }
        if (command == ":stats") {
            PrintStats(autocorrector.getLexicon());
            continue;
        }
        if (command.split(' ').first == ":learn") {
            SmallVector<StringRef, 3> args;
            command.split(args, ' ', -1, false);
            if (args.size() != 3) {
                errs() << "error: usage is ':learn <wrong> <right>'\n";
                continue;
            }
            autocorrector.learnCorrection(args[1].str(), args[2].str());
            outs() << "Learned '" << args[1] << "' -> '" << args[2] << "'\n";
            continue;
        }
        ProcessInput(autocorrector, line);
    }
}

} // end anonymous namespace

int main(int argc, const char** argv)
{
    sys::PrintStackTraceOnErrorSignal(argv[0]);
    cl::HideUnrelatedOptions(BraillefixCategory);
    cl::SetVersionPrinter(PrintVersion);
    cl::ParseCommandLineOptions(argc, argv, "Braille chord decoder and autocorrect\n");

    if (MaxSuggestions < 1) {
        errs() << "error: -n must be at least 1\n";
        return 1;
    }

    isColorEnabled = !NoColor && sys::Process::StandardOutIsDisplayed();

    Autocorrector autocorrector;
    autocorrector.setMaxSuggestionCount(MaxSuggestions);

    if (!NoBuiltinWords) {
        autocorrector.addBuiltinWords();
    }

    auto addWord = [&](const std::string& word) {
        autocorrector.addWord(word);
    };
    for (auto & path : DictionaryPaths) {
        if (!ReadDictionaryFile(path, addWord)) {
            return 1;
        }
    }

    for (auto & value : LearnedFixes) {
        std::string wrong;
        std::string right;
        if (!ParseLearnedFix(value, wrong, right)) {
            errs() << "error: Invalid correction '" << value << "', expected <wrong>:<right>\n";
            return 1;
        }
        autocorrector.learnCorrection(wrong, right);
    }

    if (InputTexts.empty()) {
        RunInteractive(autocorrector);
    }
    else {
        for (auto & text : InputTexts) {
            ProcessInput(autocorrector, text);
        }
    }

    if (ShowStats) {
        PrintStats(autocorrector.getLexicon());
    }
    return 0;
}
