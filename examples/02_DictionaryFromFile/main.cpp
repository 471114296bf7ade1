#include "Autocorrector.h"
#include <fstream>
#include <functional>
#include <iostream>

using braillefix::Autocorrector;

bool ReadDictionaryFile(
    const std::string& path,
    const std::function<void(const std::string&)>& callback)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        std::cerr << "error: Cannot open the file. " << path << std::endl;
        return false;
    }

    std::istreambuf_iterator<char> start(input);
    std::istreambuf_iterator<char> end;

    std::string word;
    for (; start != end; ++start) {
        auto c = *start;
        if (c == '\r' || c == '\n' || c == '\0') {
            if (!word.empty()) {
                callback(word);
            }
            word.clear();
            continue;
        }
        word += c;
    }
    if (!word.empty()) {
        callback(word);
    }
    return true;
}

int main()
{
    // NOTE: Please specify your dictionary file
    std::string filePath = "MyDictionary.txt";

    Autocorrector autocorrector;

    // NOTE: Construct a dictionary from the file
    auto addWord = [&](const std::string& word) {
        autocorrector.addWord(word);
    };
    if (!ReadDictionaryFile(filePath, addWord)) {
        return 1;
    }

    // NOTE: Teach a correction that fuzzy matching would not find
    autocorrector.learnCorrection("teh", "the");

    // NOTE: Check spelling errors
    auto text = "Teh sytem is reay";
    for (auto & result : autocorrector.autocorrect(text)) {
        if (result.original == result.bestMatch) {
            std::cout << "'" << result.original << "' is found. (exact match)" << std::endl;
        }
        else if (result.suggestions.empty()) {
            std::cout << "'" << result.original << "' is not found." << std::endl;
        }
        else {
            std::cout << "'" << result.original << "' " << "Did you mean..." << std::endl;
            for (auto & suggestion : result.suggestions) {
                std::cout << "  " << suggestion << std::endl;
            }
        }
    }

    // NOTE: Show dictionary statistics
    auto stats = autocorrector.getLexicon().GetStats();
    std::cout << stats.wordCount << " words, "
        << stats.learnedCount << " learned corrections" << std::endl;

    return 0;
}
