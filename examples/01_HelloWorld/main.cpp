#include "Autocorrector.h"
#include <iostream>

int main()
{
    braillefix::Autocorrector autocorrector;
    autocorrector.addWord("the");
    autocorrector.addWord("braille");
    autocorrector.addWord("system");

    // NOTE: "the braille system"
    // Uppercase D W Q K O P are chord keys, so plain text keeps them lowercase.
    std::cout << autocorrector.correctText("Thr braile sytem!") << std::endl;

    // NOTE: D+K is dots 1 and 4, which is 'c'. D+W is dots 1 and 2, which is 'b'.
    for (auto & result : autocorrector.autocorrect("DK DW")) {
        std::cout << result.original << std::endl;
    }

    return 0;
}
