// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#include "ConsoleColor.h"
#include <string>

namespace braillefix {
namespace {

int ToColorIndex(TerminalColor color) noexcept
{
    switch (color) {
    case TerminalColor::Black: return 0;
    case TerminalColor::Red: return 1;
    case TerminalColor::Green: return 2;
    case TerminalColor::Yellow: return 3;
    case TerminalColor::Blue: return 4;
    case TerminalColor::Magenta: return 5;
    case TerminalColor::Cyan: return 6;
    case TerminalColor::White: return 7;
    }
    return 7;
}

} // end anonymous namespace

std::string colorizeText(const std::string& text, TerminalColor color)
{
    // NOTE: "\x1b[3Xm" selects text color X, "\x1b[0m" restores the default.
    std::string result = "\x1b[3";
    result += std::to_string(ToColorIndex(color));
    result += "m";
    result += text;
    result += "\x1b[0m";
    return result;
}

} // namespace braillefix
