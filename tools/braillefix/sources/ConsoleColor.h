// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include <string>

namespace braillefix {

///@brief The eight basic ANSI colors, in escape-code order.
enum class TerminalColor {
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White,
};

///@brief Wraps `text` in the escape sequences that print it in `color`.
///
/// The color is reset after `text`. Callers decide whether the output
/// stream is a terminal.
std::string colorizeText(const std::string& text, TerminalColor color);

} // namespace braillefix
