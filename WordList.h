// Copyright (c) 2015-2017 mogemimi. Distributed under the MIT license.

#pragma once

#include <string>
#include <vector>

namespace braillefix {

///@brief Common English words used to seed a new dictionary.
std::vector<std::string> GetBuiltinWords();

} // namespace braillefix
