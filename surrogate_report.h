#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "surrogate.h"

struct UnpairedSurrogate
{
    std::size_t offset = 0;     // index in code units
    char16_t unit = 0;
    SurrogateKind kind = SurrogateKind::None;
};

// All unpaired surrogates in order of appearance. 'limit' == 0 means no limit.
std::vector<UnpairedSurrogate> find_unpaired_surrogates(std::u16string_view units, std::size_t limit = 0);

// One report line, e.g.
//   offset 12: unpaired leading surrogate U+D800 near "ab\xEF\xBF\xBDcd"
// 'context' is the number of code units shown on each side. The window is
// widened so it never cuts a surrogate pair in half.
std::string format_unpaired_surrogate(std::u16string_view units, const UnpairedSurrogate &found, std::size_t context);
