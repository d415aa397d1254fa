#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "surrogate.h"

// Return true if 'units' contains no unpaired or out-of-order surrogates.
bool is_well_formed(const char16_t *units, std::size_t size);
bool is_well_formed(std::u16string_view units);

// Return a copy of 'units' with every unpaired surrogate replaced by U+FFFD.
// Paired surrogates and all other units are copied unchanged, so the result
// has the same length as the input and equals it when it is well-formed.
std::u16string to_well_formed(const char16_t *units, std::size_t size);
std::u16string to_well_formed(std::u16string_view units);

// Sanitize in place. Returns the number of units that were replaced.
std::size_t make_well_formed(std::u16string &units);

// Offset of the first unpaired surrogate at or after 'start', or npos.
// 'start' must not point at the trailing half of a surrogate pair.
std::size_t find_unpaired_surrogate(std::u16string_view units, std::size_t start = 0);

std::size_t count_unpaired_surrogates(std::u16string_view units);
