#pragma once

#include <string>
#include <string_view>

// Render UTF-16 code units as UTF-8 for printing diagnostics.
// Unpaired surrogates are shown as U+FFFD, so this never fails on ill-formed
// input. Uses iconv when the build found it, otherwise a built-in encoder.
void utf16_to_display_utf8(std::u16string_view units, std::string &out);

// Built-in encoder, also used as the fallback when iconv is unavailable or
// fails. Unpaired surrogates are encoded as U+FFFD.
void well_formed_utf16_to_utf8(std::u16string_view units, std::string &out);
