#include "utf16_to_utf8.h"
#include "well_formed.h"

#include <cstdint>
#include <vector>

#ifdef HAVE_ICONV
#include <iconv.h>
#endif

static void append_utf8_from_codepoint(std::string &out, uint32_t cp) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void well_formed_utf16_to_utf8(std::u16string_view units, std::string &out)
{
    out.clear();
    out.reserve(units.size());
    size_t i = 0;
    while (i < units.size()) {
        SurrogateScanStep step = scan_code_unit(units.data(), units.size(), i);
        uint32_t cp = units[i];
        if (step.unpaired) {
            cp = kReplacementCharacter;
        } else if (step.width == 2) {
            cp = 0x10000 + (((static_cast<uint32_t>(units[i]) - 0xD800) << 10) | (static_cast<uint32_t>(units[i + 1]) - 0xDC00));
        }
        append_utf8_from_codepoint(out, cp);
        i += step.width;
    }
}

#ifdef HAVE_ICONV
static bool iconv_utf16_to_utf8(std::u16string_view units, std::string &out)
{
    iconv_t cd = iconv_open("UTF-8", "UTF-16LE");
    if (cd == (iconv_t)-1) return false;

    std::vector<char> inbuf(units.size() * 2);
    for (size_t i = 0; i < units.size(); ++i) {
        inbuf[i * 2] = static_cast<char>(units[i] & 0xFF);
        inbuf[i * 2 + 1] = static_cast<char>(units[i] >> 8);
    }

    // Each UTF-16 code unit becomes at most 3 UTF-8 bytes.
    size_t in_bytes_left = inbuf.size();
    char *in_ptr = inbuf.data();
    std::vector<char> outbuf(units.size() * 3 + 1);
    char *out_ptr = outbuf.data();
    size_t out_bytes_left = outbuf.size();
    size_t res = iconv(cd, &in_ptr, &in_bytes_left, &out_ptr, &out_bytes_left);
    iconv_close(cd);
    if (res == (size_t)-1) return false;

    out.assign(outbuf.data(), outbuf.size() - out_bytes_left);
    return true;
}
#endif

void utf16_to_display_utf8(std::u16string_view units, std::string &out)
{
    out.clear();
    if (units.empty()) return;
    const std::u16string clean = to_well_formed(units);
#ifdef HAVE_ICONV
    if (iconv_utf16_to_utf8(clean, out)) return;
    // fallthrough to manual converter
#endif
    well_formed_utf16_to_utf8(clean, out);
}
