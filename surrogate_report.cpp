#include "surrogate_report.h"
#include "utf16_to_utf8.h"

#include <iomanip>
#include <sstream>

std::vector<UnpairedSurrogate> find_unpaired_surrogates(std::u16string_view units, std::size_t limit)
{
    std::vector<UnpairedSurrogate> out;
    std::size_t i = 0;
    while (i < units.size()) {
        SurrogateScanStep step = scan_code_unit(units.data(), units.size(), i);
        if (step.unpaired) {
            UnpairedSurrogate found;
            found.offset = i;
            found.unit = units[i];
            found.kind = classify_code_unit(units[i]);
            out.push_back(found);
            if (limit != 0 && out.size() >= limit) break;
        }
        i += step.width;
    }
    return out;
}

// Quote for a single report line: control characters, quotes and
// backslashes are escaped. Bytes >= 0x80 belong to UTF-8 sequences and pass
// through.
static std::string quote_for_line(const std::string &s)
{
    std::ostringstream oss;
    oss << '"';
    for (char c : s) {
        const unsigned char b = static_cast<unsigned char>(c);
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (b < 0x20 || b == 0x7F) {
                oss << "\\x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<unsigned>(b) << std::dec;
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
    return oss.str();
}

std::string format_unpaired_surrogate(std::u16string_view units, const UnpairedSurrogate &found, std::size_t context)
{
    std::size_t lo = found.offset >= context ? found.offset - context : 0;
    std::size_t hi = found.offset + 1 + context;
    if (hi > units.size()) hi = units.size();
    if (lo > 0 && lo < units.size() && is_trailing_surrogate(units[lo]) && is_leading_surrogate(units[lo - 1])) --lo;
    if (hi > 0 && hi < units.size() && is_leading_surrogate(units[hi - 1]) && is_trailing_surrogate(units[hi])) ++hi;

    std::string snippet;
    if (lo < hi) utf16_to_display_utf8(units.substr(lo, hi - lo), snippet);

    std::ostringstream oss;
    oss << "offset " << found.offset << ": unpaired " << surrogate_kind_name(found.kind) << " surrogate U+"
        << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << static_cast<unsigned>(found.unit)
        << std::dec << " near " << quote_for_line(snippet);
    return oss.str();
}
