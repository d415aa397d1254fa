#include "well_formed.h"

const char *surrogate_kind_name(SurrogateKind kind)
{
    switch (kind) {
    case SurrogateKind::Leading: return "leading";
    case SurrogateKind::Trailing: return "trailing";
    case SurrogateKind::None: break;
    }
    return "none";
}

static std::size_t find_unpaired(const char16_t *data, std::size_t size, std::size_t start)
{
    std::size_t i = start;
    while (i < size) {
        SurrogateScanStep step = scan_code_unit(data, size, i);
        if (step.unpaired) return i;
        i += step.width;
    }
    return std::u16string_view::npos;
}

bool is_well_formed(const char16_t *units, std::size_t size)
{
    return find_unpaired(units, size, 0) == std::u16string_view::npos;
}

bool is_well_formed(std::u16string_view units)
{
    return is_well_formed(units.data(), units.size());
}

std::u16string to_well_formed(const char16_t *units, std::size_t size)
{
    if (size == 0) return std::u16string();

    std::size_t first = find_unpaired(units, size, 0);
    if (first == std::u16string_view::npos) {
        // Already well-formed: plain copy.
        return std::u16string(units, size);
    }

    std::u16string out;
    out.reserve(size);
    out.append(units, first);

    std::size_t i = first;
    while (i < size) {
        SurrogateScanStep step = scan_code_unit(units, size, i);
        if (step.unpaired) {
            out.push_back(kReplacementCharacter);
        } else {
            out.append(units + i, step.width);
        }
        i += step.width;
    }
    return out;
}

std::u16string to_well_formed(std::u16string_view units)
{
    return to_well_formed(units.data(), units.size());
}

std::size_t make_well_formed(std::u16string &units)
{
    std::size_t replaced = 0;
    std::size_t i = find_unpaired(units.data(), units.size(), 0);
    while (i < units.size()) {
        SurrogateScanStep step = scan_code_unit(units.data(), units.size(), i);
        if (step.unpaired) {
            // Replacement is not a surrogate, so the scan of the following
            // units is unaffected.
            units[i] = kReplacementCharacter;
            ++replaced;
        }
        i += step.width;
    }
    return replaced;
}

std::size_t find_unpaired_surrogate(std::u16string_view units, std::size_t start)
{
    return find_unpaired(units.data(), units.size(), start);
}

std::size_t count_unpaired_surrogates(std::u16string_view units)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < units.size()) {
        SurrogateScanStep step = scan_code_unit(units.data(), units.size(), i);
        if (step.unpaired) ++count;
        i += step.width;
    }
    return count;
}
