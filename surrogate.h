#pragma once

#include <cstddef>
#include <cstdint>

// U+FFFD, substituted for each unpaired surrogate.
constexpr char16_t kReplacementCharacter = 0xFFFD;

enum class SurrogateKind
{
    None,       // not a surrogate
    Leading,    // 0xD800..0xDBFF
    Trailing    // 0xDC00..0xDFFF
};

inline bool is_surrogate(char16_t cu) { return (cu & 0xF800) == 0xD800; }
inline bool is_leading_surrogate(char16_t cu) { return (cu & 0xFC00) == 0xD800; }
inline bool is_trailing_surrogate(char16_t cu) { return (cu & 0xFC00) == 0xDC00; }

inline SurrogateKind classify_code_unit(char16_t cu)
{
    if (!is_surrogate(cu)) return SurrogateKind::None;
    return is_leading_surrogate(cu) ? SurrogateKind::Leading : SurrogateKind::Trailing;
}

const char *surrogate_kind_name(SurrogateKind kind);

// One step of the forward scan shared by every well-formedness operation.
// 'width' is 2 for a valid pair and 1 otherwise; 'unpaired' is set when the
// unit at the scan position is a surrogate without a partner.
struct SurrogateScanStep
{
    std::size_t width = 1;
    bool unpaired = false;
};

// 'i' must be < size.
inline SurrogateScanStep scan_code_unit(const char16_t *data, std::size_t size, std::size_t i)
{
    SurrogateScanStep step;
    const char16_t cu = data[i];
    if (!is_surrogate(cu)) return step;
    if (is_leading_surrogate(cu) && i + 1 < size && is_trailing_surrogate(data[i + 1])) {
        step.width = 2;
        return step;
    }
    // A leading surrogate without a trailing partner, or a trailing surrogate
    // that was not consumed as the second half of a pair.
    step.unpaired = true;
    return step;
}
