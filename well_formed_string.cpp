#include "well_formed_string.h"
#include "well_formed.h"

#include <stdexcept>
#include <utility>

static WellFormedState initial_state(const std::u16string &units)
{
    return units.empty() ? WellFormedState::WellFormed : WellFormedState::Unknown;
}

WellFormedString::WellFormedString() = default;

WellFormedString::WellFormedString(std::u16string units)
    : m_units(std::move(units)), m_state(initial_state(m_units))
{
}

WellFormedString::WellFormedString(std::u16string_view units)
    : WellFormedString(std::u16string(units))
{
}

WellFormedString::WellFormedString(const char16_t *units)
    : WellFormedString(std::u16string(units))
{
}

WellFormedString::WellFormedString(std::u16string units, WellFormedState state)
    : m_units(std::move(units)), m_state(state)
{
}

WellFormedString::WellFormedString(const WellFormedString &other)
    : m_units(other.m_units), m_state(other.state())
{
}

WellFormedString::WellFormedString(WellFormedString &&other) noexcept
    : m_units(std::move(other.m_units)), m_state(other.state())
{
    other.m_units.clear();
    other.set_state(WellFormedState::WellFormed);
}

WellFormedString &WellFormedString::operator=(const WellFormedString &other)
{
    if (this != &other) {
        m_units = other.m_units;
        set_state(other.state());
    }
    return *this;
}

WellFormedString &WellFormedString::operator=(WellFormedString &&other) noexcept
{
    if (this != &other) {
        m_units = std::move(other.m_units);
        set_state(other.state());
        other.m_units.clear();
        other.set_state(WellFormedState::WellFormed);
    }
    return *this;
}

bool WellFormedString::is_well_formed() const
{
    WellFormedState current = state();
    if (current == WellFormedState::Unknown) {
        // Racing readers compute the same answer, so a plain store is enough.
        current = ::is_well_formed(m_units) ? WellFormedState::WellFormed : WellFormedState::IllFormed;
        m_state.store(current, std::memory_order_relaxed);
    }
    return current == WellFormedState::WellFormed;
}

WellFormedString WellFormedString::to_well_formed() const
{
    if (state() == WellFormedState::WellFormed) {
        return WellFormedString(m_units, WellFormedState::WellFormed);
    }
    return WellFormedString(::to_well_formed(m_units), WellFormedState::WellFormed);
}

void WellFormedString::append(const WellFormedString &other)
{
    // Two well-formed halves cannot produce an unpaired surrogate at the
    // seam. Anything else may pair up (or not) across it.
    const bool both_good = state() == WellFormedState::WellFormed && other.state() == WellFormedState::WellFormed;
    m_units.append(other.m_units);
    if (other.m_units.empty()) return;
    set_state(both_good ? WellFormedState::WellFormed : WellFormedState::Unknown);
}

void WellFormedString::push_back(char16_t unit)
{
    m_units.push_back(unit);
    // A non-surrogate neither breaks a pair nor completes one.
    if (!is_surrogate(unit) && state() != WellFormedState::Unknown) return;
    set_state(WellFormedState::Unknown);
}

WellFormedString WellFormedString::substr(std::size_t pos, std::size_t count) const
{
    if (pos > m_units.size()) {
        throw std::out_of_range("WellFormedString::substr: position out of range");
    }
    std::u16string part = m_units.substr(pos, count);
    if (part.empty()) return WellFormedString(std::move(part), WellFormedState::WellFormed);

    WellFormedState result_state = WellFormedState::Unknown;
    if (state() == WellFormedState::WellFormed) {
        // The cut splits a pair only if it starts on a trailing half or ends
        // on a leading half.
        const bool split = is_trailing_surrogate(part.front()) || is_leading_surrogate(part.back());
        if (!split) result_state = WellFormedState::WellFormed;
    }
    return WellFormedString(std::move(part), result_state);
}

void WellFormedString::set_unit(std::size_t index, char16_t unit)
{
    m_units.at(index) = unit;
    set_state(WellFormedState::Unknown);
}

void WellFormedString::clear()
{
    m_units.clear();
    set_state(WellFormedState::WellFormed);
}

WellFormedString operator+(const WellFormedString &lhs, const WellFormedString &rhs)
{
    WellFormedString result(lhs);
    result.append(rhs);
    return result;
}
