#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

enum class WellFormedState : std::uint8_t
{
    Unknown,
    WellFormed,
    IllFormed
};

// UTF-16 string value that remembers whether it is known to be well-formed.
// Operations that cannot introduce an unpaired surrogate carry the bit over;
// everything else resets it to Unknown and the next is_well_formed() rescans.
// Concurrent reads of a const value are safe: the cache is atomic and every
// thread that fills it stores the same answer.
class WellFormedString
{
public:
    WellFormedString();
    explicit WellFormedString(std::u16string units);
    explicit WellFormedString(std::u16string_view units);
    explicit WellFormedString(const char16_t *units);

    WellFormedString(const WellFormedString &other);
    WellFormedString(WellFormedString &&other) noexcept;
    WellFormedString &operator=(const WellFormedString &other);
    WellFormedString &operator=(WellFormedString &&other) noexcept;

    const std::u16string &units() const { return m_units; }
    std::u16string_view view() const { return m_units; }
    std::size_t size() const { return m_units.size(); }
    bool empty() const { return m_units.empty(); }

    // Throws std::out_of_range.
    char16_t at(std::size_t index) const { return m_units.at(index); }

    // Cached answer; scans on first use.
    bool is_well_formed() const;

    // Cache state without scanning.
    WellFormedState known_state() const { return m_state.load(std::memory_order_relaxed); }

    // Copy with unpaired surrogates replaced. Skips the scan when the string
    // is already known to be well-formed.
    WellFormedString to_well_formed() const;

    void append(const WellFormedString &other);
    void push_back(char16_t unit);

    // Throws std::out_of_range if 'pos' > size().
    WellFormedString substr(std::size_t pos, std::size_t count = std::u16string::npos) const;

    // Throws std::out_of_range if 'index' >= size().
    void set_unit(std::size_t index, char16_t unit);

    void clear();

    friend WellFormedString operator+(const WellFormedString &lhs, const WellFormedString &rhs);
    friend bool operator==(const WellFormedString &lhs, const WellFormedString &rhs) { return lhs.m_units == rhs.m_units; }
    friend bool operator!=(const WellFormedString &lhs, const WellFormedString &rhs) { return !(lhs == rhs); }

private:
    WellFormedString(std::u16string units, WellFormedState state);

    WellFormedState state() const { return m_state.load(std::memory_order_relaxed); }
    void set_state(WellFormedState state) { m_state.store(state, std::memory_order_relaxed); }

    std::u16string m_units;
    mutable std::atomic<WellFormedState> m_state{WellFormedState::WellFormed};
};
