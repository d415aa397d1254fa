#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class Utf16ByteOrder
{
    LittleEndian,
    BigEndian
};

const char *byte_order_name(Utf16ByteOrder order);

struct Utf16FileInfo
{
    Utf16ByteOrder byte_order = Utf16ByteOrder::LittleEndian;
    bool has_bom = false;
};

// Convert raw UTF-16 bytes (without BOM) into code units. Surrogates are not
// validated: lone surrogates are kept exactly as stored.
// Returns false and sets err if 'size' is odd.
bool utf16_bytes_to_units(const std::uint8_t *data, std::size_t size, Utf16ByteOrder order, std::u16string &out, std::string &err);

// Serialize code units, optionally preceded by a BOM.
void units_to_utf16_bytes(std::u16string_view units, Utf16ByteOrder order, bool with_bom, std::vector<std::uint8_t> &out);

// Read a UTF-16 text file into code units.
// Detects a UTF-16LE/BE BOM and strips it. Without a BOM the byte order
// already in 'info' is used. Files carrying a UTF-8 or UTF-32 BOM are rejected.
// Returns true on success; on failure returns false and sets err.
bool read_utf16_file(const std::string &path, Utf16FileInfo &info, std::u16string &out, std::string &err);
