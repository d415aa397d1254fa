#include "utf16_file.h"

#include <fstream>
#include <iterator>

static inline uint16_t read_u16_le(const uint8_t* p) { return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8); }
static inline uint16_t read_u16_be(const uint8_t* p) { return static_cast<uint16_t>(p[0]) << 8 | static_cast<uint16_t>(p[1]); }

const char *byte_order_name(Utf16ByteOrder order)
{
    return order == Utf16ByteOrder::BigEndian ? "UTF-16BE" : "UTF-16LE";
}

bool utf16_bytes_to_units(const uint8_t* data, size_t size, Utf16ByteOrder order, std::u16string &out, std::string &err)
{
    if (size % 2 != 0) {
        err = "Odd byte count for UTF-16 data: " + std::to_string(size);
        return false;
    }
    out.clear();
    out.resize(size / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const uint8_t* p = data + i * 2;
        out[i] = static_cast<char16_t>(order == Utf16ByteOrder::BigEndian ? read_u16_be(p) : read_u16_le(p));
    }
    return true;
}

void units_to_utf16_bytes(std::u16string_view units, Utf16ByteOrder order, bool with_bom, std::vector<uint8_t> &out)
{
    out.clear();
    out.reserve((units.size() + (with_bom ? 1 : 0)) * 2);
    auto put = [&](char16_t cu) {
        const uint8_t hi = static_cast<uint8_t>(cu >> 8);
        const uint8_t lo = static_cast<uint8_t>(cu & 0xFF);
        if (order == Utf16ByteOrder::BigEndian) {
            out.push_back(hi);
            out.push_back(lo);
        } else {
            out.push_back(lo);
            out.push_back(hi);
        }
    };
    if (with_bom) put(static_cast<char16_t>(0xFEFF));
    for (char16_t cu : units) put(cu);
}

bool read_utf16_file(const std::string &path, Utf16FileInfo &info, std::u16string &out, std::string &err)
{
    // Read raw bytes
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "Failed to open input file: " + path;
        return false;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "Failed to read input file: " + path;
        return false;
    }

    if (data.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        err = "File has a UTF-8 BOM, not UTF-16: " + path;
        return false;
    }
    // UTF-32 LE shares its first two bytes with the UTF-16 LE BOM followed by
    // U+0000, so only a whole number of 4-byte units counts as UTF-32.
    const bool utf32_length = data.size() >= 4 && data.size() % 4 == 0;
    if (utf32_length && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
        err = "File has a UTF-32LE BOM, not UTF-16: " + path;
        return false;
    }
    if (utf32_length && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
        err = "File has a UTF-32BE BOM, not UTF-16: " + path;
        return false;
    }

    size_t skip = 0;
    info.has_bom = false;
    if (data.size() >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
        info.byte_order = Utf16ByteOrder::LittleEndian;
        info.has_bom = true;
        skip = 2;
    } else if (data.size() >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
        info.byte_order = Utf16ByteOrder::BigEndian;
        info.has_bom = true;
        skip = 2;
    }
    // No BOM -> keep the byte order the caller asked for

    if (!utf16_bytes_to_units(data.data() + skip, data.size() - skip, info.byte_order, out, err)) {
        err += " (" + path + ")";
        return false;
    }
    return true;
}
