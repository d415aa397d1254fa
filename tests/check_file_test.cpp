// Tests for checking and repairing files on disk.

#include <catch2/catch.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "check_file.h"

namespace {

namespace fs = std::filesystem;

std::string temp_file(const std::string &name)
{
    return (fs::temp_directory_path() / ("wellformed16_check_" + name)).string();
}

void write_bytes(const std::string &path, const std::vector<std::uint8_t> &bytes)
{
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<std::uint8_t> read_bytes(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("check_utf16_file reports a well-formed file", "[check]") {
    const std::string path = temp_file("ok.txt");
    // BOM, 'A', U+1F600
    write_bytes(path, {0xFF, 0xFE, 0x41, 0x00, 0x3D, 0xD8, 0x00, 0xDE});

    FileCheckOptions options;
    options.fix = true;
    FileCheckResult result;
    std::string err;
    REQUIRE(check_utf16_file(path, options, result, err));
    CHECK(result.well_formed);
    CHECK(result.unit_count == 3);
    CHECK(result.unpaired_total == 0);
    CHECK(result.unpaired.empty());
    CHECK_FALSE(result.written);
    CHECK(read_bytes(path) == (std::vector<std::uint8_t>{0xFF, 0xFE, 0x41, 0x00, 0x3D, 0xD8, 0x00, 0xDE}));

    fs::remove(path);
}

TEST_CASE("check_utf16_file finds and limits unpaired surrogates", "[check]") {
    const std::string path = temp_file("bad.txt");
    // Big endian, no BOM: DC00 'A' D800 D800
    write_bytes(path, {0xDC, 0x00, 0x00, 0x41, 0xD8, 0x00, 0xD8, 0x00});

    FileCheckOptions options;
    options.default_byte_order = Utf16ByteOrder::BigEndian;
    options.max_report = 2;
    FileCheckResult result;
    std::string err;
    REQUIRE(check_utf16_file(path, options, result, err));
    CHECK_FALSE(result.well_formed);
    CHECK(result.unpaired_total == 3);
    REQUIRE(result.unpaired.size() == 2);
    CHECK(result.unpaired[0].offset == 0);
    CHECK(result.unpaired[1].offset == 2);
    CHECK_FALSE(result.written);

    fs::remove(path);
}

TEST_CASE("check_utf16_file --fix rewrites in the original byte order", "[check]") {
    const std::string path = temp_file("fix.txt");
    // BOM big endian, 'A', lone D800, 'B'
    write_bytes(path, {0xFE, 0xFF, 0x00, 0x41, 0xD8, 0x00, 0x00, 0x42});

    FileCheckOptions options;
    options.fix = true;
    FileCheckResult result;
    std::string err;
    REQUIRE(check_utf16_file(path, options, result, err));
    CHECK_FALSE(result.well_formed);
    CHECK(result.written);
    CHECK(read_bytes(path) == (std::vector<std::uint8_t>{0xFE, 0xFF, 0x00, 0x41, 0xFF, 0xFD, 0x00, 0x42}));

    FileCheckResult again;
    REQUIRE(check_utf16_file(path, options, again, err));
    CHECK(again.well_formed);
    CHECK_FALSE(again.written);
    CHECK_FALSE(fs::exists(temp_path_for(path)));

    fs::remove(path);
}

TEST_CASE("check_utf16_file --output leaves the input untouched", "[check]") {
    const std::string in_path = temp_file("in.txt");
    const std::string out_path = temp_file("out.txt");
    const std::vector<std::uint8_t> original{0x00, 0xDC, 0x41, 0x00};
    write_bytes(in_path, original);

    FileCheckOptions options;
    options.output_path = out_path;
    FileCheckResult result;
    std::string err;
    REQUIRE(check_utf16_file(in_path, options, result, err));
    CHECK(result.written);
    CHECK(read_bytes(in_path) == original);
    CHECK(read_bytes(out_path) == (std::vector<std::uint8_t>{0xFD, 0xFF, 0x41, 0x00}));

    fs::remove(in_path);
    fs::remove(out_path);
}

TEST_CASE("check_utf16_file reports I/O errors", "[check]") {
    FileCheckOptions options;
    FileCheckResult result;
    std::string err;
    CHECK_FALSE(check_utf16_file(temp_file("does_not_exist.txt"), options, result, err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("check_utf16_file --fix keeps the input when the rewrite fails", "[check]") {
    const std::string path = temp_file("fix_blocked.txt");
    const std::vector<std::uint8_t> original{0xFF, 0xFE, 0x41, 0x00, 0x00, 0xD8};
    write_bytes(path, original);
    // A directory where the temporary file would go makes the write fail.
    const std::string tmp = temp_path_for(path);
    fs::remove_all(tmp);
    fs::create_directory(tmp);

    FileCheckOptions options;
    options.fix = true;
    FileCheckResult result;
    std::string err;
    CHECK_FALSE(check_utf16_file(path, options, result, err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(result.written);
    CHECK(read_bytes(path) == original);
    CHECK(fs::is_directory(tmp));

    fs::remove_all(tmp);
    fs::remove(path);
}
