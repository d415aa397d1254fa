// Tests for wfcheck option parsing and exit codes.

#include <catch2/catch.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

#include "cli.h"

namespace {

namespace fs = std::filesystem;

// Owns argv-style strings for the duration of a test.
class Args
{
public:
    Args(std::initializer_list<std::string> args)
        : m_storage(args)
    {
        m_storage.insert(m_storage.begin(), "wfcheck");
        for (auto &s : m_storage) m_ptrs.push_back(&s[0]);
        m_ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(m_storage.size()); }
    char **argv() { return m_ptrs.data(); }

private:
    std::vector<std::string> m_storage;
    std::vector<char *> m_ptrs;
};

std::string temp_file(const std::string &name)
{
    return (fs::temp_directory_path() / ("wellformed16_cli_" + name)).string();
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

// BOM, 'A', U+1F600
const std::vector<std::uint8_t> kGoodBytes{0xFF, 0xFE, 0x41, 0x00, 0x3D, 0xD8, 0x00, 0xDE};
// BOM, 'A', lone D800
const std::vector<std::uint8_t> kBadBytes{0xFF, 0xFE, 0x41, 0x00, 0x00, 0xD8};

} // namespace

TEST_CASE("parse_command_line reads options and inputs", "[cli]") {
    Args args{"--fix", "--be", "--max-report", "3", "-q", "--ext", "txt", "-r", "a.txt", "dir"};
    CommandLine cmd;
    std::string err;
    REQUIRE(parse_command_line(args.argc(), args.argv(), cmd, err));
    CHECK(cmd.check.fix);
    CHECK(cmd.check.default_byte_order == Utf16ByteOrder::BigEndian);
    CHECK(cmd.check.max_report == 3);
    CHECK(cmd.quiet);
    CHECK(cmd.recursive);
    CHECK(cmd.extensions == std::vector<std::string>{".txt"});
    CHECK(cmd.inputs == (std::vector<std::string>{"a.txt", "dir"}));
}

TEST_CASE("parse_command_line rejects bad arguments", "[cli]") {
    CommandLine cmd;
    std::string err;

    SECTION("non-numeric --max-report") {
        Args args{"--max-report", "ten", "a.txt"};
        CHECK_FALSE(parse_command_line(args.argc(), args.argv(), cmd, err));
        CHECK(err == "Invalid value for --max-report: ten");
    }
    SECTION("negative --max-report") {
        Args args{"--max-report", "-1", "a.txt"};
        CHECK_FALSE(parse_command_line(args.argc(), args.argv(), cmd, err));
    }
    SECTION("missing value") {
        Args args{"a.txt", "--output"};
        CHECK_FALSE(parse_command_line(args.argc(), args.argv(), cmd, err));
        CHECK(err == "Missing value for --output");
    }
    SECTION("unknown option") {
        Args args{"--frobnicate", "a.txt"};
        CHECK_FALSE(parse_command_line(args.argc(), args.argv(), cmd, err));
        CHECK(err == "Unknown option: --frobnicate");
    }
}

TEST_CASE("parse_size accepts only plain decimal numbers", "[cli]") {
    std::size_t n = 7;
    CHECK(parse_size("0", n));
    CHECK(n == 0);
    CHECK(parse_size("42", n));
    CHECK(n == 42);
    CHECK_FALSE(parse_size("", n));
    CHECK_FALSE(parse_size("4x", n));
    CHECK_FALSE(parse_size("99999999999999999999999", n));
}

TEST_CASE("ExitStatus folds file outcomes", "[cli]") {
    FileCheckResult good;
    FileCheckResult bad;
    bad.well_formed = false;
    FileCheckResult repaired;
    repaired.well_formed = false;
    repaired.written = true;

    SECTION("all well-formed") {
        ExitStatus status;
        status.record(good);
        status.record(good);
        CHECK(status.code() == kExitWellFormed);
        CHECK(status.ill_formed() == 0);
    }
    SECTION("repaired files count as success") {
        ExitStatus status;
        status.record(repaired);
        CHECK(status.code() == kExitWellFormed);
        CHECK(status.ill_formed() == 1);
    }
    SECTION("an ill-formed file left as is") {
        ExitStatus status;
        status.record(good);
        status.record(bad);
        CHECK(status.code() == kExitIllFormed);
    }
    SECTION("an error outranks an earlier or later ill-formed file") {
        ExitStatus before;
        before.record_error();
        before.record(bad);
        CHECK(before.code() == kExitError);

        ExitStatus after;
        after.record(bad);
        after.record_error();
        CHECK(after.code() == kExitError);
    }
}

TEST_CASE("run_wfcheck exit codes", "[cli]") {
    const std::string good = temp_file("good.txt");
    const std::string bad = temp_file("bad.txt");
    const std::string missing = temp_file("missing.txt");
    const std::string out = temp_file("out.txt");
    write_bytes(good, kGoodBytes);
    write_bytes(bad, kBadBytes);
    fs::remove(missing);
    fs::remove(out);

    SECTION("well-formed files give 0") {
        Args args{"-q", good, good};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitWellFormed);
    }
    SECTION("an ill-formed file gives 1 and is left alone") {
        Args args{"-q", good, bad};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitIllFormed);
        CHECK(read_bytes(bad) == kBadBytes);
    }
    SECTION("a repaired file gives 0") {
        Args args{"-q", "--fix", bad};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitWellFormed);
        CHECK(read_bytes(bad) == (std::vector<std::uint8_t>{0xFF, 0xFE, 0x41, 0x00, 0xFD, 0xFF}));
    }
    SECTION("an I/O error before an ill-formed file gives 2") {
        Args args{"-q", missing, bad};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitError);
    }
    SECTION("--output with two inputs gives 2") {
        Args args{"-q", "--output", out, good, bad};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitError);
        CHECK_FALSE(fs::exists(out));
    }
    SECTION("--output with one input writes the copy") {
        Args args{"-q", "--output", out, bad};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitWellFormed);
        CHECK(read_bytes(out) == (std::vector<std::uint8_t>{0xFF, 0xFE, 0x41, 0x00, 0xFD, 0xFF}));
        CHECK(read_bytes(bad) == kBadBytes);
    }
    SECTION("usage errors give 2") {
        Args bad_count{"--max-report", "x", good};
        CHECK(run_wfcheck(bad_count.argc(), bad_count.argv()) == kExitError);
        Args no_inputs{"-q"};
        CHECK(run_wfcheck(no_inputs.argc(), no_inputs.argv()) == kExitError);
        Args directory{"-q", fs::temp_directory_path().string()};
        CHECK(run_wfcheck(directory.argc(), directory.argv()) == kExitError);
    }
    SECTION("--help gives 0") {
        Args args{"--help"};
        CHECK(run_wfcheck(args.argc(), args.argv()) == kExitWellFormed);
    }

    fs::remove(good);
    fs::remove(bad);
    fs::remove(out);
}
