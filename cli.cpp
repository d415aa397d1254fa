#include "cli.h"
#include "dir_scan.h"
#include "file_list_reader.h"
#include "surrogate_report.h"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace {

// Code units of context shown on each side of an unpaired surrogate.
const std::size_t kReportContext = 8;

void print_result(const FileCheckResult &result, const CommandLine &cmd)
{
    if (result.well_formed) {
        if (!cmd.quiet) {
            std::cout << result.path << ": OK (" << result.unit_count << " code units, " << byte_order_name(result.info.byte_order) << ")\n";
        }
        return;
    }

    std::cout << result.path << ": ill-formed, " << result.unpaired_total << " unpaired surrogate"
              << (result.unpaired_total == 1 ? "" : "s") << "\n";
    for (const auto &u : result.unpaired) {
        std::cout << "  " << format_unpaired_surrogate(result.units, u, kReportContext) << "\n";
    }
    if (result.unpaired.size() < result.unpaired_total) {
        std::cout << "  ... " << (result.unpaired_total - result.unpaired.size()) << " more\n";
    }
    if (result.written && !cmd.quiet) {
        const std::string &target = cmd.check.output_path.empty() ? result.path : cmd.check.output_path;
        std::cout << "  repaired -> " << target << "\n";
    }
}

} // namespace

void print_usage(const char *argv0)
{
    std::cout << "Usage: " << argv0 << " [options] <path>...\n"
              << "Check UTF-16 files for unpaired surrogates.\n\n"
              << "  --fix              rewrite ill-formed files with U+FFFD replacements\n"
              << "  -o, --output FILE  write the sanitized result to FILE (single input only)\n"
              << "  -r, --recursive    scan directory arguments recursively\n"
              << "  --ext EXT          with -r, only scan files ending in EXT (repeatable)\n"
              << "  --list FILE        read more input paths from FILE\n"
              << "  --be               assume big endian for files without a BOM\n"
              << "  --max-report N     report at most N unpaired surrogates per file (0 = all, default 10)\n"
              << "  -q, --quiet        only print errors and ill-formed files\n"
              << "  -v, --verbose      trace file writes\n"
              << "  -h, --help         show this help\n";
}

bool parse_size(const std::string &text, std::size_t &out)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

bool parse_command_line(int argc, char **argv, CommandLine &cmd, std::string &err)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string &value) -> bool {
            if (i + 1 >= argc) { err = "Missing value for " + arg; return false; }
            value = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "--fix") {
            cmd.check.fix = true;
        } else if (arg == "-o" || arg == "--output") {
            if (!next_value(cmd.check.output_path)) return false;
        } else if (arg == "-r" || arg == "--recursive") {
            cmd.recursive = true;
        } else if (arg == "--ext") {
            std::string ext;
            if (!next_value(ext)) return false;
            if (!ext.empty() && ext[0] != '.') ext = "." + ext;
            cmd.extensions.push_back(ext);
        } else if (arg == "--list") {
            std::string list;
            if (!next_value(list)) return false;
            cmd.list_files.push_back(list);
        } else if (arg == "--be") {
            cmd.check.default_byte_order = Utf16ByteOrder::BigEndian;
        } else if (arg == "--max-report") {
            std::string n;
            if (!next_value(n)) return false;
            if (!parse_size(n, cmd.check.max_report)) { err = "Invalid value for --max-report: " + n; return false; }
        } else if (arg == "-q" || arg == "--quiet") {
            cmd.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.check.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err = "Unknown option: " + arg;
            return false;
        } else {
            cmd.inputs.push_back(arg);
        }
    }
    return true;
}

bool gather_inputs(const CommandLine &cmd, std::vector<std::string> &files, std::string &err)
{
    std::vector<std::string> paths = cmd.inputs;
    for (const auto &list : cmd.list_files) {
        if (!read_file_list(list, paths, err)) return false;
    }

    for (const auto &p : paths) {
        std::error_code ec;
        if (std::filesystem::is_directory(p, ec)) {
            if (!cmd.recursive) {
                err = "Is a directory (use -r): " + p;
                return false;
            }
            if (!collect_files_from_directory(p, cmd.extensions, files, err)) return false;
        } else {
            files.push_back(p);
        }
    }

    if (files.empty()) {
        err = "No input files";
        return false;
    }
    return true;
}

void ExitStatus::record(const FileCheckResult &result)
{
    if (result.well_formed) return;
    ++m_ill_formed;
    // A repaired file no longer counts as a failure.
    if (!result.written && m_code == kExitWellFormed) m_code = kExitIllFormed;
}

int check_files(const CommandLine &cmd, const std::vector<std::string> &files)
{
    if (!cmd.check.output_path.empty() && files.size() != 1) {
        std::cerr << "--output requires exactly one input file (got " << files.size() << ")\n";
        return kExitError;
    }

    ExitStatus status;
    for (const auto &f : files) {
        FileCheckResult result;
        std::string err;
        if (!check_utf16_file(f, cmd.check, result, err)) {
            std::cerr << err << "\n";
            status.record_error();
            continue;
        }
        print_result(result, cmd);
        status.record(result);
    }

    if (!cmd.quiet) {
        std::cout << "Checked " << files.size() << " file" << (files.size() == 1 ? "" : "s") << ", " << status.ill_formed() << " ill-formed\n";
    }
    return status.code();
}

int run_wfcheck(int argc, char **argv)
{
    const char *argv0 = argc > 0 ? argv[0] : "wfcheck";
    CommandLine cmd;
    std::string err;
    if (!parse_command_line(argc, argv, cmd, err)) {
        std::cerr << err << "\n";
        print_usage(argv0);
        return kExitError;
    }
    if (cmd.help) {
        print_usage(argv0);
        return kExitWellFormed;
    }
    if (cmd.inputs.empty() && cmd.list_files.empty()) {
        print_usage(argv0);
        return kExitError;
    }

    std::vector<std::string> files;
    if (!gather_inputs(cmd, files, err)) {
        std::cerr << err << "\n";
        return kExitError;
    }
    return check_files(cmd, files);
}
