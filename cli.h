#pragma once

#include "check_file.h"

#include <string>
#include <vector>

// wfcheck command line: option parsing, input expansion and exit codes.

enum ExitCode
{
    kExitWellFormed = 0,    // every file well-formed, or repaired
    kExitIllFormed = 1,     // an ill-formed file was left as is
    kExitError = 2          // usage or I/O error; wins over kExitIllFormed
};

struct CommandLine
{
    FileCheckOptions check;
    std::vector<std::string> inputs;
    std::vector<std::string> extensions;
    std::vector<std::string> list_files;
    bool recursive = false;
    bool quiet = false;
    bool help = false;
};

void print_usage(const char *argv0);

// Decimal digits only. Returns false on empty, non-numeric or overflowing text.
bool parse_size(const std::string &text, std::size_t &out);

bool parse_command_line(int argc, char **argv, CommandLine &cmd, std::string &err);

// Expand list files and directories into the final list of files to check.
bool gather_inputs(const CommandLine &cmd, std::vector<std::string> &files, std::string &err);

// Folds per-file outcomes into the process exit code.
class ExitStatus
{
public:
    void record_error() { m_code = kExitError; }
    void record(const FileCheckResult &result);

    int code() const { return m_code; }
    std::size_t ill_formed() const { return m_ill_formed; }

private:
    int m_code = kExitWellFormed;
    std::size_t m_ill_formed = 0;
};

// Check every file, print the report and return the exit code.
int check_files(const CommandLine &cmd, const std::vector<std::string> &files);

// Whole wfcheck run: parse, gather, check. Returns the exit code.
int run_wfcheck(int argc, char **argv);
