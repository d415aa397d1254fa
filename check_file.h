#pragma once

#include "surrogate_report.h"
#include "utf16_file.h"

#include <cstddef>
#include <string>
#include <vector>

// Helpers that run the well-formedness check against files on disk without
// embedding file I/O into the core scan.

struct FileCheckOptions
{
    // Byte order assumed for files without a BOM.
    Utf16ByteOrder default_byte_order = Utf16ByteOrder::LittleEndian;
    // Rewrite the input file in place when it is ill-formed. The new contents
    // go to temp_path_for(path) first and are renamed over the input.
    bool fix = false;
    // If non-empty, always write the sanitized result here instead.
    std::string output_path;
    // Maximum number of unpaired surrogates recorded (0 = all).
    std::size_t max_report = 10;
    bool verbose = false;
};

struct FileCheckResult
{
    std::string path;
    Utf16FileInfo info;
    std::size_t unit_count = 0;
    bool well_formed = true;
    std::size_t unpaired_total = 0;
    std::vector<UnpairedSurrogate> unpaired;   // at most max_report entries
    std::u16string units;                      // as read, for report context
    bool written = false;                      // sanitized output was written
};

// Sibling file that --fix writes before renaming it over 'path'.
std::string temp_path_for(const std::string &path);

// Check one file, and repair or copy it as requested by 'options'.
// Returns false and sets err on I/O failure; an ill-formed file is not an error.
bool check_utf16_file(const std::string &path, const FileCheckOptions &options, FileCheckResult &result, std::string &err);
