#pragma once

#include <string>
#include <vector>

// Enumerate regular files recursively under 'dir' and append their paths to
// 'out' in a stable (sorted) order. When 'extensions' is non-empty only files
// whose name ends in one of them (e.g. ".txt", compared case-insensitively)
// are kept.
// Returns true on success. On failure, returns false and sets 'err'.
bool collect_files_from_directory(const std::string &dir, const std::vector<std::string> &extensions, std::vector<std::string> &out, std::string &err);
