#pragma once

#include <string>
#include <vector>

// Read a list of input paths, one per line (UTF-8 text file). Blank lines and
// lines starting with '#' are skipped. Paths are appended to out_files.
// On error, returns false and sets err to a message.
bool read_file_list(const std::string &list_path, std::vector<std::string> &out_files, std::string &err);
