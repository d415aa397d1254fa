#include "file_list_reader.h"

#include <fstream>
#include <sstream>

static std::string trim(const std::string &s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Remove UTF-8 BOM (0xEF,0xBB,0xBF) at start of the string
static void remove_utf8_bom(std::string &s)
{
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool read_file_list(const std::string &list_path, std::vector<std::string> &out_files, std::string &err)
{
    std::ifstream in(list_path, std::ios::binary);
    if (!in) {
        err = "Failed to open list file: " + list_path;
        return false;
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        err = "Failed to read list file: " + list_path;
        return false;
    }

    std::string list_content_utf8 = content.str();
    remove_utf8_bom(list_content_utf8);

    std::istringstream iss(list_content_utf8);
    std::string line;
    size_t added = 0;
    while (std::getline(iss, line)) {
        std::string s = trim(line);
        if (s.empty()) continue;
        if (s[0] == '#') continue; // comment
        out_files.push_back(s);
        ++added;
    }

    if (added == 0) {
        err = "No files listed in " + list_path;
        return false;
    }
    return true;
}
