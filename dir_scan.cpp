#include "dir_scan.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

static std::string to_lower_ascii(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool has_wanted_extension(const std::string &name, const std::vector<std::string> &extensions)
{
    if (extensions.empty()) return true;
    const std::string lower = to_lower_ascii(name);
    for (const auto &ext : extensions) {
        const std::string e = to_lower_ascii(ext);
        if (lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0) return true;
    }
    return false;
}

bool collect_files_from_directory(const std::string &dir, const std::vector<std::string> &extensions, std::vector<std::string> &out, std::string &err)
{
    std::error_code ec;
    std::filesystem::path root(dir);
    if (!std::filesystem::exists(root, ec)) { err = "Directory does not exist: " + dir; return false; }
    if (!std::filesystem::is_directory(root, ec)) { err = "Not a directory: " + dir; return false; }

    std::vector<std::string> found;
    for (auto it = std::filesystem::recursive_directory_iterator(root, std::filesystem::directory_options::skip_permission_denied, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) continue;
        const auto &entry = *it;
        if (!entry.is_regular_file(ec) || ec) continue;
        if (!has_wanted_extension(entry.path().filename().string(), extensions)) continue;
        found.push_back(entry.path().string());
    }
    if (ec) {
        err = "Failed to scan directory " + dir + ": " + ec.message();
        return false;
    }

    std::sort(found.begin(), found.end());
    out.insert(out.end(), found.begin(), found.end());
    return true;
}
