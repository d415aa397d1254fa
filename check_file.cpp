#include "check_file.h"
#include "utf16_writer.h"
#include "well_formed.h"

#include <filesystem>
#include <iostream>
#include <system_error>

static bool write_units(Utf16Writer *writer, const std::u16string &units, const Utf16FileInfo &info, std::string &err)
{
    if (!write_utf16(writer, units, info.byte_order, info.has_bom, err)) return false;
    return writer->close(err);
}

static bool save_units(const std::string &path, const std::u16string &units, const Utf16FileInfo &info, bool verbose, std::string &err)
{
    auto writer = create_utf16_file_writer(path, verbose);
    if (!writer) {
        err = "Failed to open output file: " + path;
        return false;
    }
    return write_units(writer.get(), units, info, err);
}

// Replace 'path' only once the new contents are fully on disk, so a failed
// write leaves the original file as it was.
static bool replace_units(const std::string &path, const std::u16string &units, const Utf16FileInfo &info, bool verbose, std::string &err)
{
    const std::string tmp = temp_path_for(path);
    auto writer = create_utf16_file_writer(tmp, verbose);
    if (!writer) {
        err = "Failed to open temporary file: " + tmp;
        return false;
    }

    std::error_code ec;
    if (write_units(writer.get(), units, info, err)) {
        writer.reset();
        std::filesystem::rename(tmp, path, ec);
        if (!ec) return true;
        err = "Failed to replace " + path + ": " + ec.message();
    }
    writer.reset();
    std::error_code remove_ec;
    std::filesystem::remove(tmp, remove_ec);
    if (remove_ec) {
        std::cerr << "[WellFormed16][Check] " << tmp << " - Failed to remove temporary file: " << remove_ec.message() << "\n";
    }
    return false;
}

std::string temp_path_for(const std::string &path)
{
    return path + ".wfcheck.tmp";
}

bool check_utf16_file(const std::string &path, const FileCheckOptions &options, FileCheckResult &result, std::string &err)
{
    result = FileCheckResult{};
    result.path = path;
    result.info.byte_order = options.default_byte_order;
    if (!read_utf16_file(path, result.info, result.units, err)) return false;

    result.unit_count = result.units.size();
    result.well_formed = is_well_formed(result.units);
    if (!result.well_formed) {
        result.unpaired_total = count_unpaired_surrogates(result.units);
        result.unpaired = find_unpaired_surrogates(result.units, options.max_report);
    }

    if (!options.output_path.empty()) {
        if (!save_units(options.output_path, to_well_formed(result.units), result.info, options.verbose, err)) return false;
        result.written = true;
    } else if (options.fix && !result.well_formed) {
        std::u16string fixed = result.units;
        const std::size_t replaced = make_well_formed(fixed);
        if (options.verbose) {
            std::cout << "[WellFormed16][Check] " << path << " - Replacing " << replaced << " unpaired surrogates" << "\n";
        }
        if (!replace_units(path, fixed, result.info, options.verbose, err)) return false;
        result.written = true;
    }
    return true;
}
