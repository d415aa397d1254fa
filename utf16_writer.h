#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "utf16_file.h"

// Abstract writer interface
class Utf16Writer
{
public:
    virtual ~Utf16Writer()=default;
    // Write 'size' bytes from data, return true on success, false and set err on failure
    virtual bool write(const std::uint8_t *data,std::size_t size,std::string &err)=0;
    // Flush and release the target. Return false and set err if buffered bytes could not be stored.
    virtual bool close(std::string &/*err*/){ return true; }
};

// Factory functions to create default writers. Implementations hidden in cpp
std::unique_ptr<Utf16Writer> create_utf16_vector_writer(std::vector<std::uint8_t> &out);
// Create a writer that writes directly to a file specified by path. Returns nullptr on failure to open file.
// With 'verbose' set every write is traced to stdout.
std::unique_ptr<Utf16Writer> create_utf16_file_writer(const std::string &path,bool verbose=false);

// Serialize 'units' in the given byte order and hand the bytes to 'writer'.
bool write_utf16(Utf16Writer *writer,std::u16string_view units,Utf16ByteOrder order,bool with_bom,std::string &err);
