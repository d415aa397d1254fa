#include "utf16_writer.h"
#include <exception>
#include <fstream>
#include <memory>
#include <iostream>
#include <string>

// Appends to a caller-owned buffer. Used for in-memory output and tests.
class Utf16VectorWriterImpl : public Utf16Writer {
public:
    explicit Utf16VectorWriterImpl(std::vector<std::uint8_t> &out) : m_out(out) {}
    bool write(const std::uint8_t *data, std::size_t size, std::string &err) override {
        if (size == 0) return true;
        try {
            m_out.insert(m_out.end(), data, data + size);
        } catch (const std::exception &e) {
            err = std::string("Failed to append to buffer: ") + e.what();
            return false;
        }
        return true;
    }
private:
    std::vector<std::uint8_t> &m_out;
};

class Utf16FileWriterImpl : public Utf16Writer {
public:
    Utf16FileWriterImpl(const std::string &path, bool verbose)
        : m_out(path, std::ios::binary | std::ios::out | std::ios::trunc), m_path(path), m_verbose(verbose)
    {
        if (!ok()) {
            std::cerr << "[WellFormed16][FileWriter] " << m_path << " - Failed to open output file" << "\n";
        } else if (m_verbose) {
            std::cout << "[WellFormed16][FileWriter] " << m_path << " - Opened output file" << "\n";
        }
    }

    ~Utf16FileWriterImpl() override {
        std::string err;
        if (!close(err)) {
            std::cerr << "[WellFormed16][FileWriter] " << m_path << " - " << err << "\n";
        }
    }

    bool close(std::string &err) override {
        if (!m_out.is_open()) return true;
        m_out.flush();
        const bool flushed = static_cast<bool>(m_out);
        m_out.close();
        if (!flushed || !m_out) {
            err = "Failed to flush file: " + m_path;
            return false;
        }
        if (m_verbose) {
            std::cout << "[WellFormed16][FileWriter] " << m_path << " - Closed output file" << "\n";
        }
        return true;
    }

    bool ok() const { return m_out.is_open() && static_cast<bool>(m_out); }

    bool write(const std::uint8_t *data, std::size_t size, std::string &err) override {
        if (size == 0) return true;
        m_out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!m_out) {
            err = "Failed to write to file: " + m_path;
            std::cerr << "[WellFormed16][FileWriter] " << m_path << " - Write failed (" << size << " bytes)" << "\n";
            return false;
        }
        if (m_verbose) {
            std::cout << "[WellFormed16][FileWriter] " << m_path << " - Wrote " << size << " bytes" << "\n";
        }
        return true;
    }

private:
    std::ofstream m_out;
    std::string m_path;
    bool m_verbose;
};

std::unique_ptr<Utf16Writer> create_utf16_vector_writer(std::vector<std::uint8_t> &out) {
    return std::make_unique<Utf16VectorWriterImpl>(out);
}

std::unique_ptr<Utf16Writer> create_utf16_file_writer(const std::string &path, bool verbose) {
    auto fw = std::make_unique<Utf16FileWriterImpl>(path, verbose);
    if (!fw->ok()) return nullptr;
    return fw;
}

bool write_utf16(Utf16Writer *writer, std::u16string_view units, Utf16ByteOrder order, bool with_bom, std::string &err)
{
    if (writer == nullptr) { err = "No writer"; return false; }
    std::vector<std::uint8_t> bytes;
    units_to_utf16_bytes(units, order, with_bom, bytes);
    return writer->write(bytes.data(), bytes.size(), err);
}
