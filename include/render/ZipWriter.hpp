#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace render {

// In-memory zip archive, every entry raw-deflated. Entry times come from one
// fixed timestamp so identical input yields identical bytes.
class ZipWriter {
public:
    // ISO-8601; unparseable or pre-1980 values stamp 1980-01-01 00:00.
    explicit ZipWriter(const std::string& timestamp = "");

    void add(const std::string& name, const std::string& data);

    // Appends the central directory and returns the archive. The writer is
    // spent afterwards.
    std::string finish();

private:
    struct Entry {
        std::string name;
        std::uint32_t crc = 0;
        std::uint32_t compressed_size = 0;
        std::uint32_t size = 0;
        std::uint32_t offset = 0;
    };

    std::string out_;
    std::vector<Entry> entries_;
    std::uint16_t dos_time_ = 0;
    std::uint16_t dos_date_ = 0;
};

// Deflate without zlib header or trailer, as zip method 8 expects. Throws
// std::runtime_error on zlib failure.
std::string raw_deflate(const std::string& data);

}  // namespace render
