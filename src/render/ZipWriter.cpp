#include "render/ZipWriter.hpp"

#include <stdexcept>
#include <utility>

#include <zlib.h>

#include "report/Timestamps.hpp"

namespace render {

static void put16(std::string& out, std::uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

static void put32(std::string& out, std::uint32_t v) {
    put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    put16(out, static_cast<std::uint16_t>((v >> 16) & 0xFFFF));
}

std::string raw_deflate(const std::string& data) {
    z_stream zs{};
    // negative window bits: raw deflate, no zlib wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string compressed;
    compressed.resize(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_out = reinterpret_cast<Bytef*>(&compressed[0]);
    zs.avail_out = static_cast<uInt>(compressed.size());

    const int ret = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed with code " + std::to_string(ret));
    }
    compressed.resize(produced);
    return compressed;
}

ZipWriter::ZipWriter(const std::string& timestamp) {
    dos_date_ = static_cast<std::uint16_t>((1 << 5) | 1);   // 1980-01-01
    const auto t = report::parse_iso8601(timestamp);
    if (!t) return;

    const report::CivilTime c = report::to_civil(*t);
    if (c.year < 1980 || c.year > 2107) return;
    dos_date_ = static_cast<std::uint16_t>(((c.year - 1980) << 9) | (c.month << 5) | c.day);
    dos_time_ = static_cast<std::uint16_t>((c.hour << 11) | (c.minute << 5) | (c.second / 2));
}

void ZipWriter::add(const std::string& name, const std::string& data) {
    Entry e;
    e.name = name;
    e.size = static_cast<std::uint32_t>(data.size());
    e.crc = static_cast<std::uint32_t>(
        crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
    e.offset = static_cast<std::uint32_t>(out_.size());

    const std::string body = raw_deflate(data);
    e.compressed_size = static_cast<std::uint32_t>(body.size());

    put32(out_, 0x04034b50);
    put16(out_, 20);                 // version needed
    put16(out_, 0);                  // flags
    put16(out_, 8);                  // deflate
    put16(out_, dos_time_);
    put16(out_, dos_date_);
    put32(out_, e.crc);
    put32(out_, e.compressed_size);
    put32(out_, e.size);
    put16(out_, static_cast<std::uint16_t>(name.size()));
    put16(out_, 0);                  // extra length
    out_ += name;
    out_ += body;

    entries_.push_back(std::move(e));
}

std::string ZipWriter::finish() {
    const std::uint32_t cd_offset = static_cast<std::uint32_t>(out_.size());
    for (const auto& e : entries_) {
        put32(out_, 0x02014b50);
        put16(out_, 20);             // version made by
        put16(out_, 20);             // version needed
        put16(out_, 0);
        put16(out_, 8);
        put16(out_, dos_time_);
        put16(out_, dos_date_);
        put32(out_, e.crc);
        put32(out_, e.compressed_size);
        put32(out_, e.size);
        put16(out_, static_cast<std::uint16_t>(e.name.size()));
        put16(out_, 0);              // extra
        put16(out_, 0);              // comment
        put16(out_, 0);              // disk
        put16(out_, 0);              // internal attributes
        put32(out_, 0);              // external attributes
        put32(out_, e.offset);
        out_ += e.name;
    }
    const std::uint32_t cd_size = static_cast<std::uint32_t>(out_.size()) - cd_offset;

    put32(out_, 0x06054b50);
    put16(out_, 0);
    put16(out_, 0);
    put16(out_, static_cast<std::uint16_t>(entries_.size()));
    put16(out_, static_cast<std::uint16_t>(entries_.size()));
    put32(out_, cd_size);
    put32(out_, cd_offset);
    put16(out_, 0);                  // comment length

    std::string archive;
    archive.swap(out_);
    entries_.clear();
    return archive;
}

}  // namespace render
