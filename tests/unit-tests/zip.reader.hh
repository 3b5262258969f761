#pragma once

#include "definitions.hh"
#include "macros.hh"

#include <zlib.h>

#include <string>
#include <vector>

/// A zip archive entry, read back through the central directory.
struct ZipEntry
{
    std::string name;
    uint16_t version_needed{ 0 };
    uint16_t flags{ 0 };
    uint16_t method{ 0 };
    uint16_t dos_time{ 0 };
    uint16_t dos_date{ 0 };
    uint32_t crc{ 0 };
    uint64_t compressed_size{ 0 };
    uint64_t size{ 0 };
    uint64_t offset{ 0 };
    uint32_t mtime{ 0 }; // from the "UT" extra field
    ByteVector data;     // inflated
};

struct ZipDirectory
{
    std::vector<ZipEntry> entries;
    bool has_zip64_end{ false };
    uint16_t end_entry_count{ 0 }; // as stored in the classic end record
};

inline uint64_t
read_le(const ByteVector& bytes, size_t offset, int width)
{
    CHECK(offset + width <= bytes.size());

    uint64_t value = 0;
    for (auto i = width - 1; i >= 0; --i) {
        value = (value << 8) | bytes[offset + i];
    }
    return value;
}

inline ByteVector
inflate_raw(const uint8_t* data, size_t n, size_t expected_size)
{
    ByteVector out(expected_size + 1);

    z_stream zs{};
    CHECK(inflateInit2(&zs, -MAX_WBITS) == Z_OK);
    zs.next_in = const_cast<Bytef*>(data);
    zs.avail_in = static_cast<uInt>(n);
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const auto ret = inflate(&zs, Z_FINISH);
    const auto produced = zs.total_out;
    inflateEnd(&zs);

    EXPECT(ret == Z_STREAM_END, "Inflate returned ", ret);
    out.resize(produced);
    return out;
}

/// Read the archive the way unzip does: end record, then central directory.
inline ZipDirectory
read_zip(const ByteVector& archive)
{
    ZipDirectory directory;

    CHECK(archive.size() >= 22);
    const size_t end = archive.size() - 22;
    CHECK(read_le(archive, end, 4) == 0x06054b50);

    directory.end_entry_count = read_le(archive, end + 10, 2);
    uint64_t n_entries = directory.end_entry_count;
    uint64_t directory_offset = read_le(archive, end + 16, 4);

    if (end >= 20 && read_le(archive, end - 20, 4) == 0x07064b50) {
        directory.has_zip64_end = true;
        const auto zip64_end = read_le(archive, end - 20 + 8, 8);
        CHECK(read_le(archive, zip64_end, 4) == 0x06064b50);
        n_entries = read_le(archive, zip64_end + 32, 8);
        directory_offset = read_le(archive, zip64_end + 48, 8);
    }

    size_t pos = directory_offset;
    for (uint64_t i = 0; i < n_entries; ++i) {
        CHECK(read_le(archive, pos, 4) == 0x02014b50);

        ZipEntry entry;
        entry.version_needed = read_le(archive, pos + 6, 2);
        entry.flags = read_le(archive, pos + 8, 2);
        entry.method = read_le(archive, pos + 10, 2);
        entry.dos_time = read_le(archive, pos + 12, 2);
        entry.dos_date = read_le(archive, pos + 14, 2);
        entry.crc = read_le(archive, pos + 16, 4);
        entry.compressed_size = read_le(archive, pos + 20, 4);
        entry.size = read_le(archive, pos + 24, 4);
        const auto name_length = read_le(archive, pos + 28, 2);
        const auto extra_length = read_le(archive, pos + 30, 2);
        const auto comment_length = read_le(archive, pos + 32, 2);
        entry.offset = read_le(archive, pos + 42, 4);
        entry.name.assign(
          reinterpret_cast<const char*>(archive.data() + pos + 46), name_length);

        size_t extra = pos + 46 + name_length;
        const size_t extra_end = extra + extra_length;
        while (extra + 4 <= extra_end) {
            const auto id = read_le(archive, extra, 2);
            const auto length = read_le(archive, extra + 2, 2);
            size_t field = extra + 4;
            if (id == 0x0001) {
                for (auto* value :
                     { &entry.size, &entry.compressed_size, &entry.offset }) {
                    if (*value == 0xffffffff) {
                        *value = read_le(archive, field, 8);
                        field += 8;
                    }
                }
            } else if (id == 0x5455 && (archive[field] & 1)) {
                entry.mtime = read_le(archive, field + 1, 4);
            }
            extra += 4 + length;
        }

        // the body follows the local header
        const auto local = entry.offset;
        CHECK(read_le(archive, local, 4) == 0x04034b50);
        const auto body = local + 30 + read_le(archive, local + 26, 2) +
                          read_le(archive, local + 28, 2);
        CHECK(body + entry.compressed_size <= archive.size());
        entry.data = inflate_raw(
          archive.data() + body, entry.compressed_size, entry.size);

        directory.entries.push_back(std::move(entry));
        pos = extra_end + comment_length;
    }

    return directory;
}
