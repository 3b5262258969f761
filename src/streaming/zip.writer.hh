#pragma once

#include "definitions.hh"

#include <zlib.h>

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace s3zip {
/**
 * @brief Writes a zip archive to a byte sink, one deflated entry at a time.
 * @details Nothing is ever seeked back over. Each local header is followed by
 * the deflated body and a data descriptor carrying the CRC-32 and sizes, and
 * the central directory is written by close(). ZIP64 records are used for
 * entries, offsets and entry counts that do not fit the classic fields.
 */
class ZipWriter
{
  public:
    /// Receives archive bytes in order. Returning false fails the archive.
    using Output = std::function<bool(ConstByteSpan)>;

    explicit ZipWriter(Output output,
                       int compression_level = Z_DEFAULT_COMPRESSION);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Write the local header of a file entry.
     * @param name The entry's path in the archive, UTF-8.
     * @param size The exact number of uncompressed bytes that will follow.
     * @param mtime The entry's modification time, in seconds since the epoch.
     * @return True if the header was written, otherwise false.
     */
    [[nodiscard]] bool begin_entry(std::string_view name,
                                   uint64_t size,
                                   std::time_t mtime = 0);

    /**
     * @brief Compress and write body bytes of the current entry.
     * @return False if the data overruns the declared size or the output
     * rejected it.
     */
    [[nodiscard]] bool write(ConstByteSpan data);

    /**
     * @brief Flush the current entry and write its data descriptor.
     * @return False if fewer bytes than declared were written.
     */
    [[nodiscard]] bool end_entry();

    /// @brief Write the central directory. No entry may be open.
    [[nodiscard]] bool close();

    uint64_t bytes_written() const { return bytes_written_; }
    size_t entries_written() const { return entries_.size(); }
    const std::string& error() const { return error_; }

  private:
    struct CentralEntry
    {
        std::string name;
        uint32_t crc{ 0 };
        uint64_t compressed_size{ 0 };
        uint64_t size{ 0 };
        uint64_t offset{ 0 };
        uint32_t mtime{ 0 };
        uint16_t dos_time{ 0 };
        uint16_t dos_date{ 0 };
        bool zip64{ false };
    };

    Output output_;

    z_stream zs_;
    bool zs_ready_;
    std::vector<uint8_t> deflate_buffer_;

    bool in_entry_;
    bool closed_;
    CentralEntry entry_;
    uint64_t entry_written_;

    std::vector<CentralEntry> entries_;
    uint64_t bytes_written_;
    std::string error_;

    [[nodiscard]] bool emit_(ConstByteSpan data);
    [[nodiscard]] bool deflate_(int flush);
    [[nodiscard]] bool write_central_entry_(const CentralEntry& entry);
    [[nodiscard]] bool fail_(const std::string& message);
};

/**
 * @brief Convert a time to the MS-DOS date and time fields of a zip header.
 * @details The conversion uses local time, as zip tools do. Times before
 * 1980, the earliest DOS date, are clamped to 1980-01-01 00:00:00.
 */
void
to_dos_time(std::time_t mtime, uint16_t& dos_time, uint16_t& dos_date);
} // namespace s3zip
