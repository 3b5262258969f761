#include "macros.hh"
#include "zip.writer.hh"

#include <algorithm>
#include <climits>

namespace {
constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t DATA_DESCRIPTOR_SIGNATURE = 0x08074b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t ZIP64_END_SIGNATURE = 0x06064b50;
constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;
constexpr uint32_t END_SIGNATURE = 0x06054b50;

constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
constexpr uint16_t TIMESTAMP_EXTRA_ID = 0x5455; // "UT", UTC mtime

constexpr uint16_t VERSION_DEFLATE = 20;
constexpr uint16_t VERSION_ZIP64 = 45;
constexpr uint16_t MADE_BY_UNIX = 3 << 8;

// bit 3: sizes and CRC follow the data; bit 11: names are UTF-8
constexpr uint16_t FLAGS = (1 << 3) | (1 << 11);
constexpr uint16_t METHOD_DEFLATE = 8;

constexpr uint32_t EXTERNAL_ATTRIBUTES = 0100644u << 16; // -rw-r--r--

constexpr uint64_t MAX_U32 = 0xffffffffULL;
constexpr uint64_t MAX_U16 = 0xffffULL;

constexpr size_t DEFLATE_BUFFER_SIZE = 1 << 16;

/// Little-endian record builder.
class Record
{
  public:
    Record& u8(uint64_t value)
    {
        put_(value, 1);
        return *this;
    }

    Record& u16(uint64_t value)
    {
        put_(value, 2);
        return *this;
    }

    Record& u32(uint64_t value)
    {
        put_(value, 4);
        return *this;
    }

    Record& u64(uint64_t value)
    {
        put_(value, 8);
        return *this;
    }

    Record& bytes(std::string_view value)
    {
        bytes_.insert(bytes_.end(), value.begin(), value.end());
        return *this;
    }

    Record& bytes(const Record& other)
    {
        bytes_.insert(bytes_.end(), other.bytes_.begin(), other.bytes_.end());
        return *this;
    }

    size_t size() const { return bytes_.size(); }
    ConstByteSpan span() const { return bytes_; }

  private:
    ByteVector bytes_;

    void put_(uint64_t value, int width)
    {
        for (auto i = 0; i < width; ++i) {
            bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
};

uint64_t
clamp32(uint64_t value)
{
    return std::min(value, MAX_U32);
}

Record
make_timestamp_extra(uint32_t mtime)
{
    Record extra;
    extra.u16(TIMESTAMP_EXTRA_ID).u16(5).u8(1).u32(mtime);
    return extra;
}
} // namespace

void
s3zip::to_dos_time(std::time_t mtime, uint16_t& dos_time, uint16_t& dos_date)
{
    std::tm tm{};
    if (localtime_r(&mtime, &tm) == nullptr || tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1; // 1980-01-01
        return;
    }

    dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) |
                                     (tm.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) |
                                     ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

s3zip::ZipWriter::ZipWriter(Output output, int compression_level)
  : output_(std::move(output))
  , zs_{}
  , zs_ready_(false)
  , deflate_buffer_(DEFLATE_BUFFER_SIZE)
  , in_entry_(false)
  , closed_(false)
  , entry_written_(0)
  , bytes_written_(0)
{
    EXPECT(output_, "Zip output is null");
    EXPECT(compression_level >= Z_DEFAULT_COMPRESSION &&
             compression_level <= Z_BEST_COMPRESSION,
           "Invalid compression level: ",
           compression_level);

    // negative window bits: raw deflate, no zlib wrapper
    const auto ret = deflateInit2(&zs_,
                                  compression_level,
                                  Z_DEFLATED,
                                  -MAX_WBITS,
                                  8,
                                  Z_DEFAULT_STRATEGY);
    CHECK(ret == Z_OK);
    zs_ready_ = true;
}

s3zip::ZipWriter::~ZipWriter()
{
    if (zs_ready_) {
        deflateEnd(&zs_);
    }
}

bool
s3zip::ZipWriter::begin_entry(std::string_view name,
                              uint64_t size,
                              std::time_t mtime)
{
    if (closed_) {
        return fail_("Archive is already closed");
    }
    if (in_entry_) {
        return fail_("Entry " + entry_.name + " is still open");
    }
    if (name.empty() || name.size() > MAX_U16) {
        return fail_("Invalid entry name length: " +
                     std::to_string(name.size()));
    }

    if (deflateReset(&zs_) != Z_OK) {
        return fail_("Failed to reset the deflate stream");
    }

    entry_ = {};
    entry_.name = name;
    entry_.size = size;
    entry_.offset = bytes_written_;
    entry_.mtime = static_cast<uint32_t>(std::clamp<std::time_t>(
      mtime, 0, static_cast<std::time_t>(MAX_U32)));
    to_dos_time(mtime, entry_.dos_time, entry_.dos_date);

    // the local header is written before the compressed size is known, so
    // commit to ZIP64 if the deflated body could reach 4 GiB
    entry_.zip64 = size >= MAX_U32 || deflateBound(&zs_, size) >= MAX_U32;
    entry_written_ = 0;

    Record extra;
    if (entry_.zip64) {
        // sizes are in the data descriptor
        extra.u16(ZIP64_EXTRA_ID).u16(16).u64(0).u64(0);
    }
    extra.bytes(make_timestamp_extra(entry_.mtime));

    const uint32_t placeholder = entry_.zip64 ? MAX_U32 : 0;

    Record header;
    header.u32(LOCAL_HEADER_SIGNATURE)
      .u16(entry_.zip64 ? VERSION_ZIP64 : VERSION_DEFLATE)
      .u16(FLAGS)
      .u16(METHOD_DEFLATE)
      .u16(entry_.dos_time)
      .u16(entry_.dos_date)
      .u32(0) // CRC-32, in the data descriptor
      .u32(placeholder)
      .u32(placeholder)
      .u16(entry_.name.size())
      .u16(extra.size())
      .bytes(entry_.name)
      .bytes(extra);

    if (!emit_(header.span())) {
        return false;
    }

    in_entry_ = true;
    return true;
}

bool
s3zip::ZipWriter::write(ConstByteSpan data)
{
    if (!in_entry_) {
        return fail_("No entry is open");
    }

    if (entry_written_ + data.size() > entry_.size) {
        return fail_("Entry " + entry_.name + " overruns its declared size of " +
                     std::to_string(entry_.size) + " bytes");
    }

    // zlib counts in uInt, so feed large spans in slices
    while (!data.empty()) {
        const auto n = std::min<size_t>(data.size(), UINT_MAX);
        const auto slice = data.first(n);

        entry_.crc = static_cast<uint32_t>(
          crc32(entry_.crc, slice.data(), static_cast<uInt>(n)));

        zs_.next_in = const_cast<Bytef*>(slice.data());
        zs_.avail_in = static_cast<uInt>(n);
        if (!deflate_(Z_NO_FLUSH)) {
            return false;
        }

        entry_written_ += n;
        data = data.subspan(n);
    }

    return true;
}

bool
s3zip::ZipWriter::end_entry()
{
    if (!in_entry_) {
        return fail_("No entry is open");
    }

    if (entry_written_ != entry_.size) {
        return fail_("Entry " + entry_.name + " is " +
                     std::to_string(entry_written_) + " bytes, expected " +
                     std::to_string(entry_.size));
    }

    zs_.next_in = nullptr;
    zs_.avail_in = 0;
    if (!deflate_(Z_FINISH)) {
        return false;
    }

    entry_.compressed_size = zs_.total_out;
    if (!entry_.zip64 && entry_.compressed_size >= MAX_U32) {
        return fail_("Entry " + entry_.name +
                     " compressed past the 4 GiB local header limit");
    }

    Record descriptor;
    descriptor.u32(DATA_DESCRIPTOR_SIGNATURE).u32(entry_.crc);
    if (entry_.zip64) {
        descriptor.u64(entry_.compressed_size).u64(entry_.size);
    } else {
        descriptor.u32(entry_.compressed_size).u32(entry_.size);
    }

    if (!emit_(descriptor.span())) {
        return false;
    }

    entries_.push_back(std::move(entry_));
    entry_ = {};
    in_entry_ = false;

    return true;
}

bool
s3zip::ZipWriter::close()
{
    if (closed_) {
        return fail_("Archive is already closed");
    }
    if (in_entry_) {
        return fail_("Entry " + entry_.name + " is still open");
    }

    const uint64_t directory_offset = bytes_written_;
    for (const auto& entry : entries_) {
        if (!write_central_entry_(entry)) {
            return false;
        }
    }
    const uint64_t directory_size = bytes_written_ - directory_offset;
    const uint64_t n_entries = entries_.size();

    const bool zip64 = n_entries >= MAX_U16 || directory_size >= MAX_U32 ||
                       directory_offset >= MAX_U32;

    Record trailer;
    if (zip64) {
        const uint64_t zip64_end_offset = bytes_written_;

        trailer.u32(ZIP64_END_SIGNATURE)
          .u64(44) // size of the rest of this record
          .u16(MADE_BY_UNIX | VERSION_ZIP64)
          .u16(VERSION_ZIP64)
          .u32(0) // this disk
          .u32(0) // disk holding the central directory
          .u64(n_entries)
          .u64(n_entries)
          .u64(directory_size)
          .u64(directory_offset);

        trailer.u32(ZIP64_LOCATOR_SIGNATURE)
          .u32(0)
          .u64(zip64_end_offset)
          .u32(1); // total disks
    }

    trailer.u32(END_SIGNATURE)
      .u16(0)
      .u16(0)
      .u16(std::min(n_entries, MAX_U16))
      .u16(std::min(n_entries, MAX_U16))
      .u32(clamp32(directory_size))
      .u32(clamp32(directory_offset))
      .u16(0); // comment length

    if (!emit_(trailer.span())) {
        return false;
    }

    closed_ = true;
    return true;
}

bool
s3zip::ZipWriter::emit_(ConstByteSpan data)
{
    if (data.empty()) {
        return true;
    }

    if (!output_(data)) {
        return fail_("Archive output rejected " + std::to_string(data.size()) +
                     " bytes");
    }

    bytes_written_ += data.size();
    return true;
}

bool
s3zip::ZipWriter::deflate_(int flush)
{
    while (true) {
        zs_.next_out = deflate_buffer_.data();
        zs_.avail_out = static_cast<uInt>(deflate_buffer_.size());

        const auto ret = deflate(&zs_, flush);
        if (ret == Z_STREAM_ERROR) {
            return fail_("Deflate failed for entry " + entry_.name);
        }

        const size_t produced = deflate_buffer_.size() - zs_.avail_out;
        if (!emit_({ deflate_buffer_.data(), produced })) {
            return false;
        }

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) {
                return true;
            }
        } else if (zs_.avail_in == 0 && zs_.avail_out != 0) {
            return true;
        }
    }
}

bool
s3zip::ZipWriter::write_central_entry_(const CentralEntry& entry)
{
    // fields that do not fit move to the ZIP64 extra, in this order
    Record zip64;
    if (entry.size >= MAX_U32) {
        zip64.u64(entry.size);
    }
    if (entry.compressed_size >= MAX_U32) {
        zip64.u64(entry.compressed_size);
    }
    if (entry.offset >= MAX_U32) {
        zip64.u64(entry.offset);
    }

    Record extra;
    if (zip64.size() > 0) {
        extra.u16(ZIP64_EXTRA_ID).u16(zip64.size()).bytes(zip64);
    }
    extra.bytes(make_timestamp_extra(entry.mtime));

    const bool needs_zip64 = entry.zip64 || zip64.size() > 0;
    const uint16_t version = needs_zip64 ? VERSION_ZIP64 : VERSION_DEFLATE;

    Record header;
    header.u32(CENTRAL_HEADER_SIGNATURE)
      .u16(MADE_BY_UNIX | version)
      .u16(version)
      .u16(FLAGS)
      .u16(METHOD_DEFLATE)
      .u16(entry.dos_time)
      .u16(entry.dos_date)
      .u32(entry.crc)
      .u32(clamp32(entry.compressed_size))
      .u32(clamp32(entry.size))
      .u16(entry.name.size())
      .u16(extra.size())
      .u16(0) // comment length
      .u16(0) // disk number
      .u16(0) // internal attributes
      .u32(EXTERNAL_ATTRIBUTES)
      .u32(clamp32(entry.offset))
      .bytes(entry.name)
      .bytes(extra);

    return emit_(header.span());
}

bool
s3zip::ZipWriter::fail_(const std::string& message)
{
    if (error_.empty()) {
        error_ = message;
    }
    return false;
}
