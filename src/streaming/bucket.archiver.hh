#pragma once

#include "s3.connection.hh"
#include "zip.writer.hh"

#include <memory>
#include <string>
#include <string_view>

namespace s3zip {
/**
 * @brief Streams every object under a key prefix into a zip archive.
 * @details Objects are archived in listing order under their full keys and
 * with their last-modified times. Each body is read with GetObject and
 * deflated into the output chunk by chunk, so no object is ever held whole in
 * memory. Directory markers (keys ending in '/') and the excluded key are
 * skipped.
 */
class BucketArchiver
{
  public:
    BucketArchiver(std::string_view bucket_name,
                   std::shared_ptr<S3ConnectionPool> connection_pool);

    /**
     * @brief Archive the objects under @p prefix.
     * @param[in] prefix The key prefix of the objects to archive.
     * @param[in] exclude_key A key to leave out, e.g., the archive itself.
     * @param[in] output Receives the archive bytes, central directory
     * included.
     * @param[out] error A diagnostic message on failure.
     * @return True if every object was archived and the central directory
     * written.
     */
    [[nodiscard]] bool archive(std::string_view prefix,
                               std::string_view exclude_key,
                               const ZipWriter::Output& output,
                               std::string& error);

  private:
    const std::string bucket_name_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;

    size_t objects_archived_;
    uint64_t bytes_archived_;

    [[nodiscard]] bool archive_object_(const S3ObjectEntry& entry,
                                       ZipWriter& zip,
                                       std::string& error);
};
} // namespace s3zip
