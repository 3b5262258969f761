#include "bucket.archiver.hh"
#include "macros.hh"
#include "object.lister.hh"

s3zip::BucketArchiver::BucketArchiver(
  std::string_view bucket_name,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_(bucket_name)
  , connection_pool_(std::move(connection_pool))
  , objects_archived_(0)
  , bytes_archived_(0)
{
    EXPECT(!bucket_name_.empty(), "S3 bucket name is empty");
    EXPECT(connection_pool_, "S3 connection pool is null");
}

bool
s3zip::BucketArchiver::archive(std::string_view prefix,
                               std::string_view exclude_key,
                               const ZipWriter::Output& output,
                               std::string& error)
{
    std::vector<S3ObjectEntry> entries;
    {
        ObjectLister lister(bucket_name_, connection_pool_);
        if (!lister.list_all(prefix, entries, error)) {
            return false;
        }
    }

    LOG_INFO("Archiving ",
             entries.size(),
             " object(s) under ",
             bucket_name_,
             "/",
             prefix);

    ZipWriter zip(output);
    for (const auto& entry : entries) {
        if (entry.key.empty() || entry.key.back() == '/') {
            LOG_DEBUG("Skipping directory marker ", entry.key);
            continue;
        }

        if (entry.key == exclude_key) {
            LOG_DEBUG("Skipping ", entry.key, ": it is the archive itself");
            continue;
        }

        if (!archive_object_(entry, zip, error)) {
            return false;
        }
    }

    if (!zip.close()) {
        error = "Failed to write archive directory: " + zip.error();
        return false;
    }

    LOG_INFO("Archived ",
             objects_archived_,
             " object(s), ",
             bytes_archived_,
             " bytes, into a ",
             zip.bytes_written(),
             "-byte archive");

    return true;
}

bool
s3zip::BucketArchiver::archive_object_(const S3ObjectEntry& entry,
                                       ZipWriter& zip,
                                       std::string& error)
{
    if (!zip.begin_entry(entry.key, entry.size, entry.last_modified)) {
        error = "Failed to write archive header for " + entry.key + ": " +
                zip.error();
        return false;
    }

    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available to read " + entry.key;
        return false;
    }

    bool retval = false;
    S3Error s3_error;
    try {
        retval = connection->get_object(
          bucket_name_,
          entry.key,
          [&zip](ConstByteSpan chunk) { return zip.write(chunk); },
          s3_error);
    } catch (const std::exception& exc) {
        s3_error.message = exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    if (!retval) {
        error = "Failed to read " + bucket_name_ + "/" + entry.key + ": " +
                (zip.error().empty() ? s3_error.to_string() : zip.error());
        return false;
    }

    // catches objects that changed size since they were listed
    if (!zip.end_entry()) {
        error = zip.error();
        return false;
    }

    ++objects_archived_;
    bytes_archived_ += entry.size;
    LOG_DEBUG("Archived ", entry.key, " (", entry.size, " bytes)");

    return true;
}
