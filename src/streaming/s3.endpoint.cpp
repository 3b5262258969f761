#include "macros.hh"
#include "s3.endpoint.hh"

s3zip::S3Endpoint::S3Endpoint(std::string_view bucket_name,
                              std::shared_ptr<S3ConnectionPool> connection_pool,
                              std::string_view content_type)
  : bucket_name_(bucket_name)
  , connection_pool_(std::move(connection_pool))
  , content_type_(content_type)
{
    EXPECT(!bucket_name_.empty(), "S3 bucket name is empty");
    EXPECT(connection_pool_, "S3 connection pool is null");
}

bool
s3zip::S3Endpoint::create_session(const std::string& key,
                                  std::string& upload_id,
                                  std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available";
        return false;
    }

    bool retval = false;
    try {
        S3Error s3_error;
        upload_id = connection->create_multipart_object(
          bucket_name_, key, content_type_, s3_error);
        if (upload_id.empty()) {
            error = "Failed to create multipart upload for " + key + ": " +
                    s3_error.to_string();
        } else {
            retval = true;
        }
    } catch (const std::exception& exc) {
        error = "Failed to create multipart upload for " + key + ": " +
                exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

s3zip::UploadResult
s3zip::S3Endpoint::upload_part(const std::string& key,
                               const std::string& upload_id,
                               uint32_t part_number,
                               ConstByteSpan data,
                               std::string& etag,
                               std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available";
        return UploadResult::PermanentError;
    }

    auto retval = UploadResult::TransientError;
    try {
        S3Error s3_error;
        etag = connection->upload_multipart_object_part(
          bucket_name_, key, upload_id, data, part_number, s3_error);
        if (!etag.empty()) {
            retval = UploadResult::Ok;
        } else {
            error = "Failed to upload part " + std::to_string(part_number) +
                    " of " + key + ": " + s3_error.to_string();
            retval = s3_error.is_retryable() ? UploadResult::TransientError
                                             : UploadResult::PermanentError;
        }
    } catch (const std::exception& exc) {
        // the transport threw mid-request, so the part may be sent again
        error = "Failed to upload part " + std::to_string(part_number) +
                " of " + key + ": " + exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
s3zip::S3Endpoint::complete_session(const std::string& key,
                                    const std::string& upload_id,
                                    const std::vector<CompletedPart>& parts,
                                    ObjectRef& object,
                                    std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available";
        return false;
    }

    bool retval = false;
    try {
        S3Error s3_error;
        retval = connection->complete_multipart_object(
          bucket_name_, key, upload_id, parts, object, s3_error);
        if (!retval) {
            error = "Failed to complete multipart upload of " + key + ": " +
                    s3_error.to_string();
        }
    } catch (const std::exception& exc) {
        error =
          "Failed to complete multipart upload of " + key + ": " + exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
s3zip::S3Endpoint::abort_session(const std::string& key,
                                 const std::string& upload_id,
                                 std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available";
        return false;
    }

    bool retval = false;
    try {
        S3Error s3_error;
        retval = connection->abort_multipart_object(
          bucket_name_, key, upload_id, s3_error);
        if (!retval) {
            error = "Failed to abort multipart upload of " + key + ": " +
                    s3_error.to_string();
        }
    } catch (const std::exception& exc) {
        error =
          "Failed to abort multipart upload of " + key + ": " + exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}
