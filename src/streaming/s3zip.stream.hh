#pragma once

#include "definitions.hh"
#include "s3.connection.hh"
#include "upload.pipeline.hh"

#include "s3zip.h"

#include <cstddef> // size_t
#include <memory>  // unique_ptr
#include <optional>
#include <string>
#include <string_view>

struct S3ZipStream_s
{
  public:
    S3ZipStream_s(struct S3ZipStreamSettings_s* settings);

    /**
     * @brief Append data to the upload.
     * @param data The data to append.
     * @param nbytes The number of bytes to append.
     * @return The number of bytes appended: @p nbytes, or 0 if the upload has
     * failed.
     */
    size_t append(const void* data, size_t nbytes);

    /**
     * @brief Append an archive of the objects under @p prefix.
     * @param prefix The key prefix of the objects to archive.
     * @return S3ZipStatusCode_Success on success, or an error code on failure.
     */
    S3ZipStatusCode archive_prefix(std::string_view prefix);

    S3ZipSessionState state() const;

    /// @brief The first error to occur, empty if none has.
    std::string error() const;

  private:
    std::string error_; // error message. If nonempty, an error occurred.

    s3zip::S3Settings s3_settings_;
    std::string destination_key_;
    std::string content_type_;
    std::optional<s3zip::ObjectRef> object_;
    bool finalized_;

    std::shared_ptr<s3zip::S3ConnectionPool> s3_connection_pool_;
    std::unique_ptr<s3zip::UploadPipeline> pipeline_;

    /**
     * @brief Check that the settings are valid.
     * @note Sets the error_ member if settings are invalid.
     * @param settings Struct containing settings to validate.
     * @return true if settings are valid, false otherwise.
     */
    [[nodiscard]] bool validate_settings_(
      const struct S3ZipStreamSettings_s* settings);

    /**
     * @brief Connect to the destination bucket and open the upload session.
     * @param settings Struct containing the validated settings.
     * @return True if the upload session is open, otherwise false.
     */
    [[nodiscard]] bool open_pipeline_(
      const struct S3ZipStreamSettings_s* settings);

    /**
     * @brief Set an error message.
     * @param msg The error message to set.
     */
    void set_error_(const std::string& msg);

    friend S3ZipStatusCode finalize_stream(struct S3ZipStream_s* stream);
};

/**
 * @brief Signal end-of-stream and complete the stream's upload.
 * @param stream The stream to finalize.
 * @return S3ZipStatusCode_Success if the object was created, otherwise the
 * reason it was not.
 */
S3ZipStatusCode
finalize_stream(struct S3ZipStream_s* stream);
