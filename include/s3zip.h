#ifndef H_S3ZIP_V0
#define H_S3ZIP_V0

#include "s3zip.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for an S3Zip stream.
     * @details The stream uploads everything appended to it into a single
     * object at @p destination_key in the configured bucket, using a
     * multipart upload. Zero-valued numeric fields select the defaults.
     */
    typedef struct S3ZipStreamSettings_s
    {
        S3ZipS3Settings s3_settings;     /**< Destination bucket */
        const char* destination_key;     /**< Key of the object to create */
        const char* content_type;        /**< Object Content-Type, or NULL */
        size_t part_size_bytes;          /**< Size of every part but the last */
        uint32_t max_concurrent_uploads; /**< Cap on in-flight part uploads */
        S3ZipRetrySettings retry_settings; /**< Retry policy for failed parts */
        uint32_t timeout_seconds;        /**< Abort the upload after this long */
    } S3ZipStreamSettings;

    typedef struct S3ZipStream_s S3ZipStream;

    /**
     * @brief Get the version of the S3Zip API.
     * @return The version of the S3Zip API.
     */
    uint32_t S3Zip_get_api_version();

    /**
     * @brief Set the log level for the S3Zip API.
     * @param level The log level.
     * @return S3ZipStatusCode_Success on success, or an error code on failure.
     */
    S3ZipStatusCode S3Zip_set_log_level(S3ZipLogLevel level);

    /**
     * @brief Get the log level for the S3Zip API.
     * @return The log level for the S3Zip API.
     */
    S3ZipLogLevel S3Zip_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param code The status code.
     * @return A human-readable status message.
     */
    const char* S3Zip_get_status_message(S3ZipStatusCode code);

    /**
     * @brief Create an S3Zip stream and open its upload session.
     * @param settings The settings for the stream.
     * @return A pointer to the stream, or NULL on failure.
     */
    S3ZipStream* S3ZipStream_create(S3ZipStreamSettings* settings);

    /**
     * @brief Finalize the upload, if it is still open, and destroy the stream.
     * @details An upload session that has not been finalized is aborted, so
     * that no partial object is left behind.
     * @param stream The stream to destroy.
     */
    void S3ZipStream_destroy(S3ZipStream* stream);

    /**
     * @brief Append data to the stream.
     * @param[in] stream The stream to append data to.
     * @param[in] data The data to append.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes accepted by the stream.
     * @return S3ZipStatusCode_Success on success, or an error code on failure.
     */
    S3ZipStatusCode S3ZipStream_append(S3ZipStream* stream,
                                       const void* data,
                                       size_t bytes_in,
                                       size_t* bytes_out);

    /**
     * @brief Append an archive of every object under @p prefix in the
     * destination bucket to the stream.
     * @details Objects are read in listing order and streamed without being
     * buffered whole. The destination object itself is skipped.
     * @param stream The stream to append to.
     * @param prefix The key prefix of the objects to archive.
     * @return S3ZipStatusCode_Success on success, or an error code on failure.
     */
    S3ZipStatusCode S3ZipStream_archive_prefix(S3ZipStream* stream,
                                               const char* prefix);

    /**
     * @brief Signal end-of-stream and complete the upload.
     * @details Waits for every outstanding part, retrying failed parts, then
     * completes the upload session. On any failure the session is aborted.
     * @param stream The stream to finalize.
     * @return S3ZipStatusCode_Success if the destination object was created,
     * otherwise an error code.
     */
    S3ZipStatusCode S3ZipStream_finalize(S3ZipStream* stream);

    /**
     * @brief Get the state of the stream's upload session.
     * @param stream The stream.
     * @return The session state. Aborted if @p stream is NULL.
     */
    S3ZipSessionState S3ZipStream_get_state(const S3ZipStream* stream);

#ifdef __cplusplus
}
#endif

#endif // H_S3ZIP_V0
