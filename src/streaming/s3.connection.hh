#pragma once

#include "part.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace s3zip {
struct S3Settings
{
    std::string endpoint;
    std::string bucket_name;
    std::optional<std::string> region;
};

/// A failed S3 request, as reported by the server or the transport.
struct S3Error
{
    int status_code{ 0 }; // 0 if no HTTP response was received
    std::string code;     // S3 error code, e.g., "NoSuchUpload"
    std::string message;

    /**
     * @brief Check whether the request may succeed if sent again.
     * @return True for transport failures, timeouts, throttling and server
     * errors, otherwise false.
     */
    [[nodiscard]] bool is_retryable() const;

    std::string to_string() const;
};

/// An entry from an object listing.
struct S3ObjectEntry
{
    std::string key;
    size_t size{ 0 };
    std::time_t last_modified{ 0 }; // seconds since the epoch, 0 if unknown
};

class S3Connection
{
  public:
    explicit S3Connection(const S3Settings& settings);

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /**
     * @brief List one page of the objects under a prefix.
     * @param[in] bucket_name The name of the bucket.
     * @param[in] prefix The key prefix to list.
     * @param[in] continuation_token The token returned by the previous page,
     * or empty for the first page.
     * @param[out] entries The objects on this page, in key order.
     * @param[out] next_token The token for the next page, empty if this is the
     * last page.
     * @param[out] error The failure, if any.
     * @returns True if the page was listed, otherwise false.
     */
    [[nodiscard]] bool list_objects(std::string_view bucket_name,
                                    std::string_view prefix,
                                    const std::string& continuation_token,
                                    std::vector<S3ObjectEntry>& entries,
                                    std::string& next_token,
                                    S3Error& error);

    /* Object operations */

    /**
     * @brief Stream the contents of an object.
     * @param bucket_name The name of the bucket.
     * @param object_name The name of the object.
     * @param on_chunk Called with each chunk received, in order. Returning
     * false stops the transfer.
     * @param error The failure, if any.
     * @returns True if the whole object was received, otherwise false.
     */
    [[nodiscard]] bool get_object(
      std::string_view bucket_name,
      std::string_view object_name,
      const std::function<bool(ConstByteSpan)>& on_chunk,
      S3Error& error);

    /* Multipart object operations */

    /// @brief Create a multipart object.
    /// @param bucket_name The name of the bucket.
    /// @param object_name The name of the object.
    /// @param content_type The object's Content-Type, or empty for the
    ///        server's default.
    /// @param error The failure, if any.
    /// @returns The upload id of the multipart object. Nonempty if and only if
    ///          the operation succeeds.
    std::string create_multipart_object(std::string_view bucket_name,
                                        std::string_view object_name,
                                        std::string_view content_type,
                                        S3Error& error);

    /// @brief Upload a part of a multipart object.
    /// @param bucket_name The name of the bucket.
    /// @param object_name The name of the object.
    /// @param upload_id The upload id of the multipart object.
    /// @param data The data to upload.
    /// @param part_number The part number of the object.
    /// @param error The failure, if any.
    /// @returns The etag of the uploaded part. Nonempty if and only if the
    ///          operation is successful.
    std::string upload_multipart_object_part(std::string_view bucket_name,
                                             std::string_view object_name,
                                             std::string_view upload_id,
                                             ConstByteSpan data,
                                             unsigned int part_number,
                                             S3Error& error);

    /// @brief Complete a multipart object.
    /// @param bucket_name The name of the bucket.
    /// @param object_name The name of the object.
    /// @param upload_id The upload id of the multipart object.
    /// @param parts List of the parts making up the object, in order.
    /// @param object The created object.
    /// @param error The failure, if any.
    /// @returns True if the object exists after the operation, otherwise false.
    [[nodiscard]] bool complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::vector<CompletedPart>& parts,
      ObjectRef& object,
      S3Error& error);

    /// @brief Abort a multipart object, discarding its uploaded parts.
    /// @param bucket_name The name of the bucket.
    /// @param object_name The name of the object.
    /// @param upload_id The upload id of the multipart object.
    /// @param error The failure, if any.
    /// @returns True if the upload was aborted, otherwise false.
    [[nodiscard]] bool abort_multipart_object(std::string_view bucket_name,
                                              std::string_view object_name,
                                              std::string_view upload_id,
                                              S3Error& error);

  private:
    std::unique_ptr<minio::creds::Provider> provider_;
    std::unique_ptr<minio::s3::Client> client_;
};

class S3ConnectionPool
{
  public:
    /**
     * @brief Open @p n_connections connections to the settings' bucket.
     * @throws std::runtime_error unless every connection can see the bucket.
     * Callers size the pool to the number of concurrent holders, so running
     * short would stall them.
     */
    S3ConnectionPool(size_t n_connections, const S3Settings& settings);
    ~S3ConnectionPool() noexcept;

    /**
     * @brief Take a connection from the pool, waiting for one to be returned
     * if all are in use.
     * @return A connection, or nullptr if the pool is shutting down.
     */
    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

    size_t n_connections() const { return n_connections_; }

  private:
    size_t n_connections_;
    std::vector<std::unique_ptr<S3Connection>> connections_;
    std::mutex connections_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace s3zip
