#pragma once

#include "part.hh"
#include "storage.endpoint.hh"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace s3zip {
enum class SessionState
{
    Created,
    Uploading,
    Completing,
    Completed,
    Aborted,
};

const char*
to_string(SessionState state);

/**
 * @brief One chunked-upload transaction against one destination key.
 * @details Created -> Uploading -> (Completing -> Completed) | Aborted.
 * Completed and Aborted are terminal. The upload id is passed unchanged to
 * every call on the endpoint. A session that is destroyed before reaching a
 * terminal state is aborted, so no orphaned parts are left in the store.
 * All methods are thread-safe.
 */
class UploadSession
{
  public:
    UploadSession(std::shared_ptr<StorageEndpoint> endpoint,
                  std::string_view key,
                  std::string_view upload_id);
    ~UploadSession() noexcept;

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /**
     * @brief Upload one part within this session.
     * @details The first call moves the session from Created to Uploading.
     * Fails permanently, without contacting the store, once the session is
     * completing or terminal.
     * @param[in] part The part to upload.
     * @param[out] etag The integrity tag of the stored part.
     * @param[out] error A diagnostic message on failure.
     * @return Ok on success, otherwise the class of failure.
     */
    [[nodiscard]] UploadResult upload_part(const Part& part,
                                           std::string& etag,
                                           std::string& error);

    /**
     * @brief Finalize the object from @p ordered_parts.
     * @details Moves Uploading -> Completing -> Completed. If finalizing fails
     * the session is aborted.
     * @param ordered_parts The acknowledged parts, ascending by part number.
     * @return The created object, or nullopt on failure.
     */
    [[nodiscard]] std::optional<ObjectRef> complete(
      const std::vector<CompletedPart>& ordered_parts);

    /**
     * @brief Abort the session, releasing its resources in the store.
     * @details No-op for a session that is already aborted. Refused while a
     * completion request is in flight, or after completion.
     * @param reason Why the session is being aborted.
     * @return True if the session is aborted after this call, otherwise false.
     */
    bool abort(std::string_view reason);

    SessionState state() const;
    bool is_terminal() const;

    const std::string& key() const { return key_; }
    const std::string& upload_id() const { return upload_id_; }

    /// @brief The reason the session was aborted, if it was.
    std::string error() const;

  private:
    std::shared_ptr<StorageEndpoint> endpoint_;
    const std::string key_;
    const std::string upload_id_;

    mutable std::mutex mutex_;
    SessionState state_;
    std::string error_;

    bool release_(std::string_view reason);
};

/**
 * @brief Open an upload session for the object at @p key.
 * @param[in] endpoint The store to upload to.
 * @param[in] key The key of the object to create.
 * @param[out] error A diagnostic message on failure.
 * @return The session in the Created state, or nullptr on failure.
 */
std::shared_ptr<UploadSession>
open_upload_session(std::shared_ptr<StorageEndpoint> endpoint,
                    std::string_view key,
                    std::string& error);
} // namespace s3zip
