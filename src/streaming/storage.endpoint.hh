#pragma once

#include "part.hh"

#include <string>
#include <vector>

namespace s3zip {
enum class UploadResult
{
    Ok,
    TransientError, // worth retrying, e.g., timeout or throttling
    PermanentError, // retrying cannot help, e.g., the session is gone
};

/**
 * @brief The chunked-upload operations of a remote object store.
 * @details Implementations must be safe to call from several threads at once;
 * part uploads for one session run concurrently.
 */
class StorageEndpoint
{
  public:
    virtual ~StorageEndpoint() = default;

    /**
     * @brief Start a chunked-upload session for the object at @p key.
     * @param[in] key The key of the object to create.
     * @param[out] upload_id The opaque session token.
     * @param[out] error A diagnostic message on failure.
     * @return True if the session was created, otherwise false.
     */
    [[nodiscard]] virtual bool create_session(const std::string& key,
                                              std::string& upload_id,
                                              std::string& error) = 0;

    /**
     * @brief Upload one part of a session.
     * @param[in] key The key of the object being uploaded.
     * @param[in] upload_id The session token.
     * @param[in] part_number The part number, starting at 1.
     * @param[in] data The part payload.
     * @param[out] etag The integrity tag of the stored part.
     * @param[out] error A diagnostic message on failure.
     * @return Ok on success, otherwise the class of failure.
     */
    [[nodiscard]] virtual UploadResult upload_part(const std::string& key,
                                                   const std::string& upload_id,
                                                   uint32_t part_number,
                                                   ConstByteSpan data,
                                                   std::string& etag,
                                                   std::string& error) = 0;

    /**
     * @brief Assemble the object from its parts and close the session.
     * @param[in] key The key of the object being uploaded.
     * @param[in] upload_id The session token.
     * @param[in] parts The parts, in ascending part-number order.
     * @param[out] object The created object.
     * @param[out] error A diagnostic message on failure.
     * @return True if the object was created, otherwise false.
     */
    [[nodiscard]] virtual bool complete_session(
      const std::string& key,
      const std::string& upload_id,
      const std::vector<CompletedPart>& parts,
      ObjectRef& object,
      std::string& error) = 0;

    /**
     * @brief Discard a session and any parts uploaded to it.
     * @param[in] key The key of the object being uploaded.
     * @param[in] upload_id The session token.
     * @param[out] error A diagnostic message on failure.
     * @return True if the session was discarded, otherwise false.
     */
    [[nodiscard]] virtual bool abort_session(const std::string& key,
                                             const std::string& upload_id,
                                             std::string& error) = 0;
};
} // namespace s3zip
