#pragma once

#include "definitions.hh"
#include "part.buffer.hh"
#include "retry.engine.hh"
#include "retry.policy.hh"
#include "storage.endpoint.hh"
#include "thread.pool.hh"
#include "upload.coordinator.hh"
#include "upload.session.hh"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace s3zip {
struct PipelineConfig
{
    std::string destination_key;
    size_t part_size{ DEFAULT_PART_SIZE };
    uint32_t max_in_flight{ DEFAULT_MAX_IN_FLIGHT };
    RetryPolicy retry_policy;
    std::chrono::seconds timeout{ 0 }; // 0 means no timeout
    uint32_t max_part_count{ MAX_PART_COUNT };
};

/**
 * @brief Uploads a byte stream of unknown length into a single object.
 * @details Appended bytes are cut into parts of `part_size` bytes and
 * uploaded concurrently as soon as each part is full; at most
 * `max_in_flight` parts are outstanding, so memory stays bounded by
 * roughly (max_in_flight + 1) * part_size. `finish()` flushes the final,
 * possibly short, part, retries whatever failed and completes the upload.
 * Any unrecoverable failure aborts the upload session.
 *
 * Append and finish are called from a single producer thread.
 */
class UploadPipeline
{
  public:
    using Clock = UploadCoordinator::Clock;

    UploadPipeline(const PipelineConfig& config,
                   std::shared_ptr<StorageEndpoint> endpoint);
    ~UploadPipeline() noexcept;

    /**
     * @brief Open the upload session.
     * @return True if the session was opened, otherwise false.
     */
    [[nodiscard]] bool open();

    /**
     * @brief Append producer output to the stream.
     * @details Blocks while the maximum number of parts are in flight.
     * @param data The bytes to append.
     * @return True if the bytes were accepted, false if the upload has failed.
     */
    [[nodiscard]] bool append(ConstByteSpan data);

    /**
     * @brief Signal end-of-stream and complete the upload.
     * @return The created object, or nullopt if the upload was aborted.
     */
    std::optional<ObjectRef> finish();

    /**
     * @brief Abort the upload.
     * @param reason Why the upload is being cancelled.
     */
    void cancel(std::string_view reason);

    SessionState state() const;
    std::string error() const;

    /// @brief True if finish() found no bytes to upload.
    bool is_empty_stream() const { return empty_stream_; }

    uint64_t bytes_appended() const { return buffer_.bytes_appended(); }
    uint32_t parts_dispatched() const;

  private:
    const PipelineConfig config_;
    std::shared_ptr<StorageEndpoint> endpoint_;
    PartBuffer buffer_;

    Clock::time_point deadline_;
    bool finished_;
    bool empty_stream_;

    mutable std::mutex error_mutex_;
    std::string error_; // first error only

    std::shared_ptr<UploadSession> session_;
    std::shared_ptr<ThreadPool> thread_pool_;
    std::unique_ptr<UploadCoordinator> coordinator_;
    std::unique_ptr<RetryEngine> retry_engine_;

    void set_error_(const std::string& msg);

    /** @brief Cancel in-flight uploads, record the error and abort. */
    void fail_(const std::string& reason);

    /** @brief Check that the upload is neither aborted nor out of time. */
    [[nodiscard]] bool check_running_();

    [[nodiscard]] bool dispatch_(Part&& part);
};
} // namespace s3zip
