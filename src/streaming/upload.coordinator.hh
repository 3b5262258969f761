#pragma once

#include "part.hh"
#include "thread.pool.hh"
#include "upload.session.hh"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace s3zip {
/// A part whose latest upload attempt failed and which is not in flight.
struct FailedPart
{
    uint32_t number{ 0 };
    uint32_t attempts{ 0 };
    std::string error;
};

/**
 * @brief Dispatches part uploads to a thread pool and collects their outcomes.
 * @details At most `max_in_flight` parts are queued, backing off or uploading
 * at any time; dispatching blocks until a slot frees up, which applies
 * backpressure to the producer. Outcomes are kept in a table keyed by part
 * number, written only by completion callbacks under the coordinator's lock.
 * A permanent upload error cancels the coordinator and aborts the session.
 */
class UploadCoordinator
{
  public:
    using Clock = std::chrono::steady_clock;

    UploadCoordinator(std::shared_ptr<UploadSession> session,
                      std::shared_ptr<ThreadPool> thread_pool,
                      size_t max_in_flight);
    ~UploadCoordinator() noexcept;

    /**
     * @brief Upload a new part.
     * @details Part numbers must be dispatched densely and in order, starting
     * at 1.
     * @param part The part to upload. Must not be empty.
     * @param deadline Give up waiting for a free slot at this time.
     * @return True if the part was dispatched, false if the coordinator was
     * cancelled or the deadline passed.
     */
    [[nodiscard]] bool dispatch(Part part, Clock::time_point deadline);

    /**
     * @brief Upload a failed part again, with its original payload.
     * @param part_number The number of a part in the failed set.
     * @param delay Backoff to wait, in the worker, before uploading.
     * @param deadline Give up waiting for a free slot at this time.
     * @return True if the part was dispatched, false if the coordinator was
     * cancelled or the deadline passed.
     */
    [[nodiscard]] bool redispatch(uint32_t part_number,
                                  std::chrono::milliseconds delay,
                                  Clock::time_point deadline);

    /**
     * @brief Block until some part has failed, nothing is in flight, or the
     * coordinator is cancelled.
     * @param deadline Stop waiting at this time.
     * @return False if the deadline passed first, otherwise true.
     */
    [[nodiscard]] bool await_outcomes(Clock::time_point deadline);

    /// @brief Stop dispatching and ignore the outcomes of in-flight uploads.
    void cancel();

    std::vector<FailedPart> failed_parts() const;
    std::vector<CompletedPart> acknowledged_parts() const;

    uint32_t parts_dispatched() const;
    size_t parts_in_flight() const;

    /// @brief True if no part is in flight or awaiting a retry.
    bool is_idle() const;
    bool is_cancelled() const;

    /// @brief Why the coordinator was cancelled, if it was.
    std::string error() const;

  private:
    enum class PartStatus
    {
        InFlight,
        Acknowledged,
        Failed,
    };

    struct PartRecord
    {
        Part part;
        PartStatus status;
        uint32_t attempts;
        std::string etag;
        std::string error;
    };

    std::shared_ptr<UploadSession> session_;
    std::shared_ptr<ThreadPool> thread_pool_;
    const size_t max_in_flight_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::map<uint32_t, PartRecord> parts_;
    size_t in_flight_;
    size_t n_acknowledged_;
    size_t n_failed_;
    uint32_t last_part_number_;
    bool cancelled_;
    std::string error_;

    template<typename Predicate>
    [[nodiscard]] bool wait_until_(std::unique_lock<std::mutex>& lock,
                                   Clock::time_point deadline,
                                   Predicate&& predicate);
    [[nodiscard]] bool await_slot_(std::unique_lock<std::mutex>& lock,
                                   Clock::time_point deadline);
    [[nodiscard]] bool submit_(Part part, std::chrono::milliseconds delay);
    void upload_(const Part& part, std::chrono::milliseconds delay);
    void record_outcome_(uint32_t part_number,
                         UploadResult result,
                         std::string&& etag,
                         std::string&& error);
};
} // namespace s3zip
