#pragma once

#include "retry.policy.hh"
#include "upload.coordinator.hh"
#include "upload.session.hh"

#include <memory>
#include <string>

namespace s3zip {
/**
 * @brief Re-dispatches failed parts until they succeed or exhaust the retry
 * budget.
 * @details A part that runs out of attempts is terminal: the coordinator is
 * cancelled and the session aborted.
 */
class RetryEngine
{
  public:
    RetryEngine(UploadCoordinator& coordinator,
                std::shared_ptr<UploadSession> session,
                const RetryPolicy& policy);

    /**
     * @brief Re-dispatch every failed part that is not already in flight.
     * @details Does not wait for the retried uploads to finish.
     * @param deadline Give up waiting for a free upload slot at this time.
     * @return False if a part exhausted its attempts or the upload was
     * cancelled, otherwise true.
     */
    [[nodiscard]] bool retry_failed_parts(
      UploadCoordinator::Clock::time_point deadline);

    /**
     * @brief Retry failed parts until none are failed or in flight.
     * @param deadline Abort the session if parts are still outstanding at this
     * time.
     * @return True if every dispatched part is acknowledged, otherwise false.
     */
    [[nodiscard]] bool drain(UploadCoordinator::Clock::time_point deadline);

    const std::string& error() const { return error_; }

  private:
    UploadCoordinator& coordinator_;
    std::shared_ptr<UploadSession> session_;
    const RetryPolicy policy_;

    std::string error_;

    void fail_(const std::string& reason);
};
} // namespace s3zip
