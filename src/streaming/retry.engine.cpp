#include "macros.hh"
#include "retry.engine.hh"

s3zip::RetryEngine::RetryEngine(UploadCoordinator& coordinator,
                                std::shared_ptr<UploadSession> session,
                                const RetryPolicy& policy)
  : coordinator_(coordinator)
  , session_(std::move(session))
  , policy_(policy)
{
    EXPECT(session_, "Upload session is null");
    EXPECT(policy_.max_attempts > 0, "Parts must get at least one attempt");
}

bool
s3zip::RetryEngine::retry_failed_parts(
  UploadCoordinator::Clock::time_point deadline)
{
    if (coordinator_.is_cancelled()) {
        if (error_.empty()) {
            error_ = coordinator_.error();
            if (error_.empty()) {
                error_ = "Upload cancelled";
            }
        }
        return false;
    }

    for (const auto& failed : coordinator_.failed_parts()) {
        if (!policy_.should_retry(failed.attempts)) {
            fail_("Part " + std::to_string(failed.number) + " failed after " +
                  std::to_string(failed.attempts) +
                  " attempt(s): " + failed.error);
            return false;
        }

        const auto delay = policy_.delay_before_retry(failed.attempts);
        if (!coordinator_.redispatch(failed.number, delay, deadline)) {
            fail_(coordinator_.is_cancelled()
                    ? coordinator_.error()
                    : "Timed out retrying part " +
                        std::to_string(failed.number));
            return false;
        }
    }

    return true;
}

bool
s3zip::RetryEngine::drain(UploadCoordinator::Clock::time_point deadline)
{
    while (true) {
        if (!retry_failed_parts(deadline)) {
            return false;
        }

        if (coordinator_.is_idle()) {
            return !coordinator_.is_cancelled();
        }

        if (!coordinator_.await_outcomes(deadline)) {
            fail_("Timed out waiting for " +
                  std::to_string(coordinator_.parts_in_flight()) +
                  " part upload(s)");
            return false;
        }
    }
}

void
s3zip::RetryEngine::fail_(const std::string& reason)
{
    if (error_.empty()) {
        error_ = reason.empty() ? "Upload cancelled" : reason;
    }

    coordinator_.cancel();
    session_->abort(error_);
}
