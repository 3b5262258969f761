#include "macros.hh"
#include "upload.coordinator.hh"

s3zip::UploadCoordinator::UploadCoordinator(
  std::shared_ptr<UploadSession> session,
  std::shared_ptr<ThreadPool> thread_pool,
  size_t max_in_flight)
  : session_(std::move(session))
  , thread_pool_(std::move(thread_pool))
  , max_in_flight_(max_in_flight)
  , in_flight_(0)
  , n_acknowledged_(0)
  , n_failed_(0)
  , last_part_number_(0)
  , cancelled_(false)
{
    EXPECT(session_, "Upload session is null");
    EXPECT(thread_pool_, "Thread pool is null");
    EXPECT(max_in_flight_ > 0, "Must allow at least one upload in flight");
}

s3zip::UploadCoordinator::~UploadCoordinator() noexcept
{
    // jobs refer to this coordinator, so wait for them to drain
    std::unique_lock lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return in_flight_ == 0; });
}

template<typename Predicate>
bool
s3zip::UploadCoordinator::wait_until_(std::unique_lock<std::mutex>& lock,
                                      Clock::time_point deadline,
                                      Predicate&& predicate)
{
    if (deadline == Clock::time_point::max()) {
        cv_.wait(lock, predicate);
        return true;
    }

    return cv_.wait_until(lock, deadline, predicate);
}

bool
s3zip::UploadCoordinator::await_slot_(std::unique_lock<std::mutex>& lock,
                                      Clock::time_point deadline)
{
    const bool ready = wait_until_(lock, deadline, [this] {
        return cancelled_ || in_flight_ < max_in_flight_;
    });

    if (!ready) {
        LOG_WARNING("Timed out waiting for one of ",
                    max_in_flight_,
                    " in-flight uploads to finish");
        return false;
    }

    return !cancelled_;
}

bool
s3zip::UploadCoordinator::dispatch(Part part, Clock::time_point deadline)
{
    EXPECT(part.size() > 0, "Cannot upload empty part ", part.number);

    std::unique_lock lock(mutex_);
    EXPECT(part.number == last_part_number_ + 1,
           "Part ",
           part.number,
           " dispatched out of order, expected part ",
           last_part_number_ + 1);

    if (!await_slot_(lock, deadline)) {
        return false;
    }

    last_part_number_ = part.number;
    parts_.emplace(part.number,
                   PartRecord{ .part = part,
                               .status = PartStatus::InFlight,
                               .attempts = 1,
                               .etag = {},
                               .error = {} });
    ++in_flight_;
    lock.unlock();

    LOG_DEBUG("Dispatching part ", part.number, " (", part.size(), " bytes)");
    return submit_(std::move(part), std::chrono::milliseconds(0));
}

bool
s3zip::UploadCoordinator::redispatch(uint32_t part_number,
                                     std::chrono::milliseconds delay,
                                     Clock::time_point deadline)
{
    std::unique_lock lock(mutex_);

    auto it = parts_.find(part_number);
    EXPECT(it != parts_.end() && it->second.status == PartStatus::Failed,
           "Part ",
           part_number,
           " is not awaiting a retry");

    if (!await_slot_(lock, deadline)) {
        return false;
    }

    auto& record = it->second;
    record.status = PartStatus::InFlight;
    ++record.attempts;
    --n_failed_;
    ++in_flight_;

    Part part = record.part;
    const auto attempt = record.attempts;
    lock.unlock();

    LOG_INFO("Retrying part ",
             part_number,
             " (attempt ",
             attempt,
             ") after ",
             delay.count(),
             " ms");
    return submit_(std::move(part), delay);
}

bool
s3zip::UploadCoordinator::submit_(Part part, std::chrono::milliseconds delay)
{
    const auto part_number = part.number;
    auto job = [this, part = std::move(part), delay](std::string&) {
        upload_(part, delay);
        return true;
    };

    if (!thread_pool_->push_job(std::move(job))) {
        record_outcome_(part_number,
                        UploadResult::PermanentError,
                        {},
                        "Thread pool is not accepting jobs");
        return false;
    }

    return true;
}

void
s3zip::UploadCoordinator::upload_(const Part& part,
                                  std::chrono::milliseconds delay)
{
    {
        std::unique_lock lock(mutex_);
        if (delay.count() > 0) {
            cv_.wait_for(lock, delay, [this] { return cancelled_; });
        }

        if (cancelled_) {
            --in_flight_;
            cv_.notify_all();
            return;
        }
    }

    std::string etag, error;
    UploadResult result;
    try {
        result = session_->upload_part(part, etag, error);
    } catch (const std::exception& exc) {
        result = UploadResult::TransientError;
        error = exc.what();
    }

    if (result == UploadResult::Ok && etag.empty()) {
        result = UploadResult::TransientError;
        error = "Store returned no ETag for part " + std::to_string(part.number);
    }

    record_outcome_(part.number, result, std::move(etag), std::move(error));
}

void
s3zip::UploadCoordinator::record_outcome_(uint32_t part_number,
                                          UploadResult result,
                                          std::string&& etag,
                                          std::string&& error)
{
    std::string abort_reason;
    std::shared_ptr<UploadSession> session; // outlives this coordinator

    {
        std::unique_lock lock(mutex_);
        --in_flight_;

        auto& record = parts_.at(part_number);
        if (cancelled_) {
            // the session is being torn down; this outcome no longer matters
            cv_.notify_all();
            return;
        }

        switch (result) {
            case UploadResult::Ok:
                record.status = PartStatus::Acknowledged;
                record.etag = std::move(etag);
                record.error.clear();
                record.part.payload.reset(); // only failed parts keep bytes
                ++n_acknowledged_;
                LOG_DEBUG("Uploaded part ", part_number, " (", record.etag, ")");
                break;
            case UploadResult::TransientError:
                record.status = PartStatus::Failed;
                record.error = std::move(error);
                ++n_failed_;
                LOG_WARNING("Attempt ",
                            record.attempts,
                            " to upload part ",
                            part_number,
                            " failed: ",
                            record.error);
                break;
            case UploadResult::PermanentError:
                record.status = PartStatus::Failed;
                record.error = std::move(error);
                ++n_failed_;
                cancelled_ = true;
                error_ = "Part " + std::to_string(part_number) +
                         " failed permanently: " + record.error;
                abort_reason = error_;
                session = session_;
                break;
        }

        cv_.notify_all();
    }

    if (session) {
        session->abort(abort_reason);
    }
}

bool
s3zip::UploadCoordinator::await_outcomes(Clock::time_point deadline)
{
    std::unique_lock lock(mutex_);
    return wait_until_(lock, deadline, [this] {
        return cancelled_ || in_flight_ == 0 || n_failed_ > 0;
    });
}

void
s3zip::UploadCoordinator::cancel()
{
    std::unique_lock lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
}

std::vector<s3zip::FailedPart>
s3zip::UploadCoordinator::failed_parts() const
{
    std::unique_lock lock(mutex_);

    std::vector<FailedPart> failed;
    failed.reserve(n_failed_);
    for (const auto& [number, record] : parts_) {
        if (record.status == PartStatus::Failed) {
            failed.push_back({ .number = number,
                               .attempts = record.attempts,
                               .error = record.error });
        }
    }

    return failed;
}

std::vector<s3zip::CompletedPart>
s3zip::UploadCoordinator::acknowledged_parts() const
{
    std::unique_lock lock(mutex_);

    std::vector<CompletedPart> acknowledged;
    acknowledged.reserve(n_acknowledged_);
    for (const auto& [number, record] : parts_) {
        if (record.status == PartStatus::Acknowledged) {
            acknowledged.push_back({ .number = number, .etag = record.etag });
        }
    }

    return acknowledged;
}

uint32_t
s3zip::UploadCoordinator::parts_dispatched() const
{
    std::unique_lock lock(mutex_);
    return last_part_number_;
}

size_t
s3zip::UploadCoordinator::parts_in_flight() const
{
    std::unique_lock lock(mutex_);
    return in_flight_;
}

bool
s3zip::UploadCoordinator::is_idle() const
{
    std::unique_lock lock(mutex_);
    return in_flight_ == 0 && n_failed_ == 0;
}

bool
s3zip::UploadCoordinator::is_cancelled() const
{
    std::unique_lock lock(mutex_);
    return cancelled_;
}

std::string
s3zip::UploadCoordinator::error() const
{
    std::unique_lock lock(mutex_);
    return error_;
}
