#include "completion.assembler.hh"
#include "macros.hh"
#include "upload.pipeline.hh"

s3zip::UploadPipeline::UploadPipeline(const PipelineConfig& config,
                                      std::shared_ptr<StorageEndpoint> endpoint)
  : config_(config)
  , endpoint_(std::move(endpoint))
  , buffer_(config.part_size)
  , deadline_(Clock::time_point::max())
  , finished_(false)
  , empty_stream_(false)
{
    EXPECT(endpoint_, "Storage endpoint is null");
    EXPECT(!config_.destination_key.empty(), "Destination key is empty");
    EXPECT(config_.max_in_flight > 0,
           "Must allow at least one upload in flight");
    EXPECT(config_.max_part_count > 0, "Maximum part count must be positive");
}

s3zip::UploadPipeline::~UploadPipeline() noexcept
{
    try {
        if (session_ && !session_->is_terminal()) {
            fail_("Upload pipeline destroyed before the upload finished");
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    // members are destroyed in reverse order: the retry engine, then the
    // coordinator (waits for in-flight jobs), then the thread pool
}

bool
s3zip::UploadPipeline::open()
{
    EXPECT(!session_, "Upload pipeline is already open");

    std::string error;
    session_ = open_upload_session(endpoint_, config_.destination_key, error);
    if (!session_) {
        set_error_(error);
        return false;
    }

    thread_pool_ = std::make_shared<ThreadPool>(
      config_.max_in_flight,
      [this](const std::string& err) { this->set_error_(err); });
    coordinator_ = std::make_unique<UploadCoordinator>(
      session_, thread_pool_, config_.max_in_flight);
    retry_engine_ = std::make_unique<RetryEngine>(
      *coordinator_, session_, config_.retry_policy);

    if (config_.timeout.count() > 0) {
        deadline_ = Clock::now() + config_.timeout;
    }

    return true;
}

bool
s3zip::UploadPipeline::append(ConstByteSpan data)
{
    EXPECT(session_, "Upload pipeline is not open");
    EXPECT(!finished_, "Cannot append after end of stream");

    if (!check_running_()) {
        return false;
    }

    if (data.empty()) {
        return true;
    }

    buffer_.append(data);
    for (auto& part : buffer_.drain_full_parts()) {
        if (!dispatch_(std::move(part))) {
            return false;
        }
    }

    // pick up parts that failed since the last append
    if (!retry_engine_->retry_failed_parts(deadline_)) {
        fail_(retry_engine_->error());
        return false;
    }

    return true;
}

std::optional<s3zip::ObjectRef>
s3zip::UploadPipeline::finish()
{
    EXPECT(session_, "Upload pipeline is not open");
    EXPECT(!finished_, "Upload pipeline is already finished");
    finished_ = true;

    if (!check_running_()) {
        return std::nullopt;
    }

    if (auto part = buffer_.flush_remainder(); part.has_value()) {
        if (!dispatch_(std::move(*part))) {
            return std::nullopt;
        }
    }

    const auto n_parts = coordinator_->parts_dispatched();
    if (n_parts == 0) {
        empty_stream_ = true;
        fail_("Stream is empty, nothing to upload");
        return std::nullopt;
    }

    if (!retry_engine_->drain(deadline_)) {
        fail_(retry_engine_->error());
        return std::nullopt;
    }

    std::string error;
    auto object = assemble_and_complete(
      *session_, coordinator_->acknowledged_parts(), n_parts, error);
    if (!object) {
        set_error_(error);
        return std::nullopt;
    }

    LOG_INFO("Uploaded ",
             buffer_.bytes_appended(),
             " bytes in ",
             n_parts,
             " part(s) to ",
             config_.destination_key);

    return object;
}

void
s3zip::UploadPipeline::cancel(std::string_view reason)
{
    if (session_) {
        fail_(std::string(reason));
    } else {
        set_error_(std::string(reason));
    }
}

s3zip::SessionState
s3zip::UploadPipeline::state() const
{
    if (session_) {
        return session_->state();
    }

    return error().empty() ? SessionState::Created : SessionState::Aborted;
}

std::string
s3zip::UploadPipeline::error() const
{
    std::scoped_lock lock(error_mutex_);
    return error_;
}

uint32_t
s3zip::UploadPipeline::parts_dispatched() const
{
    return coordinator_ ? coordinator_->parts_dispatched() : 0;
}

void
s3zip::UploadPipeline::set_error_(const std::string& msg)
{
    std::scoped_lock lock(error_mutex_);
    if (error_.empty()) {
        error_ = msg;
    }
}

void
s3zip::UploadPipeline::fail_(const std::string& reason)
{
    set_error_(reason);

    if (coordinator_) {
        coordinator_->cancel();
    }

    session_->abort(reason);
}

bool
s3zip::UploadPipeline::check_running_()
{
    if (session_->state() == SessionState::Aborted) {
        // e.g., a worker saw a permanent error
        set_error_(session_->error());
        coordinator_->cancel();
        return false;
    }

    if (Clock::now() >= deadline_) {
        fail_("Upload timed out after " +
              std::to_string(config_.timeout.count()) + " s");
        return false;
    }

    return true;
}

bool
s3zip::UploadPipeline::dispatch_(Part&& part)
{
    if (part.number > config_.max_part_count) {
        fail_("Part " + std::to_string(part.number) + " exceeds the limit of " +
              std::to_string(config_.max_part_count) +
              " parts; use a larger part size");
        return false;
    }

    if (!coordinator_->dispatch(std::move(part), deadline_)) {
        fail_(coordinator_->is_cancelled() ? coordinator_->error()
                                           : "Timed out waiting for an "
                                             "upload slot");
        return false;
    }

    return true;
}
