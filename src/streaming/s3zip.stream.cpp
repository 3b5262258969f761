#include "bucket.archiver.hh"
#include "macros.hh"
#include "s3.endpoint.hh"
#include "s3zip.stream.hh"

#include <algorithm>
#include <cctype>

namespace {
std::string
trim(const char* s)
{
    if (s == nullptr) {
        return {};
    }

    std::string_view sv(s);
    const auto first = std::find_if_not(
      sv.begin(), sv.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(sv.rbegin(), sv.rend(), [](unsigned char c) {
                          return std::isspace(c);
                      }).base();

    return first < last ? std::string(first, last) : std::string();
}

s3zip::S3Settings
make_s3_settings(const S3ZipS3Settings* settings)
{
    s3zip::S3Settings s3_settings{ .endpoint = trim(settings->endpoint),
                                   .bucket_name = trim(settings->bucket_name) };

    if (const auto region = trim(settings->region); !region.empty()) {
        s3_settings.region = region;
    }

    return s3_settings;
}

[[nodiscard]] bool
validate_s3_settings(const S3ZipS3Settings* settings, std::string& error)
{
    if (trim(settings->endpoint).empty()) {
        error = "S3 endpoint is empty";
        return false;
    }

    std::string trimmed = trim(settings->bucket_name);
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        error = "Invalid length for S3 bucket name: " +
                std::to_string(trimmed.length()) +
                ". Must be between 3 and 63 characters";
        return false;
    }

    return true;
}

[[nodiscard]] bool
validate_retry_settings(const S3ZipRetrySettings* settings, std::string& error)
{
    if (settings->max_delay_ms > 0 &&
        settings->base_delay_ms > settings->max_delay_ms) {
        error = "Retry base delay (" + std::to_string(settings->base_delay_ms) +
                " ms) exceeds the maximum delay (" +
                std::to_string(settings->max_delay_ms) + " ms)";
        return false;
    }

    return true;
}

s3zip::PipelineConfig
make_pipeline_config(const struct S3ZipStreamSettings_s* settings)
{
    s3zip::PipelineConfig config;
    config.destination_key = trim(settings->destination_key);

    if (settings->part_size_bytes > 0) {
        config.part_size = settings->part_size_bytes;
    }
    if (settings->max_concurrent_uploads > 0) {
        config.max_in_flight = settings->max_concurrent_uploads;
    }

    const auto& retry = settings->retry_settings;
    if (retry.max_attempts > 0) {
        config.retry_policy.max_attempts = retry.max_attempts;
    }
    if (retry.base_delay_ms > 0) {
        config.retry_policy.base_delay =
          std::chrono::milliseconds(retry.base_delay_ms);
    }
    if (retry.max_delay_ms > 0) {
        config.retry_policy.max_delay =
          std::chrono::milliseconds(retry.max_delay_ms);
    }
    // a base delay above the default maximum raises the maximum with it
    config.retry_policy.max_delay =
      std::max(config.retry_policy.max_delay, config.retry_policy.base_delay);

    config.timeout = std::chrono::seconds(settings->timeout_seconds);

    return config;
}

S3ZipSessionState
to_session_state(s3zip::SessionState state)
{
    switch (state) {
        case s3zip::SessionState::Created:
            return S3ZipSessionState_Created;
        case s3zip::SessionState::Uploading:
            return S3ZipSessionState_Uploading;
        case s3zip::SessionState::Completing:
            return S3ZipSessionState_Completing;
        case s3zip::SessionState::Completed:
            return S3ZipSessionState_Completed;
        case s3zip::SessionState::Aborted:
            return S3ZipSessionState_Aborted;
    }

    return S3ZipSessionState_Aborted;
}
} // namespace

/* S3ZipStream_s implementation */

S3ZipStream_s::S3ZipStream_s(struct S3ZipStreamSettings_s* settings)
  : error_()
  , finalized_(false)
{
    EXPECT(validate_settings_(settings), error_);

    s3_settings_ = make_s3_settings(&settings->s3_settings);
    destination_key_ = trim(settings->destination_key);
    content_type_ = trim(settings->content_type);

    EXPECT(open_pipeline_(settings), error_);
}

size_t
S3ZipStream_s::append(const void* data, size_t nbytes)
{
    EXPECT(!finalized_, "Cannot append data: stream is finalized");

    if (nbytes == 0) {
        return 0;
    }
    EXPECT(data != nullptr, "Null pointer: data");

    const ConstByteSpan span(static_cast<const uint8_t*>(data), nbytes);
    if (!pipeline_->append(span)) {
        set_error_(pipeline_->error());
        return 0;
    }

    return nbytes;
}

S3ZipStatusCode
S3ZipStream_s::archive_prefix(std::string_view prefix)
{
    EXPECT(!finalized_, "Cannot archive: stream is finalized");

    s3zip::BucketArchiver archiver(s3_settings_.bucket_name,
                                   s3_connection_pool_);

    std::string error;
    const bool archived = archiver.archive(
      prefix,
      destination_key_,
      [this](ConstByteSpan chunk) { return pipeline_->append(chunk); },
      error);

    if (!archived) {
        // the pipeline's own failure, if any, is the root cause
        const auto pipeline_error = pipeline_->error();
        if (pipeline_error.empty()) {
            pipeline_->cancel(error);
        }
        set_error_(pipeline_->error());

        return pipeline_error.empty() ? S3ZipStatusCode_IOError
                                      : S3ZipStatusCode_UploadAborted;
    }

    return S3ZipStatusCode_Success;
}

S3ZipSessionState
S3ZipStream_s::state() const
{
    return pipeline_ ? to_session_state(pipeline_->state())
                     : S3ZipSessionState_Aborted;
}

std::string
S3ZipStream_s::error() const
{
    return error_;
}

bool
S3ZipStream_s::validate_settings_(const struct S3ZipStreamSettings_s* settings)
{
    if (!settings) {
        set_error_("Null pointer: settings");
        return false;
    }

    std::string error;
    if (!validate_s3_settings(&settings->s3_settings, error)) {
        set_error_(error);
        return false;
    }

    if (trim(settings->destination_key).empty()) {
        set_error_("Destination key is empty");
        return false;
    }

    if (settings->part_size_bytes != 0 &&
        (settings->part_size_bytes < MIN_S3_PART_SIZE ||
         settings->part_size_bytes > MAX_S3_PART_SIZE)) {
        set_error_("Invalid part size: " +
                   std::to_string(settings->part_size_bytes) +
                   " bytes. Must be between " +
                   std::to_string(MIN_S3_PART_SIZE) + " and " +
                   std::to_string(MAX_S3_PART_SIZE) + " bytes");
        return false;
    }

    if (settings->max_concurrent_uploads > MAX_CONCURRENT_UPLOADS) {
        set_error_("Too many concurrent uploads: " +
                   std::to_string(settings->max_concurrent_uploads) +
                   ". Must be at most " +
                   std::to_string(MAX_CONCURRENT_UPLOADS));
        return false;
    }

    if (!validate_retry_settings(&settings->retry_settings, error)) {
        set_error_(error);
        return false;
    }

    return true;
}

bool
S3ZipStream_s::open_pipeline_(const struct S3ZipStreamSettings_s* settings)
{
    const auto config = make_pipeline_config(settings);

    // spin up S3 connection pool; one connection more than the upload cap so
    // that a producer reading from the bucket never starves the uploads. The
    // pool checks that every connection can see the bucket.
    try {
        s3_connection_pool_ = std::make_shared<s3zip::S3ConnectionPool>(
          config.max_in_flight + 1, s3_settings_);
    } catch (const std::exception& e) {
        set_error_("Error creating S3 connection pool: " +
                   std::string(e.what()));
        return false;
    }

    auto endpoint = std::make_shared<s3zip::S3Endpoint>(
      s3_settings_.bucket_name, s3_connection_pool_, content_type_);
    pipeline_ = std::make_unique<s3zip::UploadPipeline>(config, endpoint);

    if (!pipeline_->open()) {
        set_error_(pipeline_->error());
        return false;
    }

    return true;
}

void
S3ZipStream_s::set_error_(const std::string& msg)
{
    if (error_.empty()) {
        error_ = msg;
    }
}

S3ZipStatusCode
finalize_stream(struct S3ZipStream_s* stream)
{
    if (stream == nullptr) {
        LOG_INFO("Stream is null. Nothing to finalize.");
        return S3ZipStatusCode_Success;
    }

    if (stream->finalized_) {
        return stream->object_ ? S3ZipStatusCode_Success
                               : S3ZipStatusCode_UploadAborted;
    }
    stream->finalized_ = true;

    if (!stream->pipeline_) {
        return S3ZipStatusCode_InternalError;
    }

    stream->object_ = stream->pipeline_->finish();
    if (!stream->object_) {
        stream->set_error_(stream->pipeline_->error());
        LOG_ERROR("Error finalizing S3Zip stream: ", stream->error_);

        return stream->pipeline_->is_empty_stream()
                 ? S3ZipStatusCode_EmptyStream
                 : S3ZipStatusCode_UploadAborted;
    }

    LOG_INFO("Created s3://",
             stream->object_->bucket,
             "/",
             stream->object_->key,
             " (",
             stream->pipeline_->bytes_appended(),
             " bytes)");

    return S3ZipStatusCode_Success;
}
