#include "macros.hh"
#include "upload.session.hh"

const char*
s3zip::to_string(SessionState state)
{
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Uploading:
            return "uploading";
        case SessionState::Completing:
            return "completing";
        case SessionState::Completed:
            return "completed";
        case SessionState::Aborted:
            return "aborted";
    }

    return "unknown";
}

s3zip::UploadSession::UploadSession(std::shared_ptr<StorageEndpoint> endpoint,
                                    std::string_view key,
                                    std::string_view upload_id)
  : endpoint_(std::move(endpoint))
  , key_(key)
  , upload_id_(upload_id)
  , state_(SessionState::Created)
{
    EXPECT(endpoint_, "Storage endpoint is null");
    EXPECT(!key_.empty(), "Destination key is empty");
    EXPECT(!upload_id_.empty(), "Upload id is empty");
}

s3zip::UploadSession::~UploadSession() noexcept
{
    try {
        if (!is_terminal()) {
            abort("Upload session released before completion");
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }
}

s3zip::UploadResult
s3zip::UploadSession::upload_part(const Part& part,
                                  std::string& etag,
                                  std::string& error)
{
    EXPECT(part.number > 0, "Part numbers start at 1");
    EXPECT(part.size() > 0, "Part ", part.number, " is empty");

    {
        std::unique_lock lock(mutex_);
        if (state_ == SessionState::Created) {
            state_ = SessionState::Uploading;
        } else if (state_ != SessionState::Uploading) {
            error = "Cannot upload part " + std::to_string(part.number) +
                    ": upload session is " + to_string(state_);
            return UploadResult::PermanentError;
        }
    }

    return endpoint_->upload_part(
      key_, upload_id_, part.number, *part.payload, etag, error);
}

std::optional<s3zip::ObjectRef>
s3zip::UploadSession::complete(const std::vector<CompletedPart>& ordered_parts)
{
    {
        std::unique_lock lock(mutex_);
        if (state_ != SessionState::Uploading) {
            const std::string state = to_string(state_);
            lock.unlock();

            LOG_ERROR("Cannot complete upload of ", key_, ": session is ", state);
            return std::nullopt;
        }
        state_ = SessionState::Completing;
    }

    LOG_DEBUG("Completing upload of ",
              key_,
              " from ",
              ordered_parts.size(),
              " part(s)");

    ObjectRef object;
    std::string error;
    if (!endpoint_->complete_session(
          key_, upload_id_, ordered_parts, object, error)) {
        release_("Failed to complete upload: " + error);
        return std::nullopt;
    }

    {
        std::unique_lock lock(mutex_);
        state_ = SessionState::Completed;
    }
    LOG_INFO("Completed upload of ", key_, " (ETag ", object.etag, ")");

    return object;
}

bool
s3zip::UploadSession::abort(std::string_view reason)
{
    {
        std::unique_lock lock(mutex_);
        if (state_ == SessionState::Aborted) {
            return true;
        }

        if (state_ == SessionState::Completing ||
            state_ == SessionState::Completed) {
            LOG_WARNING("Not aborting upload of ",
                        key_,
                        ": session is ",
                        to_string(state_));
            return false;
        }
    }

    return release_(reason);
}

s3zip::SessionState
s3zip::UploadSession::state() const
{
    std::unique_lock lock(mutex_);
    return state_;
}

bool
s3zip::UploadSession::is_terminal() const
{
    std::unique_lock lock(mutex_);
    return state_ == SessionState::Completed ||
           state_ == SessionState::Aborted;
}

std::string
s3zip::UploadSession::error() const
{
    std::unique_lock lock(mutex_);
    return error_;
}

bool
s3zip::UploadSession::release_(std::string_view reason)
{
    {
        std::unique_lock lock(mutex_);
        if (state_ == SessionState::Aborted ||
            state_ == SessionState::Completed) {
            return state_ == SessionState::Aborted;
        }

        state_ = SessionState::Aborted;
        error_ = reason;
    }

    LOG_ERROR("Aborting upload ", upload_id_, " of ", key_, ": ", reason);

    // the session is aborted even if the store fails to release it
    std::string error;
    if (!endpoint_->abort_session(key_, upload_id_, error)) {
        LOG_ERROR("Failed to release upload ", upload_id_, ": ", error);
    }

    return true;
}

std::shared_ptr<s3zip::UploadSession>
s3zip::open_upload_session(std::shared_ptr<StorageEndpoint> endpoint,
                           std::string_view key,
                           std::string& error)
{
    EXPECT(endpoint, "Storage endpoint is null");
    EXPECT(!key.empty(), "Destination key is empty");

    std::string upload_id;
    if (!endpoint->create_session(std::string(key), upload_id, error)) {
        LOG_ERROR("Failed to open upload session for ", key, ": ", error);
        return nullptr;
    }

    LOG_INFO("Opened upload session ", upload_id, " for ", key);
    return std::make_shared<UploadSession>(std::move(endpoint), key, upload_id);
}
