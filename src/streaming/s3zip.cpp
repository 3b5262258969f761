#include "macros.hh"
#include "s3zip.h"
#include "s3zip.stream.hh"

#include <cstdint> // uint32_t

#define S3ZIP_API_VERSION 0

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return S3ZipStatusCode_InvalidArgument;                            \
        }                                                                      \
    } while (0)

extern "C"
{
    uint32_t S3Zip_get_api_version()
    {
        return S3ZIP_API_VERSION;
    }

    S3ZipStatusCode S3Zip_set_log_level(S3ZipLogLevel level_)
    {
        EXPECT_VALID_ARGUMENT(
          level_ < S3ZipLogLevelCount, "Invalid log level: ", level_);

        try {
            Logger::set_log_level(level_);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return S3ZipStatusCode_InternalError;
        }
        return S3ZipStatusCode_Success;
    }

    S3ZipLogLevel S3Zip_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* S3Zip_get_status_message(S3ZipStatusCode code)
    {
        switch (code) {
            case S3ZipStatusCode_Success:
                return "Success";
            case S3ZipStatusCode_InvalidArgument:
                return "Invalid argument";
            case S3ZipStatusCode_InvalidSettings:
                return "Invalid settings";
            case S3ZipStatusCode_IOError:
                return "Failed to read from the source bucket";
            case S3ZipStatusCode_UploadAborted:
                return "Upload aborted";
            case S3ZipStatusCode_EmptyStream:
                return "Stream is empty, nothing was uploaded";
            case S3ZipStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    S3ZipStream_s* S3ZipStream_create(struct S3ZipStreamSettings_s* settings)
    {
        S3ZipStream_s* stream = nullptr;

        try {
            stream = new S3ZipStream_s(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for S3Zip stream");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating S3Zip stream: ", e.what());
        }

        return stream;
    }

    void S3ZipStream_destroy(S3ZipStream_s* stream)
    {
        // the upload pipeline aborts a session that was never finalized
        delete stream;
    }

    S3ZipStatusCode S3ZipStream_append(S3ZipStream_s* stream,
                                       const void* data,
                                       size_t bytes_in,
                                       size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");
        EXPECT_VALID_ARGUMENT(data || bytes_in == 0, "Null pointer: data");

        *bytes_out = 0;
        try {
            *bytes_out = stream->append(data, bytes_in);
        } catch (const std::exception& e) {
            LOG_ERROR("Error appending data: ", e.what());
            return S3ZipStatusCode_InternalError;
        }

        if (*bytes_out < bytes_in) {
            LOG_ERROR("Error appending data: ", stream->error());
            return S3ZipStatusCode_UploadAborted;
        }

        return S3ZipStatusCode_Success;
    }

    S3ZipStatusCode S3ZipStream_archive_prefix(S3ZipStream_s* stream,
                                               const char* prefix)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(prefix, "Null pointer: prefix");

        try {
            const auto status = stream->archive_prefix(prefix);
            if (status != S3ZipStatusCode_Success) {
                LOG_ERROR("Error archiving '", prefix, "': ", stream->error());
            }
            return status;
        } catch (const std::exception& e) {
            LOG_ERROR("Error archiving '", prefix, "': ", e.what());
            return S3ZipStatusCode_InternalError;
        }
    }

    S3ZipStatusCode S3ZipStream_finalize(S3ZipStream_s* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            return finalize_stream(stream);
        } catch (const std::exception& e) {
            LOG_ERROR("Error finalizing S3Zip stream: ", e.what());
            return S3ZipStatusCode_InternalError;
        }
    }

    S3ZipSessionState S3ZipStream_get_state(const S3ZipStream_s* stream)
    {
        if (stream == nullptr) {
            return S3ZipSessionState_Aborted;
        }

        return stream->state();
    }
}
