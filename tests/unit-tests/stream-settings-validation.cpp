#include "s3.connection.hh"
#include "s3zip.h"
#include "unit.test.macros.hh"

#include <cstring>

namespace {
S3ZipStreamSettings
valid_settings()
{
    return S3ZipStreamSettings{
        .s3_settings = { .endpoint = "http://127.0.0.1:1",
                         .bucket_name = "my-bucket",
                         .region = nullptr },
        .destination_key = "prefix/archive.zip",
        .part_size_bytes = 0,
        .max_concurrent_uploads = 0,
        .retry_settings = {},
        .timeout_seconds = 0,
    };
}

void
expect_not_created(S3ZipStreamSettings settings, const char* what)
{
    S3ZipStream* stream = S3ZipStream_create(&settings);
    EXPECT(stream == nullptr, "Created a stream with ", what);
    S3ZipStream_destroy(stream);
}

void
invalid_settings_are_rejected()
{
    CHECK(S3ZipStream_create(nullptr) == nullptr);

    auto settings = valid_settings();
    settings.s3_settings.endpoint = "  ";
    expect_not_created(settings, "an empty endpoint");

    settings = valid_settings();
    settings.s3_settings.endpoint = nullptr;
    expect_not_created(settings, "a null endpoint");

    settings = valid_settings();
    settings.s3_settings.bucket_name = "ab";
    expect_not_created(settings, "a short bucket name");

    settings = valid_settings();
    const std::string long_name(64, 'b');
    settings.s3_settings.bucket_name = long_name.c_str();
    expect_not_created(settings, "a long bucket name");

    settings = valid_settings();
    settings.destination_key = "";
    expect_not_created(settings, "an empty destination key");

    settings = valid_settings();
    settings.part_size_bytes = 1 << 20;
    expect_not_created(settings, "a part size below the S3 minimum");

    settings = valid_settings();
    settings.part_size_bytes = (size_t(5) << 30) + 1;
    expect_not_created(settings, "a part size above the S3 maximum");

    settings = valid_settings();
    settings.max_concurrent_uploads = 65;
    expect_not_created(settings, "too many concurrent uploads");

    settings = valid_settings();
    settings.retry_settings = { .max_attempts = 3,
                                .base_delay_ms = 500,
                                .max_delay_ms = 100 };
    expect_not_created(settings, "a base delay above the maximum delay");
}

void
null_streams_are_rejected()
{
    size_t bytes_out = 0;
    const char data[] = "data";
    CHECK(S3ZipStream_append(nullptr, data, 4, &bytes_out) ==
          S3ZipStatusCode_InvalidArgument);
    CHECK(S3ZipStream_archive_prefix(nullptr, "prefix/") ==
          S3ZipStatusCode_InvalidArgument);
    CHECK(S3ZipStream_finalize(nullptr) == S3ZipStatusCode_InvalidArgument);
    CHECK(S3ZipStream_get_state(nullptr) == S3ZipSessionState_Aborted);
    S3ZipStream_destroy(nullptr);
}

// nothing listens on port 1, so no connection can see the bucket
void
unreachable_bucket_fails_at_create()
{
    const s3zip::S3Settings s3_settings{ .endpoint = "http://127.0.0.1:1",
                                         .bucket_name = "my-bucket" };

    bool threw = false;
    try {
        s3zip::S3ConnectionPool pool(2, s3_settings);
    } catch (const std::exception&) {
        threw = true;
    }
    CHECK(threw);

    expect_not_created(valid_settings(), "an unreachable bucket");
}

void
api_basics()
{
    EXPECT_EQ(uint32_t, S3Zip_get_api_version(), 0);

    for (auto code = 0; code < S3ZipStatusCodeCount; ++code) {
        const char* message =
          S3Zip_get_status_message(static_cast<S3ZipStatusCode>(code));
        CHECK(message != nullptr && std::strlen(message) > 0);
    }
    EXPECT_EQ(std::string,
              S3Zip_get_status_message(S3ZipStatusCode_Success),
              "Success");

    CHECK_OK(S3Zip_set_log_level(S3ZipLogLevel_Warning));
    CHECK(S3Zip_get_log_level() == S3ZipLogLevel_Warning);
    CHECK(S3Zip_set_log_level(S3ZipLogLevelCount) ==
          S3ZipStatusCode_InvalidArgument);
    CHECK(S3Zip_get_log_level() == S3ZipLogLevel_Warning);
    CHECK_OK(S3Zip_set_log_level(S3ZipLogLevel_Info));
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        invalid_settings_are_rejected();
        null_streams_are_rejected();
        unreachable_bucket_fails_at_create();
        api_basics();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
