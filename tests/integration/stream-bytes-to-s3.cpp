#include "s3.test.helpers.hh"
#include "s3zip.h"

#include <random>

namespace {
const std::string destination_key = std::string("s3zip-tests/") + TEST;

constexpr size_t part_size = 5 << 20;
constexpr size_t stream_size = 2 * part_size + 12345;

S3ZipStreamSettings
make_settings(const S3TestEnvironment& environment)
{
    return S3ZipStreamSettings{
        .s3_settings = { .endpoint = environment.endpoint.c_str(),
                         .bucket_name = environment.bucket_name.c_str(),
                         .region = environment.region.empty()
                                     ? nullptr
                                     : environment.region.c_str() },
        .destination_key = destination_key.c_str(),
        .part_size_bytes = part_size,
        .max_concurrent_uploads = 2,
        .retry_settings = {},
        .timeout_seconds = 300,
    };
}

bool
stream_bytes(const S3TestEnvironment& environment, minio::s3::Client& client)
{
    std::mt19937 rng(42);
    std::vector<uint8_t> data(stream_size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(rng());
    }

    auto settings = make_settings(environment);
    S3ZipStream* stream = S3ZipStream_create(&settings);
    CHECK(stream != nullptr);

    // uneven chunks, so parts straddle appends
    constexpr size_t chunk = 1000003;
    for (size_t offset = 0; offset < data.size(); offset += chunk) {
        const auto n = std::min(chunk, data.size() - offset);

        size_t bytes_out = 0;
        CHECK(S3ZipStream_append(stream, data.data() + offset, n, &bytes_out) ==
              S3ZipStatusCode_Success);
        EXPECT_EQ(size_t, bytes_out, n);
    }

    const auto status = S3ZipStream_finalize(stream);
    const auto state = S3ZipStream_get_state(stream);
    S3ZipStream_destroy(stream);

    CHECK(status == S3ZipStatusCode_Success);
    CHECK(state == S3ZipSessionState_Completed);

    const auto uploaded =
      s3_get_object_contents_as_bytes(environment, destination_key, client);
    EXPECT_EQ(size_t, uploaded.size(), data.size());
    CHECK(uploaded == data);

    return s3_remove_items(environment, { destination_key }, client);
}

bool
empty_stream_creates_nothing(const S3TestEnvironment& environment,
                             minio::s3::Client& client)
{
    auto settings = make_settings(environment);
    S3ZipStream* stream = S3ZipStream_create(&settings);
    CHECK(stream != nullptr);

    const auto status = S3ZipStream_finalize(stream);
    const auto state = S3ZipStream_get_state(stream);
    S3ZipStream_destroy(stream);

    CHECK(status == S3ZipStatusCode_EmptyStream);
    CHECK(state == S3ZipSessionState_Aborted);
    CHECK(!s3_object_exists(environment, destination_key, client));

    return true;
}
} // namespace

int
main()
{
    S3TestEnvironment environment;
    if (!s3_get_credentials(environment)) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    minio::s3::BaseUrl url(environment.endpoint);
    url.https = environment.endpoint.starts_with("https://");

    minio::creds::StaticProvider provider(environment.access_key_id,
                                          environment.secret_access_key);
    minio::s3::Client client(url, &provider);

    int retval = 1;
    try {
        if (stream_bytes(environment, client) &&
            empty_stream_creates_nothing(environment, client)) {
            retval = 0;
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
        static_cast<void>(
          s3_remove_items(environment, { destination_key }, client));
    }

    return retval;
}
