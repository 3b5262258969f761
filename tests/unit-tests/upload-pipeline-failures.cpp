#include "mock.endpoint.hh"
#include "unit.test.macros.hh"
#include "upload.pipeline.hh"

using namespace std::chrono_literals;

namespace {
s3zip::PipelineConfig
make_config()
{
    s3zip::PipelineConfig config;
    config.destination_key = "prefix/archive.zip";
    config.part_size = 8;
    config.max_in_flight = 2;
    config.retry_policy = { .max_attempts = 3,
                            .base_delay = 1ms,
                            .max_delay = 4ms };

    return config;
}

// no bytes: the session is opened, then aborted
void
empty_stream_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    s3zip::UploadPipeline pipeline(make_config(), endpoint);
    CHECK(pipeline.open());
    CHECK(pipeline.append({}));

    CHECK(!pipeline.finish().has_value());
    CHECK(pipeline.is_empty_stream());
    CHECK(pipeline.state() == s3zip::SessionState::Aborted);

    EXPECT_EQ(size_t, endpoint->n_create_calls(), 1);
    EXPECT_EQ(size_t, endpoint->n_upload_calls(), 0);
    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
}

void
failed_completion_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();
    endpoint->fail_complete(true);

    s3zip::UploadPipeline pipeline(make_config(), endpoint);
    CHECK(pipeline.open());

    const ByteVector bytes(20, 7);
    CHECK(pipeline.append(bytes));

    CHECK(!pipeline.finish().has_value());
    CHECK(pipeline.state() == s3zip::SessionState::Aborted);
    CHECK(!pipeline.is_empty_stream());

    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 1);
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
    CHECK(!pipeline.error().empty());
}

void
failed_open()
{
    auto endpoint = std::make_shared<MockEndpoint>();
    endpoint->fail_create(true);

    s3zip::UploadPipeline pipeline(make_config(), endpoint);
    CHECK(!pipeline.open());
    CHECK(!pipeline.error().empty());
    CHECK(pipeline.state() == s3zip::SessionState::Aborted);
}

// uploads that outlast the timeout abort the session
void
timeout_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();
    endpoint->set_upload_delay(2500ms);

    auto config = make_config();
    config.timeout = 1s;

    s3zip::UploadPipeline pipeline(config, endpoint);
    CHECK(pipeline.open());

    const ByteVector bytes(16, 1);
    CHECK(pipeline.append(bytes));

    const auto start = std::chrono::steady_clock::now();
    CHECK(!pipeline.finish().has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(pipeline.state() == s3zip::SessionState::Aborted);
    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
    EXPECT(elapsed < 2500ms, "Waited past the timeout");

    const auto error = pipeline.error();
    EXPECT(error.find("Timed out") != std::string::npos,
           "Unexpected error: ",
           error);
}

void
cancel_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    s3zip::UploadPipeline pipeline(make_config(), endpoint);
    CHECK(pipeline.open());

    const ByteVector bytes(4, 1);
    CHECK(pipeline.append(bytes));

    pipeline.cancel("listing failed");
    CHECK(pipeline.state() == s3zip::SessionState::Aborted);
    EXPECT_EQ(std::string, pipeline.error(), "listing failed");
    CHECK(!pipeline.append(bytes));
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
}

// an unfinished pipeline aborts its session when destroyed
void
unfinished_pipeline_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    {
        s3zip::UploadPipeline pipeline(make_config(), endpoint);
        CHECK(pipeline.open());

        const ByteVector bytes(40, 3);
        CHECK(pipeline.append(bytes));
    }

    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
}

void
too_many_parts_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    auto config = make_config();
    config.max_part_count = 3;

    s3zip::UploadPipeline pipeline(config, endpoint);
    CHECK(pipeline.open());

    const ByteVector bytes(8 * 4, 9);
    CHECK(!pipeline.append(bytes));
    CHECK(pipeline.state() == s3zip::SessionState::Aborted);
    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
    CHECK(!pipeline.finish().has_value());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        empty_stream_aborts();
        failed_completion_aborts();
        failed_open();
        timeout_aborts();
        cancel_aborts();
        unfinished_pipeline_aborts();
        too_many_parts_aborts();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
