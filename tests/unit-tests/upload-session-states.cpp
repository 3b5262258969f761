#include "mock.endpoint.hh"
#include "unit.test.macros.hh"
#include "upload.session.hh"

#include <memory>

namespace {
s3zip::Part
make_part(uint32_t number, size_t size)
{
    return { .number = number,
             .payload = std::make_shared<const ByteVector>(size, uint8_t(number)) };
}

void
complete_after_uploads()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    std::string error;
    auto session = s3zip::open_upload_session(endpoint, "dest/archive", error);
    CHECK(session);
    CHECK(session->state() == s3zip::SessionState::Created);
    EXPECT_EQ(std::string, session->upload_id(), "upload-1");

    std::string etag;
    CHECK(session->upload_part(make_part(1, 4), etag, error) ==
          s3zip::UploadResult::Ok);
    CHECK(session->state() == s3zip::SessionState::Uploading);
    CHECK(!etag.empty());

    auto object = session->complete({ { .number = 1, .etag = etag } });
    CHECK(object.has_value());
    EXPECT_EQ(std::string, object->key, "dest/archive");
    CHECK(session->state() == s3zip::SessionState::Completed);
    CHECK(session->is_terminal());

    // completed sessions stay completed
    CHECK(!session->abort("too late"));
    CHECK(session->state() == s3zip::SessionState::Completed);

    session.reset();
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 0);
}

void
abort_is_terminal()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    std::string error;
    auto session = s3zip::open_upload_session(endpoint, "dest/archive", error);
    CHECK(session);

    CHECK(session->abort("no longer needed"));
    CHECK(session->state() == s3zip::SessionState::Aborted);
    EXPECT_EQ(std::string, session->error(), "no longer needed");

    // aborting again neither fails nor calls the store
    CHECK(session->abort("again"));
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
    EXPECT_EQ(std::string, session->error(), "no longer needed");

    // uploads fail permanently without reaching the store
    std::string etag;
    CHECK(session->upload_part(make_part(1, 4), etag, error) ==
          s3zip::UploadResult::PermanentError);
    EXPECT_EQ(size_t, endpoint->n_upload_calls(), 0);

    CHECK(!session->complete({}).has_value());
    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
}

void
complete_requires_uploads()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    std::string error;
    auto session = s3zip::open_upload_session(endpoint, "dest/archive", error);
    CHECK(session);

    CHECK(!session->complete({}).has_value());
    CHECK(session->state() == s3zip::SessionState::Created);
    EXPECT_EQ(size_t, endpoint->n_complete_calls(), 0);
}

void
failed_completion_aborts()
{
    auto endpoint = std::make_shared<MockEndpoint>();
    endpoint->fail_complete(true);

    std::string error;
    auto session = s3zip::open_upload_session(endpoint, "dest/archive", error);
    CHECK(session);

    std::string etag;
    CHECK(session->upload_part(make_part(1, 4), etag, error) ==
          s3zip::UploadResult::Ok);

    CHECK(!session->complete({ { .number = 1, .etag = etag } }).has_value());
    CHECK(session->state() == s3zip::SessionState::Aborted);
    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
}

void
released_session_is_aborted()
{
    auto endpoint = std::make_shared<MockEndpoint>();

    std::string error;
    {
        auto session =
          s3zip::open_upload_session(endpoint, "dest/archive", error);
        CHECK(session);

        std::string etag;
        CHECK(session->upload_part(make_part(1, 4), etag, error) ==
              s3zip::UploadResult::Ok);
    }

    EXPECT_EQ(size_t, endpoint->n_abort_calls(), 1);
}

void
failed_open_returns_null()
{
    auto endpoint = std::make_shared<MockEndpoint>();
    endpoint->fail_create(true);

    std::string error;
    auto session = s3zip::open_upload_session(endpoint, "dest/archive", error);
    CHECK(!session);
    CHECK(!error.empty());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        complete_after_uploads();
        abort_is_terminal();
        complete_requires_uploads();
        failed_completion_aborts();
        released_session_is_aborted();
        failed_open_returns_null();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
