#include "macros.hh"
#include "s3.connection.hh"

#include <array>
#include <cstdio>
#include <ctime>
#include <list>
#include <sstream>
#include <string_view>

namespace {
constexpr std::array retryable_codes{
    std::string_view("RequestTimeout"),     std::string_view("SlowDown"),
    std::string_view("InternalError"),      std::string_view("ServiceUnavailable"),
    std::string_view("Throttling"),         std::string_view("ThrottlingException"),
    std::string_view("RequestTimeTooSkewed"),
};

void
set_error(const minio::s3::Response& response, s3zip::S3Error& error)
{
    error.status_code = response.status_code;
    error.code = response.code;
    error.message = response.message.empty() ? response.Error().String()
                                             : response.message;
}

/// Parse an S3 timestamp, e.g., "2024-05-01T12:30:00.000Z", or return 0.
std::time_t
parse_iso8601_utc(const std::string& text)
{
    int year, month, day, hour, min, sec;
    if (std::sscanf(text.c_str(),
                    "%d-%d-%dT%d:%d:%d",
                    &year,
                    &month,
                    &day,
                    &hour,
                    &min,
                    &sec) != 6) {
        return 0;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;

    const auto seconds = timegm(&tm);
    return seconds == -1 ? 0 : seconds;
}
} // namespace

bool
s3zip::S3Error::is_retryable() const
{
    // no response at all: connection reset, DNS failure, timeout, ...
    if (status_code == 0) {
        return true;
    }

    if (status_code == 408 || status_code == 429 || status_code >= 500) {
        return true;
    }

    for (const auto& retryable_code : retryable_codes) {
        if (code == retryable_code) {
            return true;
        }
    }

    return false;
}

std::string
s3zip::S3Error::to_string() const
{
    std::ostringstream ss;
    if (status_code != 0) {
        ss << "HTTP " << status_code << " ";
    }
    if (!code.empty()) {
        ss << code << ": ";
    }
    ss << message;

    return ss.str();
}

s3zip::S3Connection::S3Connection(const S3Settings& settings)
{
    minio::s3::BaseUrl url(settings.endpoint);
    url.https = settings.endpoint.starts_with("https://");
    if (settings.region) {
        url.region = *settings.region;
    }

    // reads AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN
    provider_ = std::make_unique<minio::creds::EnvAwsProvider>();

    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());
    CHECK(client_);
}

bool
s3zip::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
s3zip::S3Connection::list_objects(std::string_view bucket_name,
                                  std::string_view prefix,
                                  const std::string& continuation_token,
                                  std::vector<S3ObjectEntry>& entries,
                                  std::string& next_token,
                                  S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::ListObjectsV2Args args;
    args.bucket = bucket_name;
    args.prefix = prefix;
    args.continuation_token = continuation_token;

    auto response = client_->ListObjectsV2(args);
    if (!response) {
        set_error(response, error);
        return false;
    }

    entries.clear();
    for (const auto& item : response.contents) {
        auto last_modified = item.last_modified;
        entries.push_back({ .key = item.name,
                            .size = item.size,
                            .last_modified = parse_iso8601_utc(
                              last_modified.ToISO8601UTC()) });
    }

    next_token = response.is_truncated ? response.next_continuation_token : "";
    return true;
}

bool
s3zip::S3Connection::get_object(
  std::string_view bucket_name,
  std::string_view object_name,
  const std::function<bool(ConstByteSpan)>& on_chunk,
  S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::GetObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.datafunc = [&on_chunk](minio::http::DataFunctionArgs data_args) -> bool {
        const ConstByteSpan chunk{
            reinterpret_cast<const uint8_t*>(data_args.datachunk.data()),
            data_args.datachunk.size()
        };
        return on_chunk(chunk);
    };

    auto response = client_->GetObject(args);
    if (!response) {
        set_error(response, error);
        return false;
    }

    return true;
}

std::string
s3zip::S3Connection::create_multipart_object(std::string_view bucket_name,
                                             std::string_view object_name,
                                             std::string_view content_type,
                                             S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    if (!content_type.empty()) {
        args.headers.Add("Content-Type", std::string(content_type));
    }

    auto response = client_->CreateMultipartUpload(args);
    if (!response) {
        set_error(response, error);
        return {};
    }

    if (response.upload_id.empty()) {
        error.message = "No upload id returned for " + std::string(object_name);
    }

    return response.upload_id;
}

std::string
s3zip::S3Connection::upload_multipart_object_part(std::string_view bucket_name,
                                                  std::string_view object_name,
                                                  std::string_view upload_id,
                                                  ConstByteSpan data,
                                                  unsigned int part_number,
                                                  S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(part_number, "Part number must be positive.");
    EXPECT(!data.empty(), "Part payload must not be empty.");

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = std::string_view(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    auto response = client_->UploadPart(args);
    if (!response) {
        set_error(response, error);
        return {};
    }

    return response.etag;
}

bool
s3zip::S3Connection::complete_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::vector<CompletedPart>& parts,
  ObjectRef& object,
  S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(!parts.empty(), "Parts list must not be empty.");

    std::list<minio::s3::Part> s3_parts;
    for (const auto& part : parts) {
        minio::s3::Part s3_part;
        s3_part.number = part.number;
        s3_part.etag = part.etag;
        s3_parts.push_back(s3_part);
    }

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;
    args.parts = s3_parts;

    auto response = client_->CompleteMultipartUpload(args);
    if (!response) {
        set_error(response, error);
        return false;
    }

    object.bucket = bucket_name;
    object.key = object_name;
    object.etag = response.etag;
    object.location = response.location;
    object.version_id = response.version_id;

    return true;
}

bool
s3zip::S3Connection::abort_multipart_object(std::string_view bucket_name,
                                            std::string_view object_name,
                                            std::string_view upload_id,
                                            S3Error& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");

    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;

    auto response = client_->AbortMultipartUpload(args);
    if (!response) {
        set_error(response, error);
        return false;
    }

    return true;
}

s3zip::S3ConnectionPool::S3ConnectionPool(size_t n_connections,
                                          const S3Settings& settings)
  : n_connections_(n_connections)
{
    EXPECT(n_connections > 0, "Must have at least one connection.");
    EXPECT(!settings.bucket_name.empty(), "Bucket name must not be empty.");

    for (auto i = 0; i < n_connections; ++i) {
        auto connection = std::make_unique<S3Connection>(settings);

        if (connection->bucket_exists(settings.bucket_name)) {
            connections_.push_back(std::move(connection));
        }
    }

    EXPECT(connections_.size() == n_connections,
           "Only ",
           connections_.size(),
           " of ",
           n_connections,
           " S3 connections could reach bucket '",
           settings.bucket_name,
           "'");
}

s3zip::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    is_accepting_connections_ = false;
    cv_.notify_all();
}

std::unique_ptr<s3zip::S3Connection>
s3zip::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
s3zip::S3ConnectionPool::return_connection(std::unique_ptr<S3Connection>&& conn)
{
    std::scoped_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
