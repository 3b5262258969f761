#pragma once

#include "s3.connection.hh"
#include "storage.endpoint.hh"

#include <memory>
#include <string>
#include <string_view>

namespace s3zip {
/// StorageEndpoint over S3 multipart uploads in a single bucket.
class S3Endpoint : public StorageEndpoint
{
  public:
    S3Endpoint(std::string_view bucket_name,
               std::shared_ptr<S3ConnectionPool> connection_pool,
               std::string_view content_type = {});

    bool create_session(const std::string& key,
                        std::string& upload_id,
                        std::string& error) override;
    UploadResult upload_part(const std::string& key,
                             const std::string& upload_id,
                             uint32_t part_number,
                             ConstByteSpan data,
                             std::string& etag,
                             std::string& error) override;
    bool complete_session(const std::string& key,
                          const std::string& upload_id,
                          const std::vector<CompletedPart>& parts,
                          ObjectRef& object,
                          std::string& error) override;
    bool abort_session(const std::string& key,
                       const std::string& upload_id,
                       std::string& error) override;

  private:
    const std::string bucket_name_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;
    const std::string content_type_;
};
} // namespace s3zip
