#pragma once

#include "s3.connection.hh"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace s3zip {
struct ObjectListing
{
    std::vector<S3ObjectEntry> entries;
    std::string next_token; // empty on the last page
};

/// Lists the objects under a key prefix, one page or all pages at a time.
class ObjectLister
{
  public:
    ObjectLister(std::string_view bucket_name,
                 std::shared_ptr<S3ConnectionPool> connection_pool);

    /**
     * @brief List one page of objects.
     * @param[in] prefix The key prefix to list.
     * @param[in] continuation_token The token from the previous page, or empty
     * for the first page.
     * @param[out] listing The entries on this page and the next page's token.
     * @param[out] error A diagnostic message on failure.
     * @return True if the page was listed, otherwise false.
     */
    [[nodiscard]] bool list(std::string_view prefix,
                            const std::string& continuation_token,
                            ObjectListing& listing,
                            std::string& error);

    /**
     * @brief List every object under @p prefix, following continuation tokens.
     * @param[in] prefix The key prefix to list.
     * @param[out] entries Every object under the prefix, in key order.
     * @param[out] error A diagnostic message on failure.
     * @return True if all pages were listed, otherwise false.
     */
    [[nodiscard]] bool list_all(std::string_view prefix,
                                std::vector<S3ObjectEntry>& entries,
                                std::string& error);

  private:
    const std::string bucket_name_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;
};
} // namespace s3zip
