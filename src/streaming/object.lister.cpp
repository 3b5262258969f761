#include "macros.hh"
#include "object.lister.hh"

s3zip::ObjectLister::ObjectLister(
  std::string_view bucket_name,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_(bucket_name)
  , connection_pool_(std::move(connection_pool))
{
    EXPECT(!bucket_name_.empty(), "S3 bucket name is empty");
    EXPECT(connection_pool_, "S3 connection pool is null");
}

bool
s3zip::ObjectLister::list(std::string_view prefix,
                          const std::string& continuation_token,
                          ObjectListing& listing,
                          std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (!connection) {
        error = "No S3 connection available";
        return false;
    }

    bool retval = false;
    try {
        S3Error s3_error;
        retval = connection->list_objects(bucket_name_,
                                          prefix,
                                          continuation_token,
                                          listing.entries,
                                          listing.next_token,
                                          s3_error);
        if (!retval) {
            error = "Failed to list objects under " + bucket_name_ + "/" +
                    std::string(prefix) + ": " + s3_error.to_string();
        }
    } catch (const std::exception& exc) {
        error = "Failed to list objects under " + bucket_name_ + "/" +
                std::string(prefix) + ": " + exc.what();
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
s3zip::ObjectLister::list_all(std::string_view prefix,
                              std::vector<S3ObjectEntry>& entries,
                              std::string& error)
{
    entries.clear();

    std::string token;
    size_t n_pages = 0;
    do {
        ObjectListing listing;
        if (!list(prefix, token, listing, error)) {
            return false;
        }

        entries.insert(entries.end(),
                       std::make_move_iterator(listing.entries.begin()),
                       std::make_move_iterator(listing.entries.end()));
        token = std::move(listing.next_token);
        ++n_pages;
    } while (!token.empty());

    LOG_DEBUG("Listed ",
              entries.size(),
              " object(s) under ",
              bucket_name_,
              "/",
              prefix,
              " in ",
              n_pages,
              " page(s)");

    return true;
}
