#pragma once

#include "test.macros.hh"

#include <miniocpp/client.h>

#include <cstdlib>
#include <list>
#include <sstream>
#include <string>
#include <vector>

struct S3TestEnvironment
{
    std::string endpoint;
    std::string bucket_name;
    std::string region;
    std::string access_key_id;
    std::string secret_access_key;
};

/// Read the S3 test environment. False, with a warning, if it is incomplete.
inline bool
s3_get_credentials(S3TestEnvironment& environment)
{
    char* env = nullptr;
    if (!(env = std::getenv("S3ZIP_S3_ENDPOINT"))) {
        LOG_WARNING("S3ZIP_S3_ENDPOINT not set.");
        return false;
    }
    environment.endpoint = env;

    if (!(env = std::getenv("S3ZIP_S3_BUCKET_NAME"))) {
        LOG_WARNING("S3ZIP_S3_BUCKET_NAME not set.");
        return false;
    }
    environment.bucket_name = env;

    if (!(env = std::getenv("AWS_ACCESS_KEY_ID"))) {
        LOG_WARNING("AWS_ACCESS_KEY_ID not set.");
        return false;
    }
    environment.access_key_id = env;

    if (!(env = std::getenv("AWS_SECRET_ACCESS_KEY"))) {
        LOG_WARNING("AWS_SECRET_ACCESS_KEY not set.");
        return false;
    }
    environment.secret_access_key = env;

    env = std::getenv("S3ZIP_S3_REGION");
    if (env) {
        environment.region = env;
    }

    return true;
}

inline bool
s3_object_exists(const S3TestEnvironment& environment,
                 const std::string& object_name,
                 minio::s3::Client& client)
{
    minio::s3::StatObjectArgs args;
    args.bucket = environment.bucket_name;
    args.object = object_name;

    const minio::s3::StatObjectResponse response = client.StatObject(args);

    return static_cast<bool>(response);
}

inline bool
s3_put_object(const S3TestEnvironment& environment,
              const std::string& object_name,
              const std::vector<uint8_t>& data,
              minio::s3::Client& client)
{
    std::istringstream stream(
      std::string(reinterpret_cast<const char*>(data.data()), data.size()));

    minio::s3::PutObjectArgs args(stream, static_cast<long>(data.size()), 0);
    args.bucket = environment.bucket_name;
    args.object = object_name;

    const minio::s3::PutObjectResponse response = client.PutObject(args);
    if (!response) {
        LOG_ERROR("Failed to put object ",
                  object_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

inline std::vector<uint8_t>
s3_get_object_contents_as_bytes(const S3TestEnvironment& environment,
                                const std::string& object_name,
                                minio::s3::Client& client)
{
    std::vector<uint8_t> data;

    minio::s3::GetObjectArgs go_args;
    go_args.bucket = environment.bucket_name;
    go_args.object = object_name;
    go_args.datafunc =
      [&data](const minio::http::DataFunctionArgs& args) -> bool {
        const auto* chunk_data =
          reinterpret_cast<const uint8_t*>(args.datachunk.data());
        data.insert(data.end(), chunk_data, chunk_data + args.datachunk.size());
        return true;
    };

    minio::s3::GetObjectResponse resp = client.GetObject(go_args);
    if (!resp) {
        LOG_ERROR("Failed to get object ", object_name);
    }

    return data;
}

inline bool
s3_remove_items(const S3TestEnvironment& environment,
                const std::vector<std::string>& item_keys,
                minio::s3::Client& client)
{
    std::list<minio::s3::DeleteObject> objects;
    for (const auto& key : item_keys) {
        minio::s3::DeleteObject object;
        object.name = key;
        objects.push_back(object);
    }

    minio::s3::RemoveObjectsArgs args;
    args.bucket = environment.bucket_name;

    auto it = objects.begin();

    args.func = [&objects = objects,
                 &i = it](minio::s3::DeleteObject& obj) -> bool {
        if (i == objects.end())
            return false;
        obj = *i;
        i++;
        return true;
    };

    minio::s3::RemoveObjectsResult result = client.RemoveObjects(args);
    for (; result; result++) {
        minio::s3::DeleteError err = *result;
        if (!err) {
            LOG_ERROR(
              "Failed to delete object ", err.object_name, ": ", err.message);
            return false;
        }
    }

    return true;
}
