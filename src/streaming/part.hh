#pragma once

#include "definitions.hh"

#include <memory>
#include <string>

namespace s3zip {
/**
 * @brief A contiguous slice of the output stream, uploaded as one unit.
 * @details The payload is shared and immutable, so a retry re-sends exactly
 * the bytes of the first attempt under the same part number.
 */
struct Part
{
    uint32_t number{ 0 };
    std::shared_ptr<const ByteVector> payload;

    size_t size() const { return payload ? payload->size() : 0; }
};

/// A part the store acknowledged, with the integrity tag (ETag) it returned.
struct CompletedPart
{
    uint32_t number{ 0 };
    std::string etag;
};

/// The object created by completing an upload session.
struct ObjectRef
{
    std::string bucket;
    std::string key;
    std::string etag;
    std::string location;
    std::string version_id;
};
} // namespace s3zip
