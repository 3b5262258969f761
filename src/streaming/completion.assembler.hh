#pragma once

#include "part.hh"
#include "upload.session.hh"

#include <optional>
#include <string>
#include <vector>

namespace s3zip {
/**
 * @brief Sort acknowledged parts into the order the store concatenates them.
 * @details The store assembles the object in the order the parts are listed,
 * so @p parts is sorted ascending by part number. The sorted list must be
 * exactly 1, 2, ..., @p expected_count.
 * @param[in,out] parts The acknowledged parts, in any order.
 * @param[in] expected_count The number of parts dispatched.
 * @param[out] error A diagnostic message on failure.
 * @return True if the parts cover 1..expected_count without gaps or
 * duplicates, otherwise false.
 */
[[nodiscard]] bool
order_parts(std::vector<CompletedPart>& parts,
            uint32_t expected_count,
            std::string& error);

/**
 * @brief Finalize the session's object from its acknowledged parts.
 * @details On any failure, including an invalid part list, the session is
 * aborted.
 * @param[in] session The session to complete.
 * @param[in] parts The acknowledged parts, in any order.
 * @param[in] expected_count The number of parts dispatched.
 * @param[out] error A diagnostic message on failure.
 * @return The created object, or nullopt on failure.
 */
std::optional<ObjectRef>
assemble_and_complete(UploadSession& session,
                      std::vector<CompletedPart> parts,
                      uint32_t expected_count,
                      std::string& error);
} // namespace s3zip
