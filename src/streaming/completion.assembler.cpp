#include "completion.assembler.hh"
#include "macros.hh"

#include <algorithm>

bool
s3zip::order_parts(std::vector<CompletedPart>& parts,
                   uint32_t expected_count,
                   std::string& error)
{
    std::sort(parts.begin(),
              parts.end(),
              [](const CompletedPart& a, const CompletedPart& b) {
                  return a.number < b.number;
              });

    if (parts.size() != expected_count) {
        error = "Expected " + std::to_string(expected_count) +
                " acknowledged part(s), got " + std::to_string(parts.size());
        return false;
    }

    for (auto i = 0; i < parts.size(); ++i) {
        if (parts[i].number != i + 1) {
            error = "Missing or duplicate part at position " +
                    std::to_string(i + 1) + " (found part " +
                    std::to_string(parts[i].number) + ")";
            return false;
        }

        if (parts[i].etag.empty()) {
            error = "Part " + std::to_string(parts[i].number) + " has no ETag";
            return false;
        }
    }

    return true;
}

std::optional<s3zip::ObjectRef>
s3zip::assemble_and_complete(UploadSession& session,
                             std::vector<CompletedPart> parts,
                             uint32_t expected_count,
                             std::string& error)
{
    if (expected_count == 0) {
        error = "No parts to assemble";
        session.abort(error);
        return std::nullopt;
    }

    if (!order_parts(parts, expected_count, error)) {
        session.abort(error);
        return std::nullopt;
    }

    auto object = session.complete(parts);
    if (!object) {
        error = session.error();
        if (error.empty()) {
            error = "Failed to complete upload of " + session.key();
        }
        session.abort(error); // no-op if completing already aborted it
    }

    return object;
}
