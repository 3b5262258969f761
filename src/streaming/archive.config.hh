#pragma once

#include "definitions.hh"
#include "s3zip.types.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace s3zip {
/// Settings for one archive run, from a JSON file and the command line.
struct ArchiveConfig
{
    std::string endpoint;
    std::string bucket;
    std::string region;
    std::string prefix;
    std::string archive_name;

    uint32_t part_size_mib{ DEFAULT_PART_SIZE >> 20 };
    uint32_t max_concurrent_uploads{ DEFAULT_MAX_IN_FLIGHT };
    uint32_t max_attempts{ 5 };
    uint32_t retry_base_delay_ms{ 100 };
    uint32_t retry_max_delay_ms{ 10000 };
    uint32_t timeout_seconds{ 0 };

    S3ZipLogLevel log_level{ S3ZipLogLevel_Info };

    /// @brief The key of the archive object: the prefix, then the name.
    std::string destination_key() const { return prefix + archive_name; }
};

/**
 * @brief Parse a log level name: debug, info, warning, error or none.
 * @return True if @p name is a log level, otherwise false.
 */
[[nodiscard]] bool
parse_log_level(std::string_view name, S3ZipLogLevel& level);

/**
 * @brief Overlay the settings in a JSON object onto @p config.
 * @details Keys absent from the document keep their current values. Unknown
 * keys and values of the wrong type are rejected.
 * @param[in] json_text The JSON document.
 * @param[in,out] config The configuration to update.
 * @param[out] error A message naming the offending key on failure.
 * @return True if the document was applied, otherwise false.
 */
[[nodiscard]] bool
parse_archive_config(std::string_view json_text,
                     ArchiveConfig& config,
                     std::string& error);

/// @brief Read a JSON configuration file and overlay it onto @p config.
[[nodiscard]] bool
load_archive_config(const std::filesystem::path& path,
                    ArchiveConfig& config,
                    std::string& error);
} // namespace s3zip
