#include "archive.config.hh"
#include "macros.hh"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace {
bool
read_string(const nlohmann::json& value,
            const std::string& key,
            std::string& out,
            std::string& error)
{
    if (!value.is_string()) {
        error = "Configuration key '" + key + "' must be a string";
        return false;
    }

    out = value.get<std::string>();
    return true;
}

bool
read_unsigned(const nlohmann::json& value,
              const std::string& key,
              uint32_t& out,
              std::string& error)
{
    if (!value.is_number_unsigned()) {
        error = "Configuration key '" + key + "' must be a non-negative integer";
        return false;
    }

    const auto n = value.get<uint64_t>();
    if (n > std::numeric_limits<uint32_t>::max()) {
        error = "Configuration key '" + key + "' is out of range";
        return false;
    }

    out = static_cast<uint32_t>(n);
    return true;
}
} // namespace

bool
s3zip::parse_log_level(std::string_view name, S3ZipLogLevel& level)
{
    if (name == "debug") {
        level = S3ZipLogLevel_Debug;
    } else if (name == "info") {
        level = S3ZipLogLevel_Info;
    } else if (name == "warning") {
        level = S3ZipLogLevel_Warning;
    } else if (name == "error") {
        level = S3ZipLogLevel_Error;
    } else if (name == "none") {
        level = S3ZipLogLevel_None;
    } else {
        return false;
    }

    return true;
}

bool
s3zip::parse_archive_config(std::string_view json_text,
                            ArchiveConfig& config,
                            std::string& error)
{
    const auto document = nlohmann::json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        error = "Configuration is not valid JSON";
        return false;
    }

    if (!document.is_object()) {
        error = "Configuration must be a JSON object";
        return false;
    }

    // apply to a copy so that a rejected document changes nothing
    ArchiveConfig updated = config;
    for (const auto& [key, value] : document.items()) {
        bool ok;
        if (key == "endpoint") {
            ok = read_string(value, key, updated.endpoint, error);
        } else if (key == "bucket") {
            ok = read_string(value, key, updated.bucket, error);
        } else if (key == "region") {
            ok = read_string(value, key, updated.region, error);
        } else if (key == "prefix") {
            ok = read_string(value, key, updated.prefix, error);
        } else if (key == "archive_name") {
            ok = read_string(value, key, updated.archive_name, error);
        } else if (key == "part_size_mib") {
            ok = read_unsigned(value, key, updated.part_size_mib, error);
        } else if (key == "max_concurrent_uploads") {
            ok = read_unsigned(value, key, updated.max_concurrent_uploads, error);
        } else if (key == "max_attempts") {
            ok = read_unsigned(value, key, updated.max_attempts, error);
        } else if (key == "retry_base_delay_ms") {
            ok = read_unsigned(value, key, updated.retry_base_delay_ms, error);
        } else if (key == "retry_max_delay_ms") {
            ok = read_unsigned(value, key, updated.retry_max_delay_ms, error);
        } else if (key == "timeout_seconds") {
            ok = read_unsigned(value, key, updated.timeout_seconds, error);
        } else if (key == "log_level") {
            std::string name;
            ok = read_string(value, key, name, error);
            if (ok && !parse_log_level(name, updated.log_level)) {
                error = "Configuration key 'log_level' has unknown level '" +
                        name + "'";
                ok = false;
            }
        } else {
            error = "Unknown configuration key '" + key + "'";
            ok = false;
        }

        if (!ok) {
            return false;
        }
    }

    config = std::move(updated);
    return true;
}

bool
s3zip::load_archive_config(const std::filesystem::path& path,
                           ArchiveConfig& config,
                           std::string& error)
{
    std::ifstream file(path);
    if (!file) {
        error = "Failed to open configuration file " + path.string();
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();

    if (!parse_archive_config(ss.str(), config, error)) {
        error = path.string() + ": " + error;
        return false;
    }

    LOG_DEBUG("Loaded configuration from ", path.string());
    return true;
}
