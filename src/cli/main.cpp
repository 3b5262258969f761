#include "archive.config.hh"
#include "macros.hh"
#include "s3zip.h"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace bpo = boost::program_options;

namespace {
const char* USAGE =
  "Usage: s3zip [options] <bucket> <prefix> <archive-name>\n"
  "Archive every object under <prefix> in <bucket> into the object\n"
  "<prefix><archive-name>, using a streaming multipart upload.\n";

std::string
getenv_or_empty(const char* name)
{
    const char* value = std::getenv(name);
    return value ? value : "";
}

bpo::options_description
make_options_description()
{
    bpo::options_description description("Options");
    // clang-format off
    description.add_options()
      ("help,h", "print this message and exit")
      ("config", bpo::value<std::string>(), "JSON configuration file")
      ("log-level", bpo::value<std::string>(),
       "debug, info, warning, error or none")
      ("endpoint", bpo::value<std::string>(),
       "S3 endpoint URL (default: $S3ZIP_S3_ENDPOINT)")
      ("region", bpo::value<std::string>(),
       "S3 region (default: $S3ZIP_S3_REGION)")
      ("part-size-mib", bpo::value<uint32_t>(), "size of each uploaded part")
      ("concurrency", bpo::value<uint32_t>(), "maximum parts in flight")
      ("max-attempts", bpo::value<uint32_t>(),
       "upload attempts per part, including the first")
      ("timeout", bpo::value<uint32_t>(),
       "abort the upload after this many seconds (0: never)");
    // clang-format on

    return description;
}

/// Apply the command line on top of the configuration file, if any.
[[nodiscard]] bool
make_config(const bpo::variables_map& vm,
            s3zip::ArchiveConfig& config,
            std::string& error)
{
    if (vm.count("config") &&
        !s3zip::load_archive_config(
          vm["config"].as<std::string>(), config, error)) {
        return false;
    }

    if (vm.count("log-level") &&
        !s3zip::parse_log_level(vm["log-level"].as<std::string>(),
                                config.log_level)) {
        error = "Unknown log level '" + vm["log-level"].as<std::string>() + "'";
        return false;
    }

    if (vm.count("endpoint")) {
        config.endpoint = vm["endpoint"].as<std::string>();
    }
    if (vm.count("region")) {
        config.region = vm["region"].as<std::string>();
    }
    if (vm.count("part-size-mib")) {
        config.part_size_mib = vm["part-size-mib"].as<uint32_t>();
    }
    if (vm.count("concurrency")) {
        config.max_concurrent_uploads = vm["concurrency"].as<uint32_t>();
    }
    if (vm.count("max-attempts")) {
        config.max_attempts = vm["max-attempts"].as<uint32_t>();
    }
    if (vm.count("timeout")) {
        config.timeout_seconds = vm["timeout"].as<uint32_t>();
    }

    if (vm.count("bucket")) {
        config.bucket = vm["bucket"].as<std::string>();
    }
    if (vm.count("prefix")) {
        config.prefix = vm["prefix"].as<std::string>();
    }
    if (vm.count("archive-name")) {
        config.archive_name = vm["archive-name"].as<std::string>();
    }

    if (config.endpoint.empty()) {
        config.endpoint = getenv_or_empty("S3ZIP_S3_ENDPOINT");
    }
    if (config.region.empty()) {
        config.region = getenv_or_empty("S3ZIP_S3_REGION");
    }

    if (config.bucket.empty() || config.archive_name.empty()) {
        error = "A bucket and an archive name are required";
        return false;
    }

    if (config.endpoint.empty()) {
        error = "No S3 endpoint: pass --endpoint or set S3ZIP_S3_ENDPOINT";
        return false;
    }

    return true;
}

int
run(const s3zip::ArchiveConfig& config)
{
    const std::string destination_key = config.destination_key();

    S3ZipStreamSettings settings{
        .s3_settings = { .endpoint = config.endpoint.c_str(),
                         .bucket_name = config.bucket.c_str(),
                         .region = config.region.empty()
                                     ? nullptr
                                     : config.region.c_str() },
        .destination_key = destination_key.c_str(),
        .content_type = "application/zip",
        .part_size_bytes = size_t(config.part_size_mib) << 20,
        .max_concurrent_uploads = config.max_concurrent_uploads,
        .retry_settings = { .max_attempts = config.max_attempts,
                            .base_delay_ms = config.retry_base_delay_ms,
                            .max_delay_ms = config.retry_max_delay_ms },
        .timeout_seconds = config.timeout_seconds,
    };

    S3ZipStream* stream = S3ZipStream_create(&settings);
    if (!stream) {
        LOG_ERROR("Failed to start the upload of s3://",
                  config.bucket,
                  "/",
                  destination_key);
        return 1;
    }

    S3ZipStatusCode status =
      S3ZipStream_archive_prefix(stream, config.prefix.c_str());
    if (status == S3ZipStatusCode_Success) {
        status = S3ZipStream_finalize(stream);
    }

    const bool completed =
      S3ZipStream_get_state(stream) == S3ZipSessionState_Completed;
    S3ZipStream_destroy(stream);

    if (status != S3ZipStatusCode_Success || !completed) {
        LOG_ERROR("Archive of s3://",
                  config.bucket,
                  "/",
                  config.prefix,
                  " failed: ",
                  S3Zip_get_status_message(status));
        return 1;
    }

    return 0;
}
} // namespace

int
main(int argc, char* argv[])
{
    auto description = make_options_description();

    bpo::options_description hidden;
    hidden.add_options()("bucket", bpo::value<std::string>())(
      "prefix", bpo::value<std::string>())("archive-name",
                                           bpo::value<std::string>());

    bpo::options_description all;
    all.add(description).add(hidden);

    bpo::positional_options_description positional;
    positional.add("bucket", 1).add("prefix", 1).add("archive-name", 1);

    bpo::variables_map vm;
    try {
        bpo::store(bpo::command_line_parser(argc, argv)
                     .options(all)
                     .positional(positional)
                     .run(),
                   vm);
        bpo::notify(vm);
    } catch (const bpo::error& e) {
        std::cerr << e.what() << "\n\n" << USAGE << description;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << USAGE << description;
        return 0;
    }

    if (!vm.count("bucket") || !vm.count("prefix") ||
        !vm.count("archive-name")) {
        if (!vm.count("config")) {
            std::cerr << USAGE << description;
            return 1;
        }
    }

    s3zip::ArchiveConfig config;
    std::string error;
    if (!make_config(vm, config, error)) {
        std::cerr << error << "\n\n" << USAGE << description;
        return 1;
    }

    if (S3Zip_set_log_level(config.log_level) != S3ZipStatusCode_Success) {
        return 1;
    }

    try {
        return run(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Error: ", e.what());
        return 1;
    }
}
