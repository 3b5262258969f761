#pragma once

#include "s3zip.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(S3ZipLogLevel level);
    static S3ZipLogLevel get_log_level();

    template<typename... Args>
    static std::string log(S3ZipLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::ostringstream ss;
        ss << get_timestamp_() << " " << level_name_(level) << " "
           << fs::path(file).filename().string() << ":" << line << " " << func
           << ": ";
        (ss << ... << std::forward<Args>(args));

        std::string message = ss.str();
        if (current_level_ == S3ZipLogLevel_None || level < current_level_) {
            return message; // still returned, e.g., for exception text
        }

        std::scoped_lock lock(log_mutex_);
        auto& stream =
          level >= S3ZipLogLevel_Warning ? std::cerr : std::cout;
        stream << message << std::endl;

        return message;
    }

  private:
    static S3ZipLogLevel current_level_;
    static std::mutex log_mutex_;

    static std::string get_timestamp_();
    static const char* level_name_(S3ZipLogLevel level);
};
