#include "logger.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

S3ZipLogLevel Logger::current_level_ = S3ZipLogLevel_Info;
std::mutex Logger::log_mutex_{};

void
Logger::set_log_level(S3ZipLogLevel level)
{
    if (level < S3ZipLogLevel_Debug || level >= S3ZipLogLevelCount) {
        throw std::invalid_argument("Invalid log level");
    }

    current_level_ = level;
}

S3ZipLogLevel
Logger::get_log_level()
{
    return current_level_;
}

std::string
Logger::get_timestamp_()
{
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                    1000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count();

    return ss.str();
}

const char*
Logger::level_name_(S3ZipLogLevel level)
{
    switch (level) {
        case S3ZipLogLevel_Debug:
            return "[DEBUG]";
        case S3ZipLogLevel_Info:
            return "[INFO]";
        case S3ZipLogLevel_Warning:
            return "[WARNING]";
        case S3ZipLogLevel_Error:
            return "[ERROR]";
        default:
            return "[UNKNOWN]";
    }
}
