#pragma once

#include "storage.endpoint.hh"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief An in-memory store that fails on cue.
 * @details Failures are scripted per (part number, attempt number), attempts
 * counting from 1. Every call is recorded, and a completed upload is
 * reassembled from the acknowledged part payloads.
 */
class MockEndpoint : public s3zip::StorageEndpoint
{
  public:
    void fail_part(uint32_t part_number,
                   uint32_t attempt,
                   s3zip::UploadResult result)
    {
        std::scoped_lock lock(mutex_);
        failures_[{ part_number, attempt }] = result;
    }

    /// Fail every attempt at uploading @p part_number.
    void always_fail_part(uint32_t part_number, s3zip::UploadResult result)
    {
        std::scoped_lock lock(mutex_);
        always_fail_[part_number] = result;
    }

    void fail_create(bool fail) { fail_create_ = fail; }
    void fail_complete(bool fail) { fail_complete_ = fail; }
    void set_upload_delay(std::chrono::milliseconds delay)
    {
        upload_delay_ = delay;
    }

    [[nodiscard]] bool create_session(const std::string& key,
                                      std::string& upload_id,
                                      std::string& error) override
    {
        std::scoped_lock lock(mutex_);
        ++n_create_calls_;

        if (fail_create_) {
            error = "AccessDenied";
            return false;
        }

        upload_id = "upload-" + std::to_string(n_create_calls_);
        key_ = key;
        return true;
    }

    [[nodiscard]] s3zip::UploadResult upload_part(const std::string& key,
                                                  const std::string& upload_id,
                                                  uint32_t part_number,
                                                  ConstByteSpan data,
                                                  std::string& etag,
                                                  std::string& error) override
    {
        uint32_t attempt;
        {
            std::scoped_lock lock(mutex_);
            attempt = ++attempts_[part_number];
            attempt_times_[part_number].push_back(
              std::chrono::steady_clock::now());
            ++n_upload_calls_;
            ++in_flight_;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
        }

        if (upload_delay_.count() > 0) {
            std::this_thread::sleep_for(upload_delay_);
        }

        std::scoped_lock lock(mutex_);
        --in_flight_;

        auto result = s3zip::UploadResult::Ok;
        if (auto it = always_fail_.find(part_number); it != always_fail_.end()) {
            result = it->second;
        } else if (auto it = failures_.find({ part_number, attempt });
                   it != failures_.end()) {
            result = it->second;
        }

        if (result != s3zip::UploadResult::Ok) {
            error = result == s3zip::UploadResult::TransientError
                      ? "SlowDown"
                      : "NoSuchUpload";
            return result;
        }

        etag = "\"etag-" + std::to_string(part_number) + "-" +
               std::to_string(attempt) + "\"";
        stored_[part_number] = { ByteVector(data.begin(), data.end()), etag };
        return s3zip::UploadResult::Ok;
    }

    [[nodiscard]] bool complete_session(
      const std::string& key,
      const std::string& upload_id,
      const std::vector<s3zip::CompletedPart>& parts,
      s3zip::ObjectRef& object,
      std::string& error) override
    {
        std::scoped_lock lock(mutex_);
        ++n_complete_calls_;
        completed_parts_ = parts;

        if (fail_complete_) {
            error = "InvalidPart";
            return false;
        }

        ByteVector bytes;
        for (const auto& part : parts) {
            auto it = stored_.find(part.number);
            if (it == stored_.end() || it->second.second != part.etag) {
                error = "InvalidPart";
                return false;
            }
            bytes.insert(
              bytes.end(), it->second.first.begin(), it->second.first.end());
        }

        object_ = std::move(bytes);
        object = { .bucket = "mock-bucket",
                   .key = key,
                   .etag = "\"object-etag\"",
                   .location = "mock://mock-bucket/" + key,
                   .version_id = {} };
        return true;
    }

    [[nodiscard]] bool abort_session(const std::string& key,
                                     const std::string& upload_id,
                                     std::string& error) override
    {
        std::scoped_lock lock(mutex_);
        ++n_abort_calls_;
        return true;
    }

    size_t n_create_calls() const { return locked_(n_create_calls_); }
    size_t n_upload_calls() const { return locked_(n_upload_calls_); }
    size_t n_complete_calls() const { return locked_(n_complete_calls_); }
    size_t n_abort_calls() const { return locked_(n_abort_calls_); }
    size_t max_in_flight() const { return locked_(max_in_flight_); }

    uint32_t attempts(uint32_t part_number) const
    {
        std::scoped_lock lock(mutex_);
        auto it = attempts_.find(part_number);
        return it == attempts_.end() ? 0 : it->second;
    }

    /// When each attempt at uploading @p part_number started.
    std::vector<std::chrono::steady_clock::time_point> attempt_times(
      uint32_t part_number) const
    {
        std::scoped_lock lock(mutex_);
        auto it = attempt_times_.find(part_number);
        return it == attempt_times_.end()
                 ? std::vector<std::chrono::steady_clock::time_point>{}
                 : it->second;
    }

    size_t stored_part_size(uint32_t part_number) const
    {
        std::scoped_lock lock(mutex_);
        auto it = stored_.find(part_number);
        return it == stored_.end() ? 0 : it->second.first.size();
    }

    std::vector<s3zip::CompletedPart> completed_parts() const
    {
        return locked_(completed_parts_);
    }

    ByteVector object() const { return locked_(object_); }

  private:
    mutable std::mutex mutex_;

    std::map<std::pair<uint32_t, uint32_t>, s3zip::UploadResult> failures_;
    std::map<uint32_t, s3zip::UploadResult> always_fail_;
    bool fail_create_{ false };
    bool fail_complete_{ false };
    std::chrono::milliseconds upload_delay_{ 0 };

    std::string key_;
    std::map<uint32_t, uint32_t> attempts_;
    std::map<uint32_t, std::vector<std::chrono::steady_clock::time_point>>
      attempt_times_;
    std::map<uint32_t, std::pair<ByteVector, std::string>> stored_;
    std::vector<s3zip::CompletedPart> completed_parts_;
    ByteVector object_;

    size_t n_create_calls_{ 0 };
    size_t n_upload_calls_{ 0 };
    size_t n_complete_calls_{ 0 };
    size_t n_abort_calls_{ 0 };
    size_t in_flight_{ 0 };
    size_t max_in_flight_{ 0 };

    template<typename T>
    T locked_(const T& value) const
    {
        std::scoped_lock lock(mutex_);
        return value;
    }
};
