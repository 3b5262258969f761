#pragma once

#include <chrono>
#include <cstdint>

namespace s3zip {
struct RetryPolicy
{
    uint32_t max_attempts{ 5 }; // per part, including the first attempt
    std::chrono::milliseconds base_delay{ 100 };
    std::chrono::milliseconds max_delay{ 10000 };

    /**
     * @brief Check whether a part may be sent again.
     * @param attempts_made The number of attempts already made for the part.
     * @return True if the part has attempts left, otherwise false.
     */
    [[nodiscard]] bool should_retry(uint32_t attempts_made) const;

    /**
     * @brief The upper bound on the backoff before the next attempt.
     * @details Doubles with every attempt, starting at `base_delay` after the
     * first, and saturates at `max_delay`.
     * @param attempts_made The number of attempts already made for the part.
     */
    [[nodiscard]] std::chrono::milliseconds backoff_ceiling(
      uint32_t attempts_made) const;

    /**
     * @brief Time to wait before the next attempt.
     * @details Uniform in [0, backoff_ceiling(attempts_made)] ("full jitter"),
     * so that parts failing together do not retry together.
     * @param attempts_made The number of attempts already made for the part.
     */
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(
      uint32_t attempts_made) const;
};
} // namespace s3zip
