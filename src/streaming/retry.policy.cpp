#include "retry.policy.hh"

#include <algorithm>
#include <random>

namespace {
std::mt19937_64&
rng()
{
    thread_local std::mt19937_64 engine{ std::random_device{}() };
    return engine;
}
} // namespace

bool
s3zip::RetryPolicy::should_retry(uint32_t attempts_made) const
{
    return attempts_made < max_attempts;
}

std::chrono::milliseconds
s3zip::RetryPolicy::backoff_ceiling(uint32_t attempts_made) const
{
    if (attempts_made == 0) {
        return std::chrono::milliseconds(0);
    }

    // 2^(attempts_made - 1), clamped to avoid overflowing the shift
    const auto exponent = std::min<uint32_t>(attempts_made - 1, 30);
    const auto ceiling = base_delay.count() * (int64_t(1) << exponent);
    return std::min(std::chrono::milliseconds(ceiling), max_delay);
}

std::chrono::milliseconds
s3zip::RetryPolicy::delay_before_retry(uint32_t attempts_made) const
{
    const auto ceiling = backoff_ceiling(attempts_made).count();
    if (ceiling <= 0) {
        return std::chrono::milliseconds(0);
    }

    std::uniform_int_distribution<int64_t> distribution(0, ceiling);
    return std::chrono::milliseconds(distribution(rng()));
}
