#include "retry.policy.hh"
#include "unit.test.macros.hh"

using namespace std::chrono_literals;

int
main()
{
    int retval = 1;

    try {
        s3zip::RetryPolicy policy{ .max_attempts = 4,
                                   .base_delay = 100ms,
                                   .max_delay = 1000ms };

        // attempts made so far, the first included
        CHECK(policy.should_retry(1));
        CHECK(policy.should_retry(3));
        CHECK(!policy.should_retry(4));
        CHECK(!policy.should_retry(5));

        EXPECT_EQ(int64_t, policy.backoff_ceiling(0).count(), 0);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(1).count(), 100);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(2).count(), 200);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(3).count(), 400);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(4).count(), 800);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(5).count(), 1000);
        EXPECT_EQ(int64_t, policy.backoff_ceiling(1000).count(), 1000);

        // full jitter: anywhere from 0 up to the ceiling
        bool saw_below_half = false, saw_above_half = false;
        for (auto i = 0; i < 2000; ++i) {
            const auto attempts = static_cast<uint32_t>(1 + i % 6);
            const auto delay = policy.delay_before_retry(attempts);
            const auto ceiling = policy.backoff_ceiling(attempts);

            EXPECT(delay.count() >= 0 && delay <= ceiling,
                   "Delay ",
                   delay.count(),
                   " ms is outside [0, ",
                   ceiling.count(),
                   "] ms");

            if (attempts == 5) {
                saw_below_half |= delay < 500ms;
                saw_above_half |= delay > 500ms;
            }
        }
        CHECK(saw_below_half && saw_above_half);

        s3zip::RetryPolicy no_retries{ .max_attempts = 1 };
        CHECK(!no_retries.should_retry(1));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
