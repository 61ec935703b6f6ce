#include "../src/TokenBucketLimiter.h"
#include <gtest/gtest.h>
#include <vector>

namespace {

using Clock = TokenBucketLimiter::Clock;
using std::chrono::seconds;

const Clock::time_point T0 = Clock::time_point{} + std::chrono::hours(1000);

} // namespace

TEST(TokenBucketLimiterTest, RejectsNonPositiveCapacity) {
    EXPECT_THROW(TokenBucketLimiter(0.0, 10.0), std::invalid_argument);
    EXPECT_THROW(TokenBucketLimiter(-1.0, 10.0), std::invalid_argument);
}

TEST(TokenBucketLimiterTest, NonPositiveRefillDefaultsToCapacity) {
    TokenBucketLimiter limiter(30.0, 0.0);
    EXPECT_DOUBLE_EQ(limiter.get_refill_per_minute(), 30.0);
}

TEST(TokenBucketLimiterTest, NewBucketStartsFull) {
    TokenBucketLimiter limiter(3.0, 3.0);
    EXPECT_DOUBLE_EQ(limiter.get_tokens("m1", T0), 3.0);
}

TEST(TokenBucketLimiterTest, DeniesOnceCapacityIsSpent) {
    TokenBucketLimiter limiter(3.0, 3.0);
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
    EXPECT_FALSE(limiter.allow("m1", 1.0, T0));
}

TEST(TokenBucketLimiterTest, DenialDoesNotConsume) {
    TokenBucketLimiter limiter(2.0, 60.0);
    EXPECT_TRUE(limiter.allow("m1", 1.5, T0));
    EXPECT_FALSE(limiter.allow("m1", 1.0, T0));
    EXPECT_DOUBLE_EQ(limiter.get_tokens("m1", T0), 0.5);
}

TEST(TokenBucketLimiterTest, RefillsContinuouslyUpToCapacity) {
    // 60 per minute is one token per second
    TokenBucketLimiter limiter(5.0, 60.0);
    for(int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.allow("m1", 1.0, T0));
    }
    EXPECT_FALSE(limiter.allow("m1", 1.0, T0));
    EXPECT_NEAR(limiter.get_tokens("m1", T0 + std::chrono::milliseconds(2500)), 2.5, 1e-9);
    EXPECT_DOUBLE_EQ(limiter.get_tokens("m1", T0 + std::chrono::minutes(10)), 5.0);
}

TEST(TokenBucketLimiterTest, KeysAreIndependent) {
    TokenBucketLimiter limiter(1.0, 1.0);
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
    EXPECT_FALSE(limiter.allow("m1", 1.0, T0));
    EXPECT_TRUE(limiter.allow("m2", 1.0, T0));
}

TEST(TokenBucketLimiterTest, EmptyKeyAlwaysAllowed) {
    TokenBucketLimiter limiter(1.0, 1.0);
    for(int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.allow("", 1.0, T0));
    }
}

TEST(TokenBucketLimiterTest, NonPositiveCostCountsAsOne) {
    TokenBucketLimiter limiter(2.0, 1.0);
    EXPECT_TRUE(limiter.allow("m1", 0.0, T0));
    EXPECT_TRUE(limiter.allow("m1", -3.0, T0));
    EXPECT_FALSE(limiter.allow("m1", 0.0, T0));
}

TEST(TokenBucketLimiterTest, ClockGoingBackwardsDoesNotRefill) {
    TokenBucketLimiter limiter(2.0, 60.0);
    EXPECT_TRUE(limiter.allow("m1", 2.0, T0));
    EXPECT_DOUBLE_EQ(limiter.get_tokens("m1", T0 - seconds(30)), 0.0);
}

TEST(TokenBucketLimiterTest, ResetRefillsEveryBucket) {
    TokenBucketLimiter limiter(1.0, 1.0);
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
    limiter.reset();
    EXPECT_TRUE(limiter.allow("m1", 1.0, T0));
}

TEST(TokenBucketLimiterTest, AnyMinuteAllowsAtMostCapacityPlusRefill) {
    const double capacity = 5.0;
    const double refill_per_minute = 3.0;
    TokenBucketLimiter limiter(capacity, refill_per_minute);

    std::vector<Clock::time_point> allowed;
    for(auto now = T0; now < T0 + std::chrono::minutes(5); now += std::chrono::milliseconds(100)) {
        if(limiter.allow("m1", 1.0, now)) {
            allowed.push_back(now);
        }
    }
    ASSERT_GE(allowed.size(), static_cast<size_t>(capacity + 4 * refill_per_minute));

    // every window [t, t + 60s] starting at an allowed call
    size_t end = 0;
    for(size_t start = 0; start < allowed.size(); ++start) {
        while(end < allowed.size() && allowed[end] <= allowed[start] + seconds(60)) {
            ++end;
        }
        EXPECT_LE(static_cast<double>(end - start), capacity + refill_per_minute)
            << "window starting " << start;
    }
}
