#include <chrono>

#include <gtest/gtest.h>

#include "retry_timeout.h"

namespace tunnel
{

namespace
{

using std::chrono::milliseconds;

const auto kBefore = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);

}    // namespace

TEST(retry_timeout_test, BaseIsTwelveHundredMilliseconds) { EXPECT_EQ(retry_timeout(kBefore, kBefore), milliseconds(1200)); }

TEST(retry_timeout_test, AddsTwiceTheHandshakeTime)
{
    EXPECT_EQ(retry_timeout(kBefore, kBefore + milliseconds(50)), milliseconds(1300));
    EXPECT_EQ(retry_timeout(kBefore, kBefore + milliseconds(400)), milliseconds(2000));
}

TEST(retry_timeout_test, NegativeHandshakeTimeCountsAsZero)
{
    EXPECT_EQ(retry_timeout(kBefore + milliseconds(30), kBefore), milliseconds(1200));
}

TEST(retry_timeout_test, KeepsSubMillisecondPrecision)
{
    const auto rtt = std::chrono::microseconds(1500);
    EXPECT_EQ(retry_timeout(kBefore, kBefore + rtt), milliseconds(1200) + std::chrono::microseconds(3000));
}

TEST(retry_timeout_test, PolicyOverridesBaseAndMultiplier)
{
    const retry_timeout_policy policy{.base = milliseconds(100), .rtt_multiplier = 3};
    EXPECT_EQ(policy.estimate(kBefore, kBefore + milliseconds(10)), milliseconds(130));

    const retry_timeout_policy base_only{.base = milliseconds(250), .rtt_multiplier = 0};
    EXPECT_EQ(base_only.estimate(kBefore, kBefore + milliseconds(999)), milliseconds(250));
}

TEST(retry_timeout_test, DefaultPolicyMatchesFreeFunction)
{
    const retry_timeout_policy policy;
    EXPECT_EQ(policy.estimate(kBefore, kBefore + milliseconds(77)), retry_timeout(kBefore, kBefore + milliseconds(77)));
}

}    // namespace tunnel
