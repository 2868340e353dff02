#include <vector>

#include <gtest/gtest.h>

#include "RetryPolicy.h"

using namespace SanImportLib;

TEST(RetryPolicyTest, BackoffDoublesUpToTheCeiling)
{
    RetryPolicy policy(5, 1000, 10000);

    EXPECT_EQ(1000u, policy.DelayForAttempt(1));
    EXPECT_EQ(2000u, policy.DelayForAttempt(2));
    EXPECT_EQ(4000u, policy.DelayForAttempt(3));
    EXPECT_EQ(8000u, policy.DelayForAttempt(4));
    EXPECT_EQ(10000u, policy.DelayForAttempt(5));
    EXPECT_EQ(10000u, policy.DelayForAttempt(64));
}

TEST(RetryPolicyTest, WaitGoesThroughTheSleeper)
{
    std::vector<uint32_t> delays;
    RetryPolicy policy(3, 500, 4000);
    policy.SetSleeper([&delays](uint32_t delayMs) { delays.push_back(delayMs); });

    policy.Wait(1);
    policy.Wait(2);
    policy.Wait(5);

    ASSERT_EQ(3u, delays.size());
    EXPECT_EQ(500u, delays[0]);
    EXPECT_EQ(1000u, delays[1]);
    EXPECT_EQ(4000u, delays[2]);
}
