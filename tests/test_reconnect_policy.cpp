#include "client/reconnect_policy.hpp"

#include <gtest/gtest.h>

#include <stdexcept>


TEST(ReconnectPolicy, BacksOffExponentiallyUpToTheCap) {
    ReconnectPolicy policy(ReconnectPolicy::Config{});

    const long long expected[] = {500, 1000, 2000, 4000, 8000, 10000, 10000, 10000};
    for (long long ms : expected) {
        const auto d = policy.nextDelay();
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d->count(), ms);
    }
    EXPECT_FALSE(policy.nextDelay().has_value());
    EXPECT_TRUE(policy.exhausted());
}

TEST(ReconnectPolicy, ResetStartsOver) {
    ReconnectPolicy policy(ReconnectPolicy::Config{});
    policy.nextDelay();
    policy.nextDelay();
    policy.reset();
    EXPECT_EQ(policy.attempts(), 0);
    EXPECT_EQ(policy.nextDelay().value().count(), 500);
}

TEST(ReconnectPolicy, ZeroAttemptsMeansForever) {
    ReconnectPolicy::Config config;
    config.maxAttempts = 0;
    ReconnectPolicy policy(config);
    for (int i = 0; i < 100; ++i) ASSERT_TRUE(policy.nextDelay().has_value());
    EXPECT_EQ(policy.nextDelay().value().count(), 10000);
}

TEST(ReconnectPolicy, RejectsNonsense) {
    ReconnectPolicy::Config config;
    config.initialDelayMs = 0;
    EXPECT_THROW(ReconnectPolicy{config}, std::invalid_argument);

    config = ReconnectPolicy::Config{};
    config.multiplier = 0.5;
    EXPECT_THROW(ReconnectPolicy{config}, std::invalid_argument);
}
