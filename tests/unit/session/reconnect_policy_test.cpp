#include <gtest/gtest.h>

#include <chrono>

#include <traitstream/config/config.h>
#include <traitstream/session/reconnect_policy.h>

namespace traitstream::tests::session {

using namespace std::chrono_literals;
using traitstream::session::BackoffPolicy;
using traitstream::session::FixedDelayPolicy;
using traitstream::session::make_reconnect_policy;

TEST(ReconnectPolicyTest, FixedDelayNeverGivesUp) {
    FixedDelayPolicy policy(250ms);
    for (uint32_t attempt = 1; attempt < 100; attempt += 7) {
        EXPECT_EQ(policy.next_delay(attempt), 250ms);
    }
    EXPECT_EQ(policy.name(), "fixed");
}

TEST(ReconnectPolicyTest, FixedDelayDefaultsToTenSeconds) {
    FixedDelayPolicy policy;
    EXPECT_EQ(policy.next_delay(1), 10000ms);
}

TEST(ReconnectPolicyTest, BackoffGrowsGeometricallyUntilCapped) {
    BackoffPolicy::Options opts;
    opts.initialDelay = 100ms;
    opts.multiplier = 2.0;
    opts.maxDelay = 1000ms;
    BackoffPolicy policy(opts);

    EXPECT_EQ(policy.next_delay(1), 100ms);
    EXPECT_EQ(policy.next_delay(2), 200ms);
    EXPECT_EQ(policy.next_delay(3), 400ms);
    EXPECT_EQ(policy.next_delay(4), 800ms);
    EXPECT_EQ(policy.next_delay(5), 1000ms);
    EXPECT_EQ(policy.next_delay(40), 1000ms);
    EXPECT_EQ(policy.name(), "backoff");
}

TEST(ReconnectPolicyTest, BackoffStopsAfterMaxAttempts) {
    BackoffPolicy::Options opts;
    opts.initialDelay = 10ms;
    opts.maxAttempts = 3;
    BackoffPolicy policy(opts);

    EXPECT_TRUE(policy.next_delay(3));
    EXPECT_FALSE(policy.next_delay(4));
}

TEST(ReconnectPolicyTest, JitterStaysWithinBounds) {
    BackoffPolicy::Options opts;
    opts.initialDelay = 1000ms;
    opts.multiplier = 1.0;
    opts.jitter = 0.2;
    BackoffPolicy policy(opts);

    for (int i = 0; i < 500; ++i) {
        auto delay = policy.next_delay(1);
        ASSERT_TRUE(delay);
        EXPECT_GE(delay->count(), 800);
        EXPECT_LE(delay->count(), 1200);
    }
}

TEST(ReconnectPolicyTest, BackoffOptionsAreClamped) {
    BackoffPolicy::Options opts;
    opts.multiplier = 0.5;
    opts.jitter = 3.0;
    BackoffPolicy policy(opts);
    EXPECT_DOUBLE_EQ(policy.options().multiplier, 1.0);
    EXPECT_DOUBLE_EQ(policy.options().jitter, 1.0);
}

TEST(ReconnectPolicyTest, FactoryHonoursConfiguredPolicy) {
    config::ReconnectConfig cfg;
    cfg.retry_delay = 500ms;
    auto fixed = make_reconnect_policy(cfg);
    EXPECT_EQ(fixed->name(), "fixed");
    EXPECT_EQ(fixed->next_delay(9), 500ms);

    cfg.policy = "backoff";
    cfg.max_delay = 100ms; // below the initial delay, raised to it
    cfg.max_attempts = 2;
    auto backoff = make_reconnect_policy(cfg);
    EXPECT_EQ(backoff->name(), "backoff");
    EXPECT_EQ(backoff->next_delay(1), 500ms);
    EXPECT_EQ(backoff->next_delay(2), 500ms);
    EXPECT_FALSE(backoff->next_delay(3));
}

} // namespace traitstream::tests::session
