#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string_view>

#include <traitstream/core/protocol_constants.h>

namespace traitstream::config {
struct ReconnectConfig;
}

namespace traitstream::session {

/**
 * @brief Decides how long a session waits before reconnecting.
 *
 * `attempt` counts consecutive failures, starting at 1. Returning std::nullopt ends the session.
 * reset() is called once a connection delivers data again.
 */
class ReconnectPolicy {
public:
    virtual ~ReconnectPolicy() = default;

    virtual std::optional<std::chrono::milliseconds> next_delay(uint32_t attempt) = 0;
    virtual void reset() noexcept {}
    virtual std::string_view name() const noexcept = 0;
};

// Retries forever after the same delay.
class FixedDelayPolicy final : public ReconnectPolicy {
public:
    explicit FixedDelayPolicy(std::chrono::milliseconds delay = kDefaultRetryDelay)
        : delay_(delay) {}

    std::optional<std::chrono::milliseconds> next_delay(uint32_t) override { return delay_; }
    std::string_view name() const noexcept override { return "fixed"; }

private:
    std::chrono::milliseconds delay_;
};

// Exponential backoff capped at maxDelay, with optional +/- jitter and attempt limit.
class BackoffPolicy final : public ReconnectPolicy {
public:
    struct Options {
        std::chrono::milliseconds initialDelay{kDefaultRetryDelay};
        double multiplier{2.0};
        std::chrono::milliseconds maxDelay{std::chrono::minutes(5)};
        double jitter{0.0};      // fraction of the delay, 0..1
        uint32_t maxAttempts{0}; // 0 = unlimited
    };

    explicit BackoffPolicy(Options options);

    std::optional<std::chrono::milliseconds> next_delay(uint32_t attempt) override;
    std::string_view name() const noexcept override { return "backoff"; }

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
    std::mt19937 rng_;
};

std::unique_ptr<ReconnectPolicy> make_reconnect_policy(const config::ReconnectConfig& config);

} // namespace traitstream::session
