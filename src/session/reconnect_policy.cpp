#include <traitstream/session/reconnect_policy.h>

#include <traitstream/config/config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace traitstream::session {

BackoffPolicy::BackoffPolicy(Options options)
    : options_(options), rng_(std::random_device{}()) {
    options_.multiplier = std::max(options_.multiplier, 1.0);
    options_.jitter = std::clamp(options_.jitter, 0.0, 1.0);
}

std::optional<std::chrono::milliseconds> BackoffPolicy::next_delay(uint32_t attempt) {
    if (options_.maxAttempts != 0 && attempt > options_.maxAttempts) {
        return std::nullopt;
    }
    const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    double delay = static_cast<double>(options_.initialDelay.count()) *
                   std::pow(options_.multiplier, exponent);
    delay = std::min(delay, static_cast<double>(options_.maxDelay.count()));

    if (options_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(-options_.jitter, options_.jitter);
        delay += delay * dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay, 0.0)));
}

std::unique_ptr<ReconnectPolicy> make_reconnect_policy(const config::ReconnectConfig& config) {
    if (config.policy == "backoff") {
        BackoffPolicy::Options opts;
        opts.initialDelay = config.retry_delay;
        opts.maxDelay = std::max(config.max_delay, config.retry_delay);
        opts.multiplier = config.multiplier;
        opts.jitter = config.jitter;
        opts.maxAttempts = config.max_attempts;
        return std::make_unique<BackoffPolicy>(opts);
    }
    if (config.policy != "fixed") {
        spdlog::warn("Unknown reconnect policy '{}', using fixed delay", config.policy);
    }
    return std::make_unique<FixedDelayPolicy>(config.retry_delay);
}

} // namespace traitstream::session
