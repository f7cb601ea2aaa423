#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <traitstream/core/protocol_constants.h>
#include <traitstream/core/types.h>

namespace traitstream::config {

struct EndpointConfig {
    std::string url = std::string(kDefaultGrpcBase) + std::string(kObserveEndpoint);
    std::string auth_token;
    std::string user_agent = std::string(kDefaultUserAgent);
    std::vector<std::pair<std::string, std::string>> extra_headers;
    std::vector<std::string> trait_filter; // empty = default observe list
};

struct StreamConfig {
    std::chrono::milliseconds stream_timeout{kDefaultStreamTimeout};
    std::chrono::milliseconds keepalive{kDefaultKeepaliveInterval};
};

struct FramingConfig {
    std::size_t catalog_threshold = kDefaultCatalogThreshold;
    std::size_t max_buffer_bytes = kDefaultMaxBufferBytes;
    std::size_t min_prefix_bytes = kMinPrefixBytes;
};

struct ReconnectConfig {
    std::string policy = "fixed"; // fixed | backoff
    std::chrono::milliseconds retry_delay{kDefaultRetryDelay};
    std::chrono::milliseconds max_delay{std::chrono::minutes(5)};
    double multiplier = 2.0;
    double jitter = 0.0;
    uint32_t max_attempts = 0; // 0 = unlimited
};

struct LoggingConfig {
    std::string level = "info";
    std::string file; // empty = console only
    std::size_t max_size = 10 * 1024 * 1024;
    std::size_t max_files = 3;
};

struct SessionConfig {
    EndpointConfig endpoint;
    StreamConfig stream;
    FramingConfig framing;
    ReconnectConfig reconnect;
    LoggingConfig logging;
};

// Load a config file. A missing file yields defaults; malformed numbers or an unknown policy
// yield InvalidArgument.
Result<SessionConfig> load_session_config(const std::filesystem::path& path);

// TRAITSTREAM_LOG_LEVEL and TRAITSTREAM_ENDPOINT take precedence over file values.
void apply_env_overrides(SessionConfig& config);

// get_config_path() -> load_session_config() -> apply_env_overrides()
Result<SessionConfig> resolve_session_config(const std::string& override_path = "");

} // namespace traitstream::config
