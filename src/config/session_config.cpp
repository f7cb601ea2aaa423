#include <traitstream/config/config.h>
#include <traitstream/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <map>
#include <sstream>
#include <system_error>

namespace traitstream::config {

namespace {

using ConfigMap = std::map<std::string, std::string>;

template <typename Int> Result<void> read_integer(const ConfigMap& values, const std::string& key,
                                                 Int& out) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return {};
    }
    const auto& text = it->second;
    Int parsed{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidArgument, "Invalid integer for " + key + ": '" + text + "'"};
    }
    out = parsed;
    return {};
}

Result<void> read_millis(const ConfigMap& values, const std::string& key,
                         std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    auto r = read_integer(values, key, ms);
    if (!r) {
        return r;
    }
    if (ms < 0) {
        return Error{ErrorCode::InvalidArgument, key + " must not be negative"};
    }
    out = std::chrono::milliseconds(ms);
    return {};
}

Result<void> read_double(const ConfigMap& values, const std::string& key, double& out) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return {};
    }
    try {
        size_t used = 0;
        double parsed = std::stod(it->second, &used);
        if (used != it->second.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid number for " + key + ": '" + it->second + "'"};
        }
        out = parsed;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for " + key + ": '" + it->second + "'"};
    }
    return {};
}

void read_string(const ConfigMap& values, const std::string& key, std::string& out) {
    if (auto it = values.find(key); it != values.end()) {
        out = it->second;
    }
}

// Accepts "a,b" or ["a", "b"]
std::vector<std::string> parse_list(std::string raw) {
    trim(raw);
    if (raw.size() >= 2 && raw.front() == '[' && raw.back() == ']') {
        raw = raw.substr(1, raw.size() - 2);
    }
    std::vector<std::string> out;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

} // namespace

Result<SessionConfig> load_session_config(const std::filesystem::path& path) {
    SessionConfig cfg;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config at '{}', using defaults", path.string());
        return cfg;
    }

    const auto values = load_config_map(path);

    read_string(values, "endpoint.url", cfg.endpoint.url);
    read_string(values, "endpoint.token", cfg.endpoint.auth_token);
    read_string(values, "endpoint.user_agent", cfg.endpoint.user_agent);
    if (auto it = values.find("endpoint.traits"); it != values.end()) {
        cfg.endpoint.trait_filter = parse_list(it->second);
    }
    const std::string headerPrefix = "endpoint.header.";
    for (const auto& [key, value] : values) {
        if (key.rfind(headerPrefix, 0) == 0 && key.size() > headerPrefix.size()) {
            cfg.endpoint.extra_headers.emplace_back(key.substr(headerPrefix.size()), value);
        }
    }

    for (auto r : {read_millis(values, "stream.retry_delay_ms", cfg.reconnect.retry_delay),
                   read_millis(values, "stream.stream_timeout_ms", cfg.stream.stream_timeout),
                   read_millis(values, "stream.keepalive_ms", cfg.stream.keepalive),
                   read_integer(values, "framing.catalog_threshold", cfg.framing.catalog_threshold),
                   read_integer(values, "framing.max_buffer_bytes", cfg.framing.max_buffer_bytes),
                   read_integer(values, "framing.min_prefix_bytes", cfg.framing.min_prefix_bytes),
                   read_millis(values, "reconnect.max_delay_ms", cfg.reconnect.max_delay),
                   read_double(values, "reconnect.multiplier", cfg.reconnect.multiplier),
                   read_double(values, "reconnect.jitter", cfg.reconnect.jitter),
                   read_integer(values, "reconnect.max_attempts", cfg.reconnect.max_attempts),
                   read_integer(values, "logging.max_size", cfg.logging.max_size),
                   read_integer(values, "logging.max_files", cfg.logging.max_files)}) {
        if (!r) {
            return r.error();
        }
    }

    read_string(values, "reconnect.policy", cfg.reconnect.policy);
    if (cfg.reconnect.policy != "fixed" && cfg.reconnect.policy != "backoff") {
        return Error{ErrorCode::InvalidArgument,
                     "Unknown reconnect policy '" + cfg.reconnect.policy + "'"};
    }
    if (cfg.reconnect.jitter < 0.0 || cfg.reconnect.jitter > 1.0) {
        return Error{ErrorCode::InvalidArgument, "reconnect.jitter must be within [0, 1]"};
    }
    if (cfg.framing.min_prefix_bytes == 0) {
        return Error{ErrorCode::InvalidArgument, "framing.min_prefix_bytes must be positive"};
    }
    if (cfg.stream.keepalive.count() == 0) {
        return Error{ErrorCode::InvalidArgument, "stream.keepalive_ms must be positive"};
    }

    read_string(values, "logging.level", cfg.logging.level);
    read_string(values, "logging.file", cfg.logging.file);
    if (!cfg.logging.file.empty()) {
        cfg.logging.file = expand_tilde(cfg.logging.file).string();
    }

    spdlog::debug("Loaded config from '{}'", path.string());
    return cfg;
}

void apply_env_overrides(SessionConfig& config) {
    if (const char* level = std::getenv("TRAITSTREAM_LOG_LEVEL"); level && *level) {
        config.logging.level = level;
    }
    if (const char* endpoint = std::getenv("TRAITSTREAM_ENDPOINT"); endpoint && *endpoint) {
        config.endpoint.url = endpoint;
    }
}

Result<SessionConfig> resolve_session_config(const std::string& override_path) {
    auto loaded = load_session_config(get_config_path(override_path));
    if (!loaded) {
        return loaded;
    }
    auto cfg = std::move(loaded).value();
    apply_env_overrides(cfg);
    return cfg;
}

} // namespace traitstream::config
