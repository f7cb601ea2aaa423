#pragma once

#include <string_view>

#include <spdlog/common.h>

#include <traitstream/config/config.h>
#include <traitstream/core/types.h>

namespace traitstream {

// trace|debug|info|warn|error|off; InvalidArgument for anything else.
Result<spdlog::level::level_enum> parse_log_level(std::string_view level);

// Install the default "traitstream" logger: colour console sink plus an optional rotating file
// sink, at the configured level. Falls back to console only when the file cannot be opened.
Result<void> configureLogging(const config::LoggingConfig& config);

} // namespace traitstream
