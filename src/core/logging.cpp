#include <traitstream/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace traitstream {

Result<spdlog::level::level_enum> parse_log_level(std::string_view level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "info") {
        return spdlog::level::info;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown log level '" + std::string(level) + "'"};
}

Result<void> configureLogging(const config::LoggingConfig& config) {
    auto level = parse_log_level(config.level);
    if (!level) {
        return level.error();
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string fileError;
    if (!config.file.empty()) {
        try {
            std::filesystem::path logPath(config.file);
            if (logPath.has_parent_path()) {
                std::filesystem::create_directories(logPath.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_size, config.max_files));
        } catch (const std::exception& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("traitstream", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(level.value());
    spdlog::flush_on(spdlog::level::warn);

    if (!fileError.empty()) {
        spdlog::warn("Log file '{}' unavailable, logging to console only: {}", config.file,
                     fileError);
    } else if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file,
                     config.max_size / (1024 * 1024), config.max_files);
    }
    return Result<void>{};
}

} // namespace traitstream
