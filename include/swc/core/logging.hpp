#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>

namespace swc {

struct LoggingOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::optional<std::filesystem::path> file;  ///< Log to a file instead of stderr
};

/**
 * @brief Install the process-wide default spdlog logger
 *
 * Falls back to the stderr sink (and logs a warning) when the log file
 * cannot be opened.
 */
void init_logging(const LoggingOptions& options);

} // namespace swc
