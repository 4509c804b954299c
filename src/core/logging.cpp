#include "swc/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

namespace swc {

void init_logging(const LoggingOptions& options) {
    std::shared_ptr<spdlog::logger> logger;
    std::string file_error;

    spdlog::drop("swc");
    if (options.file) {
        try {
            logger = spdlog::basic_logger_mt("swc", options.file->string());
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    if (!logger) {
        logger = spdlog::stderr_color_mt("swc");
    }

    spdlog::set_default_logger(logger);
    spdlog::set_level(options.level);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!file_error.empty()) {
        spdlog::warn("Cannot open log file {}: {}", options.file->string(), file_error);
    }
}

} // namespace swc
