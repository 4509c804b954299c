#pragma once

#include "swc/core/config.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace swc::upload {

/**
 * @brief Caller-owned inputs every session reads at start
 *
 * Relative upload paths are resolved against current_dir.
 */
struct UploadContext {
    std::string batch_id;
    std::filesystem::path current_dir;
};

enum class UploadKind {
    File,
    Directory
};

struct UploadTarget {
    std::filesystem::path path;
    UploadKind kind = UploadKind::File;
};

struct SessionTimings {
    std::chrono::milliseconds poll_interval{300};
    std::chrono::milliseconds sync_poll_interval{500};
    std::size_t sync_wait_ticks = 240;

    static SessionTimings from_config(const Config& config) {
        return SessionTimings{config.poll_interval, config.sync_poll_interval, config.sync_wait_ticks};
    }
};

} // namespace swc::upload
