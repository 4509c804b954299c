#pragma once

#include "swc/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace swc {

/**
 * @brief Runtime configuration shared by the engine and its front ends
 *
 * Persisted as <state_dir>/config.json next to the uploads table. Only the
 * keys present in the file override the defaults below.
 */
struct Config {
    std::filesystem::path state_dir;
    std::string batch_id;                                    ///< Storage-allocation (postage batch) id
    std::string node_host = "127.0.0.1";
    std::uint16_t node_port = 1633;
    std::chrono::milliseconds poll_interval{300};            ///< Status poll cadence while transferring
    std::chrono::milliseconds sync_poll_interval{500};       ///< Status poll cadence while waiting for sync
    std::size_t sync_wait_ticks = 240;                       ///< Sync-wait ceiling, in sync poll ticks
    std::chrono::milliseconds list_refresh_interval{1000};   ///< Transfer list refresh cadence
    std::filesystem::path archive_dir;                       ///< Where temporary archives go (empty = system temp)

    std::filesystem::path config_path() const { return state_dir / "config.json"; }
    std::filesystem::path uploads_db_path() const { return state_dir / "uploads.json"; }
};

struct LegacyLocation {
    std::filesystem::path from;
    std::filesystem::path to;
};

/// State directory beside the executable, e.g. /opt/swc/bin/state
std::filesystem::path default_state_dir(const std::string& argv0);

/// Files older releases kept in the home directory
std::vector<LegacyLocation> legacy_locations(const std::filesystem::path& state_dir,
                                             const std::filesystem::path& home);

/**
 * @brief Copy legacy files into the state directory where the target is missing
 * @return Number of files copied
 */
std::size_t migrate_legacy_state(const std::vector<LegacyLocation>& locations);

/**
 * @brief Load config.json from the state directory (missing file = defaults)
 *
 * Creates the state directory when absent. A malformed file is reported as
 * LocalIOError rather than silently replaced.
 */
Result<Config> load_config(const std::filesystem::path& state_dir);

/// Apply SWARM_BATCH_ID from the environment, if set
void apply_environment(Config& config);

/// Merge the persistent keys of config into config.json
Result<void> save_config(const Config& config);

} // namespace swc
