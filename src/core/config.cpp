#include "swc/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace swc {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<json> read_json_object(const fs::path& path) {
    if (!fs::exists(path)) {
        return Ok(json::object());
    }

    std::ifstream input(path);
    if (!input) {
        return Err<json>(ErrorKind::LocalIOError, "Failed to open " + path.string());
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<json>(ErrorKind::LocalIOError, "Malformed JSON in " + path.string());
    }
    return Ok(std::move(document));
}

// Write beside the target, then rename over it
Result<void> write_json_file(const fs::path& path, const json& document) {
    fs::path staging = path;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorKind::LocalIOError, "Failed to open " + staging.string());
        }
        output << document.dump(2);
        output.flush();
        if (!output) {
            return Err<void>(ErrorKind::LocalIOError, "Failed to write " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(ErrorKind::LocalIOError, "Failed to replace " + path.string());
    }
    return Ok();
}

} // namespace

fs::path default_state_dir(const std::string& argv0) {
    fs::path binary_dir = fs::path(argv0).parent_path();
    if (binary_dir.empty()) {
        binary_dir = ".";
    }
    return binary_dir / "state";
}

std::vector<LegacyLocation> legacy_locations(const fs::path& state_dir, const fs::path& home) {
    const fs::path config = state_dir / "config.json";
    const fs::path uploads = state_dir / "uploads.json";
    return {
        {home / ".swarm-commander.json", config},
        {home / ".swarm-commander-uploads.json", uploads},
        {home / ".swarm-uploader.json", config},
        {home / ".swarm-uploader-uploads.json", uploads},
    };
}

std::size_t migrate_legacy_state(const std::vector<LegacyLocation>& locations) {
    std::size_t copied = 0;
    for (const auto& location : locations) {
        std::error_code ec;
        if (fs::exists(location.to, ec) || !fs::exists(location.from, ec)) {
            continue;
        }
        fs::create_directories(location.to.parent_path(), ec);
        fs::copy_file(location.from, location.to, ec);
        if (ec) {
            spdlog::warn("Legacy migration {} -> {} failed: {}",
                         location.from.string(), location.to.string(), ec.message());
            continue;
        }
        spdlog::info("Migrated {} -> {}", location.from.string(), location.to.string());
        ++copied;
    }
    return copied;
}

Result<Config> load_config(const fs::path& state_dir) {
    std::error_code ec;
    fs::create_directories(state_dir, ec);
    if (ec && !fs::exists(state_dir)) {
        return Err<Config>(ErrorKind::LocalIOError,
                           "Failed to create state directory " + state_dir.string());
    }

    Config config;
    config.state_dir = state_dir;

    auto document = read_json_object(config.config_path());
    if (document.is_error()) {
        return Err<Config>(document.error());
    }
    const json& j = document.value();

    try {
        config.batch_id = j.value("batchId", config.batch_id);
        config.node_host = j.value("nodeHost", config.node_host);
        config.node_port = j.value("nodePort", config.node_port);
        config.poll_interval = std::chrono::milliseconds(
            j.value("pollIntervalMs", static_cast<std::int64_t>(config.poll_interval.count())));
        config.sync_poll_interval = std::chrono::milliseconds(
            j.value("syncPollIntervalMs", static_cast<std::int64_t>(config.sync_poll_interval.count())));
        config.sync_wait_ticks = j.value("syncWaitTicks", config.sync_wait_ticks);
        config.list_refresh_interval = std::chrono::milliseconds(
            j.value("listRefreshMs", static_cast<std::int64_t>(config.list_refresh_interval.count())));
        if (j.contains("archiveDir") && j["archiveDir"].is_string()) {
            config.archive_dir = j["archiveDir"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorKind::LocalIOError,
                           "Invalid value in " + config.config_path().string() + ": " + e.what());
    }

    return Ok(std::move(config));
}

void apply_environment(Config& config) {
    if (const char* batch = std::getenv("SWARM_BATCH_ID")) {
        if (*batch != '\0') {
            config.batch_id = batch;
        }
    }
}

Result<void> save_config(const Config& config) {
    auto document = read_json_object(config.config_path());
    if (document.is_error()) {
        // Keys this program does not manage would be lost; leave the file alone
        return Err<void>(document.error());
    }
    json j = std::move(document.value());

    j["batchId"] = config.batch_id;
    j["nodeHost"] = config.node_host;
    j["nodePort"] = config.node_port;

    return write_json_file(config.config_path(), j);
}

} // namespace swc
