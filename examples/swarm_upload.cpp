/**
 * @file swarm_upload.cpp
 * @brief Headless front end for the upload engine
 *
 * Uploads a file or directory to the local Bee node and prints progress,
 * lists the transfers the node knows about, or shows one upload record.
 *
 * Run with:
 *   ./build/swarm_upload --set-batch-id <id>
 *   ./build/swarm_upload photos/
 *   ./build/swarm_upload --background big.iso
 *   ./build/swarm_upload --list
 *   ./build/swarm_upload --detail 42
 */

#include "swc/core/config.hpp"
#include "swc/core/logging.hpp"
#include "swc/events/components.hpp"
#include "swc/events/events.hpp"
#include "swc/transport/bee_client.hpp"
#include "swc/upload/service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using namespace swc;

namespace {

struct Options {
    std::optional<fs::path> state_dir;
    std::optional<fs::path> log_file;
    bool verbose = false;
    std::optional<std::string> batch_id;
    bool list = false;
    std::optional<transport::TransferHandle> detail;
    bool background = false;
    std::optional<fs::path> path;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] [PATH]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --state-dir DIR       Where config.json and uploads.json live (default: <binary dir>/state)\n";
    std::cout << "  --log FILE            Write logs to FILE instead of stderr\n";
    std::cout << "  --verbose             Debug logging (includes every status poll)\n";
    std::cout << "  --set-batch-id ID     Store the postage batch id used for uploads\n";
    std::cout << "  --list                List transfers known to the node, newest first\n";
    std::cout << "  --detail UID          Show the local record of one transfer\n";
    std::cout << "  --background          Detach once the payload is being sent\n";
    std::cout << "  --help                Show this help message\n";
}

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << ' ' << units[unit];
    return out.str();
}

int show_detail(const upload::UploadService& service, transport::TransferHandle handle) {
    auto record = service.get_record(handle);
    if (record.is_error()) {
        spdlog::error("Cannot read upload records: {}", record.error().describe());
        return 1;
    }
    if (!record.value()) {
        std::cout << "No local record for tag " << handle << "\n";
        return 1;
    }

    const auto& r = *record.value();
    std::cout << "Tag:        " << handle << "\n";
    std::cout << "Name:       " << r.name << "\n";
    std::cout << "Date:       " << r.date << "\n";
    std::cout << "Batch:      " << r.batch_id << "\n";
    std::cout << "Size:       " << format_size(r.size) << "\n";
    std::cout << "Reference:  " << r.reference.value_or("(pending)") << "\n";
    if (r.is_directory) {
        std::cout << "Files:      " << r.file_count << "\n";
        std::cout << "Entry:      " << r.entry_point.value_or("(none)") << "\n";
    }
    return 0;
}

int list_transfers(asio::io_context& io, upload::UploadService& service) {
    int exit_code = 0;
    service.list_known_transfers([&exit_code](Result<std::vector<upload::KnownTransfer>> result) {
        if (result.is_error()) {
            spdlog::error("Cannot list transfers: {}", result.error().describe());
            exit_code = 1;
            return;
        }
        for (const auto& known : result.value()) {
            const auto& tag = known.status;
            const auto percent = tag.split > 0 ? (tag.synced * 100 + tag.split / 2) / tag.split : 0;
            const std::string name = known.record ? known.record->name : "(unknown)";
            std::cout << std::setw(8) << tag.uid << "  " << std::setw(3) << percent << "%  "
                      << tag.synced << "/" << tag.split << "  " << name << "\n";
        }
    });
    io.run();
    return exit_code;
}

int run_upload(asio::io_context& io, upload::UploadService& service, const fs::path& path, bool background) {
    std::error_code ec;
    const bool is_directory = fs::is_directory(path, ec);

    if (is_directory) {
        auto manifest = service.preview(path);
        if (manifest.is_error()) {
            spdlog::error("{}", manifest.error().describe());
            return 1;
        }
        std::cout << "Uploading " << manifest.value().file_count() << " files ("
                  << format_size(manifest.value().total_size) << ")"
                  << (manifest.value().has_entry_point ? ", entry point index.html" : "") << "\n";
    }

    auto session = is_directory ? service.start_directory_upload(path) : service.start_file_upload(path);
    events::LoggerComponent logger(session->events());
    auto& bus = session->events();

    int exit_code = 0;
    upload::UploadSession* raw = session.get();

    bus.subscribe<events::TransferCreatedEvent>([](const events::TransferCreatedEvent& e) {
        std::cout << "Tag " << e.handle << " created for " << e.name << "\n";
    });

    bus.subscribe<events::StateChangedEvent>([raw, background](const events::StateChangedEvent& e) {
        if (background && e.to == upload::SessionState::Transferring) {
            auto detached = raw->detach();
            if (detached.is_ok()) {
                std::cout << "Upload continues in the background (tag " << raw->info().handle.value_or(0) << ")\n";
            } else {
                spdlog::warn("{}", detached.error().describe());
            }
        }
    });

    bus.subscribe<events::ProgressUpdatedEvent>([raw](const events::ProgressUpdatedEvent& e) {
        std::cout << "\r" << std::setw(3) << static_cast<int>(e.progress.percent) << "%  "
                  << format_size(e.progress.bytes) << " / " << format_size(raw->total_bytes()) << "  "
                  << upload::describe(e.progress) << "        " << std::flush;
    });

    bus.subscribe<events::SessionCompletedEvent>([](const events::SessionCompletedEvent& e) {
        std::cout << "\n" << (e.synced ? "Synced: " : "Uploaded (syncing): ") << e.name << " -> "
                  << e.reference << "\n";
    });

    bus.subscribe<events::SessionFailedEvent>([&exit_code](const events::SessionFailedEvent& e) {
        std::cout << "\nUpload failed: " << e.error.message << "\n";
        exit_code = 1;
    });

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const boost::system::error_code& error, int) {
        if (!error) {
            spdlog::info("Interrupted, stopping");
            io.stop();
        }
    });

    // Run until the session and its in-flight calls have settled
    while (!io.stopped()) {
        io.run_one();
        if (upload::is_terminal(session->state()) && !session->payload_pending()) {
            signals.cancel();
        }
    }
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--state-dir" || arg == "--log" || arg == "--set-batch-id" || arg == "--detail") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--state-dir") {
                options.state_dir = value;
            } else if (arg == "--log") {
                options.log_file = value;
            } else if (arg == "--set-batch-id") {
                options.batch_id = value;
            } else {
                try {
                    options.detail = std::stoull(value);
                } catch (const std::exception&) {
                    std::cerr << "Invalid tag uid: " << value << "\n";
                    return 1;
                }
            }
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--list") {
            options.list = true;
        } else if (arg == "--background") {
            options.background = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            options.path = arg;
        }
    }

    LoggingOptions logging;
    logging.level = options.verbose ? spdlog::level::debug : spdlog::level::info;
    logging.file = options.log_file;
    init_logging(logging);

    const fs::path state_dir = options.state_dir.value_or(default_state_dir(argv[0]));
    if (const char* home = std::getenv("HOME")) {
        migrate_legacy_state(legacy_locations(state_dir, home));
    }

    auto loaded = load_config(state_dir);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().describe());
        return 1;
    }
    Config config = std::move(loaded.value());
    apply_environment(config);

    asio::io_context io;
    transport::BeeClient bee(io, config.node_host, config.node_port);
    upload::UploadService service(io, bee, config);

    if (options.batch_id) {
        auto saved = service.set_batch_id(*options.batch_id);
        if (saved.is_error()) {
            spdlog::error("{}", saved.error().describe());
            return 1;
        }
        std::cout << "Batch id saved to " << service.config().config_path().string() << "\n";
    }

    if (options.detail) {
        return show_detail(service, *options.detail);
    }
    if (options.list) {
        return list_transfers(io, service);
    }
    if (options.path) {
        return run_upload(io, service, *options.path, options.background);
    }

    if (!options.batch_id) {
        print_usage(argv[0]);
    }
    return 0;
}
