#pragma once

#include "swc/archive/packager.hpp"
#include "swc/core/config.hpp"
#include "swc/core/result.hpp"
#include "swc/events/event_bus.hpp"
#include "swc/metadata/store.hpp"
#include "swc/transport/client.hpp"
#include "swc/upload/session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace swc::upload {

/**
 * @brief A transfer the node reports, joined with what we recorded locally
 */
struct KnownTransfer {
    transport::TransferStatus status;
    std::optional<metadata::UploadRecord> record;
};

/**
 * @brief Caller-facing entry point of the upload engine
 *
 * Owns the metadata store and the archive packager shared by every session
 * it starts. It must outlive the io_context run that drives those sessions.
 *
 * ```cpp
 * UploadService service(io, bee, config);
 * auto session = service.start_file_upload("notes.txt");
 * session->events().subscribe<events::ProgressUpdatedEvent>(...);
 * io.run();
 * ```
 */
class UploadService {
public:
    using KnownTransfersCallback = std::function<void(Result<std::vector<KnownTransfer>>)>;

    /// Page size used when walking the node's transfer list
    static constexpr std::size_t kListPageSize = 1000;

    UploadService(boost::asio::io_context& io_context, transport::TransportClient& transport, Config config);

    std::shared_ptr<UploadSession> start_file_upload(const std::filesystem::path& path);
    std::shared_ptr<UploadSession> start_directory_upload(const std::filesystem::path& path);

    /**
     * @brief Every transfer the node knows, newest (highest handle) first
     *
     * Walks the list in pages of kListPageSize until a short page. Each
     * entry carries the local record when one exists.
     */
    void list_known_transfers(KnownTransfersCallback done);

    Result<std::optional<metadata::UploadRecord>> get_record(transport::TransferHandle handle) const;

    /// File count and size of a directory before committing to an upload
    Result<archive::DirectoryManifest> preview(const std::filesystem::path& path) const;

    /// Change the storage-allocation id and persist it to config.json
    Result<void> set_batch_id(const std::string& batch_id);

    void set_current_dir(std::filesystem::path dir) { current_dir_ = std::move(dir); }

    const Config& config() const noexcept { return config_; }

private:
    std::shared_ptr<UploadSession> start_upload(const std::filesystem::path& path, UploadKind kind);

    boost::asio::io_context& io_context_;
    transport::TransportClient& transport_;
    Config config_;
    metadata::MetadataStore store_;
    archive::ArchivePackager packager_;
    std::filesystem::path current_dir_;
};

/**
 * @brief Periodic refresh of the transfer list with reachability tracking
 *
 * Publishes TransferListUpdatedEvent after every good refresh. The first
 * refresh that finds the node unreachable publishes NodeUnreachableEvent
 * once; list updates stop until a refresh succeeds again, which publishes
 * NodeReachableEvent. Refreshes never overlap: the next one is scheduled
 * only after the previous one settles.
 */
class TransferListMonitor : public std::enable_shared_from_this<TransferListMonitor> {
public:
    TransferListMonitor(boost::asio::io_context& io_context, UploadService& service,
                        std::chrono::milliseconds interval);

    void start();
    void stop();

    events::EventBus& events() noexcept { return events_; }
    bool reachable() const noexcept { return reachable_; }

private:
    void refresh();
    void on_listed(Result<std::vector<KnownTransfer>> result);
    void schedule();

    UploadService& service_;
    std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
    events::EventBus events_;
    bool reachable_ = true;
    bool running_ = false;
};

} // namespace swc::upload
