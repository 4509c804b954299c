#pragma once

#include "swc/archive/packager.hpp"
#include "swc/core/result.hpp"
#include "swc/events/event_bus.hpp"
#include "swc/metadata/store.hpp"
#include "swc/transport/client.hpp"
#include "swc/upload/progress.hpp"
#include "swc/upload/state.hpp"
#include "swc/upload/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace swc::upload {

/**
 * @brief One upload of a file or directory, from handle creation to sync
 *
 * Lifecycle:
 * 1. start() posts run() to the event loop, so subscribers can attach to
 *    events() first
 * 2. Initializing: batch id check, payload read (and tar packing for
 *    directories); failures here never touch the node
 * 3. CreatingTransfer: ask the node for a handle, write the first record
 * 4. Transferring: poll timer started, then the whole payload is sent
 * 5. Syncing: reference written; polling continues until synced or the
 *    tick budget runs out (Completed either way)
 *
 * detach() during Transferring or Syncing stops observation only. The
 * payload call in flight still completes and still writes its reference
 * to the metadata store.
 *
 * THREADING:
 * Every method must be called on the thread running the io_context.
 * Pending handlers hold a shared_ptr to the session, so dropping the
 * caller's pointer never cuts an upload short.
 */
class UploadSession : public std::enable_shared_from_this<UploadSession> {
public:
    UploadSession(boost::asio::io_context& io_context,
                  transport::TransportClient& transport,
                  metadata::MetadataStore& store,
                  const archive::ArchivePackager& packager,
                  UploadContext context,
                  UploadTarget target,
                  SessionTimings timings);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /// Schedule the upload on the next event-loop turn
    void start();

    /**
     * @brief Stop observing and let the upload finish unattended
     * @return PreconditionFailed unless the session is Transferring or Syncing
     */
    Result<void> detach();

    events::EventBus& events() noexcept { return events_; }

    [[nodiscard]] SessionState state() const noexcept { return machine_.state(); }
    [[nodiscard]] const SessionInfo& info() const noexcept { return machine_.info(); }
    [[nodiscard]] const ProgressSnapshot& progress() const noexcept { return reconciler_.current(); }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }

    /// True while a payload call is still in flight (also after detach)
    [[nodiscard]] bool payload_pending() const noexcept { return payload_pending_; }

private:
    void run();
    Result<void> prepare_payload();
    void create_transfer();
    void on_transfer_created(Result<transport::TransferHandle> result);
    void send_payload();
    void on_payload_settled(Result<transport::ContentAddress> result);

    void schedule_poll();
    void on_poll_tick();
    void on_status(Result<transport::TransferStatus> result);

    void enter(SessionState next);
    void complete(bool synced);
    void fail(Error error);
    void publish_transition(SessionState from, SessionState to);
    void publish_progress();
    void release_payload();

    bool observed() const noexcept { return machine_.state() != SessionState::Detached; }
    std::chrono::milliseconds current_poll_interval() const;

    boost::asio::io_context& io_context_;
    transport::TransportClient& transport_;
    metadata::MetadataStore& store_;
    const archive::ArchivePackager& packager_;
    UploadContext context_;
    UploadTarget target_;
    SessionTimings timings_;

    UploadStateMachine machine_;
    events::EventBus events_;
    boost::asio::steady_timer poll_timer_;
    ProgressReconciler reconciler_{0};

    std::filesystem::path resolved_path_;
    std::uint64_t total_bytes_ = 0;
    std::shared_ptr<const std::vector<std::uint8_t>> payload_;
    std::unique_ptr<archive::ArchiveJob> archive_;

    bool poll_in_flight_ = false;
    bool payload_pending_ = false;
    std::size_t sync_ticks_used_ = 0;
    std::chrono::steady_clock::time_point started_{};
};

/// Display name of an upload path: its last component, ignoring a trailing separator
std::string upload_name(const std::filesystem::path& path);

} // namespace swc::upload
