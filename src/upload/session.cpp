#include "swc/upload/session.hpp"

#include "swc/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace swc::upload {
namespace fs = std::filesystem;

namespace {

Result<std::vector<std::uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIOError, "Not a regular file: " + path.string());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIOError, "Cannot open " + path.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIOError, "Failed to read " + path.string());
    }
    return Ok(std::move(bytes));
}

fs::path resolve_target(const fs::path& current_dir, const fs::path& path) {
    return (path.is_absolute() ? path : current_dir / path).lexically_normal();
}

} // namespace

std::string upload_name(const fs::path& path) {
    auto normal = path.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    auto name = normal.filename().string();
    if (name.empty() || name == "." || name == "..") {
        // Filesystem root, or a relative path that never names a directory
        return normal.string();
    }
    return name;
}

UploadSession::UploadSession(boost::asio::io_context& io_context,
                             transport::TransportClient& transport,
                             metadata::MetadataStore& store,
                             const archive::ArchivePackager& packager,
                             UploadContext context,
                             UploadTarget target,
                             SessionTimings timings)
    : io_context_(io_context),
      transport_(transport),
      store_(store),
      packager_(packager),
      context_(std::move(context)),
      target_(std::move(target)),
      timings_(timings),
      machine_(upload_name(resolve_target(context_.current_dir, target_.path))),
      poll_timer_(io_context) {}

void UploadSession::start() {
    boost::asio::post(io_context_, [self = shared_from_this()]() { self->run(); });
}

Result<void> UploadSession::detach() {
    const auto current = machine_.state();
    if (current != SessionState::Transferring && current != SessionState::Syncing) {
        return Err<void>(ErrorKind::PreconditionFailed,
                         std::string("Cannot detach a session that is ") + to_string(current));
    }

    auto moved = machine_.transition_to(SessionState::Detached);
    if (moved.is_error()) {
        return moved;
    }
    poll_timer_.cancel();
    events_.clear();
    spdlog::info("Upload of {} continues in the background (tag {})", info().name, info().handle.value_or(0));
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Initializing
// ──────────────────────────────────────────────────────────

void UploadSession::run() {
    started_ = std::chrono::steady_clock::now();

    if (context_.batch_id.empty()) {
        fail(Error(ErrorKind::PreconditionFailed, "No postage batch id configured"));
        return;
    }

    resolved_path_ = resolve_target(context_.current_dir, target_.path);

    if (auto prepared = prepare_payload(); prepared.is_error()) {
        fail(prepared.error());
        return;
    }

    reconciler_ = ProgressReconciler(total_bytes_);
    create_transfer();
}

Result<void> UploadSession::prepare_payload() {
    if (target_.kind == UploadKind::File) {
        auto bytes = read_file(resolved_path_);
        if (bytes.is_error()) {
            return Err<void>(bytes.error());
        }
        total_bytes_ = bytes.value().size();
        payload_ = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes.value()));
        return Ok();
    }

    auto manifest = packager_.scan(resolved_path_);
    if (manifest.is_error()) {
        return Err<void>(manifest.error());
    }
    if (manifest.value().file_count() == 0) {
        return Err<void>(ErrorKind::PreconditionFailed, "Directory is empty: " + resolved_path_.string());
    }

    auto job = packager_.pack(manifest.value());
    if (job.is_error()) {
        return Err<void>(job.error());
    }
    auto bytes = job.value()->read_bytes();
    if (bytes.is_error()) {
        return Err<void>(bytes.error());
    }

    total_bytes_ = manifest.value().total_size;
    archive_ = std::move(job.value());
    payload_ = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes.value()));
    return Ok();
}

// ──────────────────────────────────────────────────────────
// CreatingTransfer
// ──────────────────────────────────────────────────────────

void UploadSession::create_transfer() {
    enter(SessionState::CreatingTransfer);
    transport_.create_transfer([self = shared_from_this()](Result<transport::TransferHandle> result) {
        self->on_transfer_created(std::move(result));
    });
}

void UploadSession::on_transfer_created(Result<transport::TransferHandle> result) {
    if (result.is_error()) {
        fail(result.error());
        return;
    }

    const auto handle = result.value();
    machine_.set_handle(handle);
    events_.emit(events::TransferCreatedEvent{info().name, handle});

    metadata::RecordPatch patch;
    patch.name(info().name)
        .date(metadata::format_timestamp(info().started_at))
        .batch_id(context_.batch_id)
        .reference(std::nullopt)
        .size(total_bytes_);
    if (archive_) {
        const auto& manifest = archive_->manifest();
        std::optional<std::string> entry_point;
        if (manifest.has_entry_point) {
            entry_point = archive::kEntryPointName;
        }
        patch.directory(manifest.files, entry_point);
    }

    if (auto stored = store_.put(handle, patch); stored.is_error()) {
        fail(stored.error());
        return;
    }

    send_payload();
}

// ──────────────────────────────────────────────────────────
// Transferring
// ──────────────────────────────────────────────────────────

void UploadSession::send_payload() {
    transport::PayloadRequest request;
    request.body = payload_;
    request.name = info().name;
    request.batch_id = context_.batch_id;
    request.handle = *info().handle;
    if (archive_) {
        request.is_collection = true;
        if (archive_->manifest().has_entry_point) {
            request.entry_point = archive::kEntryPointName;
        }
    }

    auto moved = machine_.transition_to(SessionState::Transferring);
    if (moved.is_error()) {
        fail(moved.error());
        return;
    }

    schedule_poll();
    payload_pending_ = true;
    transport_.upload_payload(std::move(request), [self = shared_from_this()](Result<transport::ContentAddress> result) {
        self->on_payload_settled(std::move(result));
    });

    // Observers may detach from inside this notification
    publish_transition(SessionState::CreatingTransfer, SessionState::Transferring);
}

void UploadSession::on_payload_settled(Result<transport::ContentAddress> result) {
    payload_pending_ = false;
    release_payload();

    const auto handle = *info().handle;

    if (result.is_error()) {
        if (!observed()) {
            spdlog::error("Background upload of {} (tag {}) failed: {}",
                          info().name, handle, result.error().describe());
            return;
        }
        fail(result.error());
        return;
    }

    const auto& reference = result.value();
    machine_.set_reference(reference);

    if (auto stored = store_.put(handle, metadata::RecordPatch().reference(reference)); stored.is_error()) {
        if (!observed()) {
            spdlog::error("Background upload of {} stored as {} but the record could not be updated: {}",
                          info().name, reference, stored.error().describe());
            return;
        }
        fail(stored.error());
        return;
    }

    if (!observed()) {
        spdlog::info("Background upload of {} stored as {} (tag {})", info().name, reference, handle);
        return;
    }

    events_.emit(events::PayloadStoredEvent{info().name, handle, reference});
    enter(SessionState::Syncing);
}

// ──────────────────────────────────────────────────────────
// Polling
// ──────────────────────────────────────────────────────────

std::chrono::milliseconds UploadSession::current_poll_interval() const {
    return machine_.state() == SessionState::Syncing ? timings_.sync_poll_interval : timings_.poll_interval;
}

void UploadSession::schedule_poll() {
    poll_timer_.expires_after(current_poll_interval());
    poll_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        self->on_poll_tick();
    });
}

void UploadSession::on_poll_tick() {
    const auto current = machine_.state();
    if (current != SessionState::Transferring && current != SessionState::Syncing) {
        return;
    }

    if (current == SessionState::Syncing && ++sync_ticks_used_ > timings_.sync_wait_ticks) {
        complete(false);
        return;
    }

    // One status request at a time; a slow node just costs us ticks
    if (!poll_in_flight_) {
        poll_in_flight_ = true;
        transport_.fetch_status(*info().handle, [self = shared_from_this()](Result<transport::TransferStatus> result) {
            self->on_status(std::move(result));
        });
    }

    schedule_poll();
}

void UploadSession::on_status(Result<transport::TransferStatus> result) {
    poll_in_flight_ = false;

    const auto current = machine_.state();
    if (current != SessionState::Transferring && current != SessionState::Syncing) {
        return;
    }

    if (result.is_error()) {
        spdlog::debug("Status poll for tag {} failed: {}", info().handle.value_or(0), result.error().describe());
        return;
    }

    reconciler_.update(result.value());
    publish_progress();

    if (machine_.state() == SessionState::Syncing && result.value().fully_synced()) {
        complete(true);
    }
}

// ──────────────────────────────────────────────────────────
// Transitions
// ──────────────────────────────────────────────────────────

void UploadSession::enter(SessionState next) {
    const auto previous = machine_.state();
    auto moved = machine_.transition_to(next);
    if (moved.is_error()) {
        fail(moved.error());
        return;
    }
    publish_transition(previous, next);
}

void UploadSession::complete(bool synced) {
    const auto previous = machine_.state();
    poll_timer_.cancel();

    if (auto moved = machine_.mark_completed(synced); moved.is_error()) {
        spdlog::error("Upload of {} could not complete: {}", info().name, moved.error().describe());
        return;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    spdlog::info("Upload of {} {} -> {}", info().name, synced ? "synced" : "stored (still syncing)",
                 info().reference.value_or(""));

    publish_transition(previous, SessionState::Completed);
    events_.emit(events::SessionCompletedEvent{
        info().name, *info().handle, info().reference.value_or(""), synced, elapsed});
}

void UploadSession::fail(Error error) {
    const auto previous = machine_.state();
    poll_timer_.cancel();
    release_payload();

    if (auto moved = machine_.mark_failed(error); moved.is_error()) {
        spdlog::error("Upload of {} failed in state {}: {}", info().name, to_string(previous), error.describe());
        return;
    }

    spdlog::error("Upload of {} failed: {}", info().name, error.describe());
    publish_transition(previous, SessionState::Failed);
    events_.emit(events::SessionFailedEvent{info().name, info().handle, std::move(error)});
}

void UploadSession::publish_transition(SessionState from, SessionState to) {
    if (!observed()) {
        return;
    }
    events_.emit(events::StateChangedEvent{info().name, from, to});
    // A handler above may have detached
    if (observed()) {
        publish_progress();
    }
}

void UploadSession::publish_progress() {
    if (!observed()) {
        return;
    }
    events_.emit(events::ProgressUpdatedEvent{info().name, info().handle, reconciler_.current()});
}

void UploadSession::release_payload() {
    payload_.reset();
    archive_.reset();
}

} // namespace swc::upload
