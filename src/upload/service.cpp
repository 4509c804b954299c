#include "swc/upload/service.hpp"

#include "swc/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace swc::upload {
namespace fs = std::filesystem;

namespace {

// Accumulates pages of the node's transfer list
struct ListWalk {
    std::vector<transport::TransferStatus> collected;
    std::size_t offset = 0;
    std::function<void(Result<std::vector<transport::TransferStatus>>)> done;
};

void fetch_pages(transport::TransportClient& transport, std::shared_ptr<ListWalk> walk) {
    transport.list_transfers(UploadService::kListPageSize, walk->offset,
        [&transport, walk](Result<std::vector<transport::TransferStatus>> page) {
            if (page.is_error()) {
                walk->done(Err<std::vector<transport::TransferStatus>>(page.error()));
                return;
            }
            auto& tags = page.value();
            const auto count = tags.size();
            walk->collected.insert(walk->collected.end(), tags.begin(), tags.end());
            if (count < UploadService::kListPageSize) {
                walk->done(Ok(std::move(walk->collected)));
                return;
            }
            walk->offset += UploadService::kListPageSize;
            fetch_pages(transport, walk);
        });
}

} // namespace

UploadService::UploadService(boost::asio::io_context& io_context, transport::TransportClient& transport,
                             Config config)
    : io_context_(io_context),
      transport_(transport),
      config_(std::move(config)),
      store_(config_.uploads_db_path()),
      packager_(config_.archive_dir) {
    std::error_code ec;
    current_dir_ = fs::current_path(ec);
}

std::shared_ptr<UploadSession> UploadService::start_file_upload(const fs::path& path) {
    return start_upload(path, UploadKind::File);
}

std::shared_ptr<UploadSession> UploadService::start_directory_upload(const fs::path& path) {
    return start_upload(path, UploadKind::Directory);
}

std::shared_ptr<UploadSession> UploadService::start_upload(const fs::path& path, UploadKind kind) {
    auto session = std::make_shared<UploadSession>(
        io_context_, transport_, store_, packager_,
        UploadContext{config_.batch_id, current_dir_},
        UploadTarget{path, kind},
        SessionTimings::from_config(config_));
    session->start();
    return session;
}

void UploadService::list_known_transfers(KnownTransfersCallback done) {
    auto walk = std::make_shared<ListWalk>();
    walk->done = [this, done = std::move(done)](Result<std::vector<transport::TransferStatus>> result) {
        if (result.is_error()) {
            done(Err<std::vector<KnownTransfer>>(result.error()));
            return;
        }

        std::map<transport::TransferHandle, metadata::UploadRecord> records;
        auto listed = store_.list();
        if (listed.is_ok()) {
            records = std::move(listed.value());
        } else {
            spdlog::warn("Listing transfers without local records: {}", listed.error().describe());
        }

        auto& tags = result.value();
        std::sort(tags.begin(), tags.end(),
                  [](const transport::TransferStatus& a, const transport::TransferStatus& b) { return a.uid > b.uid; });

        std::vector<KnownTransfer> known;
        known.reserve(tags.size());
        for (const auto& tag : tags) {
            KnownTransfer entry{tag, std::nullopt};
            if (auto it = records.find(tag.uid); it != records.end()) {
                entry.record = it->second;
            }
            known.push_back(std::move(entry));
        }
        done(Ok(std::move(known)));
    };
    fetch_pages(transport_, walk);
}

Result<std::optional<metadata::UploadRecord>> UploadService::get_record(transport::TransferHandle handle) const {
    return store_.get(handle);
}

Result<archive::DirectoryManifest> UploadService::preview(const fs::path& path) const {
    return packager_.scan(path.is_absolute() ? path : current_dir_ / path);
}

Result<void> UploadService::set_batch_id(const std::string& batch_id) {
    if (batch_id.empty()) {
        return Err<void>(ErrorKind::PreconditionFailed, "Batch id must not be empty");
    }
    const auto previous = config_.batch_id;
    config_.batch_id = batch_id;
    auto saved = save_config(config_);
    if (saved.is_error()) {
        config_.batch_id = previous;
        return saved;
    }
    spdlog::info("Postage batch id set to {}", batch_id);
    return Ok();
}

// ──────────────────────────────────────────────────────────
// TransferListMonitor
// ──────────────────────────────────────────────────────────

TransferListMonitor::TransferListMonitor(boost::asio::io_context& io_context, UploadService& service,
                                         std::chrono::milliseconds interval)
    : service_(service), interval_(interval), timer_(io_context) {}

void TransferListMonitor::start() {
    if (running_) {
        return;
    }
    running_ = true;
    refresh();
}

void TransferListMonitor::stop() {
    running_ = false;
    timer_.cancel();
}

void TransferListMonitor::refresh() {
    service_.list_known_transfers([self = shared_from_this()](Result<std::vector<KnownTransfer>> result) {
        self->on_listed(std::move(result));
    });
}

void TransferListMonitor::on_listed(Result<std::vector<KnownTransfer>> result) {
    if (!running_) {
        return;
    }

    if (result.is_error()) {
        const auto& error = result.error();
        if (error.kind == ErrorKind::Unreachable) {
            if (reachable_) {
                reachable_ = false;
                events_.emit(events::NodeUnreachableEvent{error});
            }
        } else {
            spdlog::warn("Transfer list refresh failed: {}", error.describe());
        }
        schedule();
        return;
    }

    if (!reachable_) {
        reachable_ = true;
        events_.emit(events::NodeReachableEvent{});
    }

    events::TransferListUpdatedEvent update;
    update.transfers.reserve(result.value().size());
    for (const auto& known : result.value()) {
        events::KnownTransferSummary summary;
        summary.status = known.status;
        if (known.record) {
            summary.name = known.record->name;
            summary.has_record = true;
        }
        update.transfers.push_back(std::move(summary));
    }
    events_.emit(update);
    schedule();
}

void TransferListMonitor::schedule() {
    if (!running_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !self->running_) {
            return;
        }
        self->refresh();
    });
}

} // namespace swc::upload
