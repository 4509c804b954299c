#include "swc/upload/progress.hpp"

#include <algorithm>
#include <cmath>

namespace swc::upload {

ProgressSnapshot reconcile(const transport::TransferStatus& status, std::uint64_t total_bytes) {
    ProgressSnapshot snapshot;
    snapshot.total_bytes = total_bytes;
    snapshot.split = status.split;
    snapshot.seen = status.seen;
    snapshot.sent = status.sent;
    snapshot.synced = status.synced;

    if (status.split == 0) {
        return snapshot;
    }

    if (status.synced >= status.split) {
        snapshot.phase = Phase::Synced;
        snapshot.percent = 100.0;
        snapshot.bytes = total_bytes;
        return snapshot;
    }

    const auto progress = std::max({status.seen, status.sent, status.synced});
    const double fraction = std::min(1.0, static_cast<double>(progress) / static_cast<double>(status.split));

    if (status.sent > 0) {
        snapshot.phase = Phase::Syncing;
    } else if (status.seen > 0) {
        snapshot.phase = Phase::Uploading;
    } else {
        // Chunked but nothing pushed yet
        return snapshot;
    }

    snapshot.percent = fraction * 100.0;
    snapshot.bytes = static_cast<std::uint64_t>(std::llround(fraction * static_cast<double>(total_bytes)));
    return snapshot;
}

const char* phase_label(Phase phase) {
    switch (phase) {
        case Phase::Processing: return "processing";
        case Phase::Uploading: return "uploading";
        case Phase::Syncing: return "syncing";
        case Phase::Synced: return "synced with network";
    }
    return "unknown";
}

std::string describe(const ProgressSnapshot& snapshot) {
    std::string text = phase_label(snapshot.phase);
    switch (snapshot.phase) {
        case Phase::Processing:
            if (snapshot.split > 0) {
                text += " (" + std::to_string(snapshot.split) + " chunks)";
            }
            break;
        case Phase::Uploading:
            text += " (" + std::to_string(snapshot.seen) + "/" + std::to_string(snapshot.split) + " chunks)";
            break;
        case Phase::Syncing:
            text += " (" + std::to_string(snapshot.synced) + "/" + std::to_string(snapshot.split) + " chunks)";
            break;
        case Phase::Synced:
            break;
    }
    return text;
}

const ProgressSnapshot& ProgressReconciler::update(const transport::TransferStatus& status) {
    ProgressSnapshot next = reconcile(status, total_bytes_);
    if (has_update_) {
        if (next.phase < current_.phase) {
            next.phase = current_.phase;
        }
        if (next.percent < current_.percent) {
            next.percent = current_.percent;
            next.bytes = current_.bytes;
        }
    }
    current_ = next;
    has_update_ = true;
    return current_;
}

} // namespace swc::upload
