#pragma once

#include "swc/transport/types.hpp"

#include <cstdint>
#include <string>

namespace swc::upload {

/// Reconciled phase, ordered from least to most advanced
enum class Phase {
    Processing,
    Uploading,
    Syncing,
    Synced
};

/// Percent shown while the node has not produced usable counters yet
inline constexpr double kPlaceholderPercent = 5.0;

struct ProgressSnapshot {
    Phase phase = Phase::Processing;
    double percent = kPlaceholderPercent;   ///< 0..100
    std::uint64_t bytes = 0;                ///< Estimated bytes transferred
    std::uint64_t total_bytes = 0;
    std::uint64_t split = 0;
    std::uint64_t seen = 0;
    std::uint64_t sent = 0;
    std::uint64_t synced = 0;
};

/**
 * @brief Collapse raw propagation counters into one progress signal
 *
 * The most advanced counter wins: progress = max(seen, sent, synced).
 * A status with split == 0, or with split > 0 but every counter still
 * at 0, reads as Processing at the placeholder percent.
 */
ProgressSnapshot reconcile(const transport::TransferStatus& status, std::uint64_t total_bytes);

const char* phase_label(Phase phase);

/// e.g. "syncing (12/40 chunks)"
std::string describe(const ProgressSnapshot& snapshot);

/**
 * @brief Per-session reconciler that never moves backwards
 *
 * The node may report counters out of order between polls. The displayed
 * phase and percent only ever advance.
 */
class ProgressReconciler {
public:
    explicit ProgressReconciler(std::uint64_t total_bytes) : total_bytes_(total_bytes) {}

    const ProgressSnapshot& update(const transport::TransferStatus& status);

    const ProgressSnapshot& current() const noexcept { return current_; }
    bool has_update() const noexcept { return has_update_; }

private:
    std::uint64_t total_bytes_;
    ProgressSnapshot current_;
    bool has_update_ = false;
};

} // namespace swc::upload
