/**
 * @file events.hpp
 * @brief Event types published by upload sessions and the transfer monitor
 *
 * NAMING CONVENTION:
 * Events are past-tense: TransferCreatedEvent, SessionFailedEvent.
 */

#pragma once

#include "swc/core/result.hpp"
#include "swc/transport/types.hpp"
#include "swc/upload/progress.hpp"
#include "swc/upload/state.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace swc::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every non-Detached state transition
 *
 * WHO SUBSCRIBES:
 * - Front ends (switch the status line)
 * - LoggerComponent
 */
struct StateChangedEvent {
    std::string name;
    upload::SessionState from;
    upload::SessionState to;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted once per successful status poll, and again on each transition
 */
struct ProgressUpdatedEvent {
    std::string name;
    std::optional<transport::TransferHandle> handle;
    upload::ProgressSnapshot progress;
};

struct TransferCreatedEvent {
    std::string name;
    transport::TransferHandle handle;
};

/**
 * @brief Payload call returned a content address
 */
struct PayloadStoredEvent {
    std::string name;
    transport::TransferHandle handle;
    transport::ContentAddress reference;
};

/**
 * @brief Terminal success
 *
 * synced == false is the soft success: stored on the node, still
 * propagating when the sync wait ran out.
 */
struct SessionCompletedEvent {
    std::string name;
    transport::TransferHandle handle;
    transport::ContentAddress reference;
    bool synced;
    std::chrono::milliseconds duration;
};

struct SessionFailedEvent {
    std::string name;
    std::optional<transport::TransferHandle> handle;
    Error error;
};

// ════════════════════════════════════════════════════════
// Transfer List Events
// ════════════════════════════════════════════════════════

/**
 * @brief First failed refresh after a good one (show the banner)
 */
struct NodeUnreachableEvent {
    Error error;
};

/// First good refresh after a failed one (clear the banner)
struct NodeReachableEvent {};

struct KnownTransferSummary {
    transport::TransferStatus status;
    std::string name;      ///< Local record name, empty when unknown
    bool has_record = false;
};

struct TransferListUpdatedEvent {
    std::vector<KnownTransferSummary> transfers;   ///< Newest first
};

} // namespace swc::events
