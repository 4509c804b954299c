#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swc::transport {

/// Identifier the node issues for one upload's chunk tracking (a Bee tag uid)
using TransferHandle = std::uint64_t;

/// Content address returned for stored payloads (hex Swarm reference)
using ContentAddress = std::string;

/**
 * @brief Point-in-time propagation counters of one transfer
 *
 * Counters are nominally bounded by split and ordered
 * seen -> sent -> synced, but the node does not guarantee either.
 */
struct TransferStatus {
    TransferHandle uid = 0;
    std::uint64_t split = 0;   ///< Total chunk count, 0 until chunking is done
    std::uint64_t seen = 0;
    std::uint64_t stored = 0;
    std::uint64_t sent = 0;
    std::uint64_t synced = 0;

    bool fully_synced() const noexcept { return split > 0 && synced >= split; }
};

/**
 * @brief Everything the payload upload call needs
 *
 * body is shared so the caller can keep (or drop) its own reference while
 * the request is in flight.
 */
struct PayloadRequest {
    std::shared_ptr<const std::vector<std::uint8_t>> body;
    std::string name;
    std::string batch_id;
    TransferHandle handle = 0;
    bool is_collection = false;
    std::optional<std::string> entry_point;
};

} // namespace swc::transport
