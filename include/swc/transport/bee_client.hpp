#pragma once

#include "swc/network/http_client.hpp"
#include "swc/transport/client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace swc::transport {

/**
 * @brief TransportClient speaking the Bee node HTTP API
 *
 *   POST /tags                         -> {"uid": N}
 *   GET  /tags/{uid}                   -> {"split", "seen", "stored", "sent", "synced", ...}
 *   GET  /tags?limit=L&offset=O        -> {"tags": [...]}
 *   POST /bzz?name=<percent-encoded>   -> {"reference": "..."}
 *        swarm-postage-batch-id, swarm-tag,
 *        swarm-collection / swarm-index-document for directory uploads
 */
class BeeClient : public TransportClient {
public:
    static constexpr const char* kBatchHeader = "swarm-postage-batch-id";
    static constexpr const char* kTagHeader = "swarm-tag";
    static constexpr const char* kCollectionHeader = "swarm-collection";
    static constexpr const char* kIndexDocumentHeader = "swarm-index-document";

    BeeClient(network::asio::io_context& io_context, std::string host, std::uint16_t port);

    void create_transfer(HandleCallback done) override;
    void fetch_status(TransferHandle handle, StatusCallback done) override;
    void list_transfers(std::size_t limit, std::size_t offset, ListCallback done) override;
    void upload_payload(PayloadRequest request, AddressCallback done) override;

private:
    using JsonCallback = std::function<void(Result<nlohmann::json>)>;

    /// Send request, map transport failures and non-2xx statuses, parse the JSON body
    void request_json(network::HttpRequest request, JsonCallback done);

    network::asio::io_context& io_context_;
    network::HttpClient http_;
};

/// Counters from one tag object; absent counters read as 0
TransferStatus status_from_json(const nlohmann::json& j);

} // namespace swc::transport
