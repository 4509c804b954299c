#pragma once

#include "swc/core/result.hpp"
#include "swc/transport/types.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace swc::transport {

/**
 * @brief The remote operations the upload engine needs
 *
 * All calls are asynchronous: they return immediately and invoke the
 * callback exactly once on the event loop thread. Implementations never
 * throw; failures arrive as Error with kind Unreachable, RemoteError or
 * PreconditionFailed.
 */
class TransportClient {
public:
    using HandleCallback = std::function<void(Result<TransferHandle>)>;
    using StatusCallback = std::function<void(Result<TransferStatus>)>;
    using ListCallback = std::function<void(Result<std::vector<TransferStatus>>)>;
    using AddressCallback = std::function<void(Result<ContentAddress>)>;

    virtual ~TransportClient() = default;

    virtual void create_transfer(HandleCallback done) = 0;

    virtual void fetch_status(TransferHandle handle, StatusCallback done) = 0;

    /// One page of the node's transfer list
    virtual void list_transfers(std::size_t limit, std::size_t offset, ListCallback done) = 0;

    /**
     * @brief Send the whole payload in one request
     *
     * Reports no incremental progress; progress comes from fetch_status.
     */
    virtual void upload_payload(PayloadRequest request, AddressCallback done) = 0;
};

} // namespace swc::transport
