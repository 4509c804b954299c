#pragma once

#include "http_parser.hpp"
#include "http_types.hpp"
#include "swc/core/result.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace swc {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using ResponseHandler = std::function<void(Result<HttpResponse>)>;

/**
 * @brief One request/response round trip on its own connection
 *
 * Lifecycle:
 * 1. Created by HttpClient::async_send
 * 2. resolve -> connect -> write -> read until the parser completes
 * 3. Handler invoked exactly once, then the exchange is released
 *
 * Uses enable_shared_from_this so pending async operations keep it alive.
 * Connection-level failures are reported as ErrorKind::Unreachable; a
 * response the parser rejects is ErrorKind::RemoteError. Non-2xx statuses
 * are NOT errors at this layer.
 */
class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    HttpExchange(asio::io_context& io_context, HttpRequest request, ResponseHandler handler);

    void start(const std::string& host, uint16_t port);

private:
    void do_connect(const tcp::resolver::results_type& endpoints);
    void do_write();
    void do_read();
    void complete(Result<HttpResponse> result);

    tcp::resolver resolver_;
    tcp::socket socket_;
    std::vector<uint8_t> wire_;              // Serialised request, alive until written
    HttpParser parser_;
    ResponseHandler handler_;
    std::array<char, 8192> buffer_;
    bool completed_ = false;
};

/**
 * @brief Asynchronous HTTP/1.1 client for one fixed endpoint
 *
 * Every request opens a fresh connection with "Connection: close"; the
 * node is local, so there is nothing to gain from pooling. Handlers run on
 * the io_context thread.
 *
 * ```cpp
 * asio::io_context io;
 * HttpClient client(io, "127.0.0.1", 1633);
 * HttpRequest req;
 * req.method = HttpMethod::GET;
 * req.url = "/tags/1";
 * client.async_send(std::move(req), [](Result<HttpResponse> r) { ... });
 * io.run();
 * ```
 */
class HttpClient {
public:
    HttpClient(asio::io_context& io_context, std::string host, uint16_t port);

    void async_send(HttpRequest request, ResponseHandler handler);

private:
    asio::io_context& io_context_;
    std::string host_;
    uint16_t port_;
};

} // namespace network
} // namespace swc
