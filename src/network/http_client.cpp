#include "swc/network/http_client.hpp"

#include <spdlog/spdlog.h>

namespace swc {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpExchange Implementation
// ──────────────────────────────────────────────────────────

HttpExchange::HttpExchange(asio::io_context& io_context, HttpRequest request, ResponseHandler handler)
    : resolver_(io_context)
    , socket_(io_context)
    , wire_(request.serialize())
    , parser_(ParseMode::Response)
    , handler_(std::move(handler)) {
}

void HttpExchange::start(const std::string& host, uint16_t port) {
    auto self = shared_from_this();

    resolver_.async_resolve(
        host, std::to_string(port),
        [this, self, host](boost::system::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                complete(Err<HttpResponse>(ErrorKind::Unreachable,
                                           "Cannot resolve " + host + ": " + ec.message()));
                return;
            }
            do_connect(results);
        }
    );
}

void HttpExchange::do_connect(const tcp::resolver::results_type& endpoints) {
    auto self = shared_from_this();

    asio::async_connect(
        socket_, endpoints,
        [this, self](boost::system::error_code ec, const tcp::endpoint& endpoint) {
            if (ec) {
                complete(Err<HttpResponse>(ErrorKind::Unreachable,
                                           "Cannot connect to node: " + ec.message()));
                return;
            }
            spdlog::debug("Connected to {}:{}", endpoint.address().to_string(), endpoint.port());
            do_write();
        }
    );
}

void HttpExchange::do_write() {
    auto self = shared_from_this();

    asio::async_write(
        socket_,
        asio::buffer(wire_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                complete(Err<HttpResponse>(ErrorKind::Unreachable,
                                           "Failed to send request: " + ec.message()));
                return;
            }
            spdlog::debug("Sent {} bytes", bytes_transferred);

            // The payload may be large; drop our copy as soon as it is on the wire
            std::vector<uint8_t>().swap(wire_);
            do_read();
        }
    );
}

void HttpExchange::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
                if (parse_result.is_error()) {
                    complete(Err<HttpResponse>(parse_result.error()));
                    return;
                }
                if (parse_result.value()) {
                    complete(Ok(parser_.get_response()));
                    return;
                }
                do_read();
                return;
            }

            if (ec == asio::error::eof) {
                auto finished = parser_.finish();
                if (finished.is_error()) {
                    complete(Err<HttpResponse>(finished.error()));
                    return;
                }
                complete(Ok(parser_.get_response()));
                return;
            }

            complete(Err<HttpResponse>(ErrorKind::Unreachable,
                                       "Failed to read response: " + ec.message()));
        }
    );
}

void HttpExchange::complete(Result<HttpResponse> result) {
    if (completed_) {
        return;
    }
    completed_ = true;

    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    auto handler = std::move(handler_);
    handler(std::move(result));
}

// ──────────────────────────────────────────────────────────
// HttpClient Implementation
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(asio::io_context& io_context, std::string host, uint16_t port)
    : io_context_(io_context)
    , host_(std::move(host))
    , port_(port) {
}

void HttpClient::async_send(HttpRequest request, ResponseHandler handler) {
    request.set_header("Host", host_ + ":" + std::to_string(port_));
    request.set_header("Connection", "close");

    spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), request.url);

    std::make_shared<HttpExchange>(io_context_, std::move(request), std::move(handler))
        ->start(host_, port_);
}

} // namespace network
} // namespace swc
