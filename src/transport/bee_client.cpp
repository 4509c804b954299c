#include "swc/transport/bee_client.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

namespace swc::transport {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

std::uint64_t counter(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    const auto value = it->get<std::int64_t>();
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

std::string summarize_body(const HttpResponse& response) {
    std::string text = response.body_as_string();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    if (text.size() > 200) {
        text = text.substr(0, 200) + "...";
    }
    return text;
}

} // namespace

TransferStatus status_from_json(const json& j) {
    TransferStatus status;
    status.uid = counter(j, "uid");
    status.split = counter(j, "split");
    status.seen = counter(j, "seen");
    status.stored = counter(j, "stored");
    status.sent = counter(j, "sent");
    status.synced = counter(j, "synced");
    return status;
}

BeeClient::BeeClient(network::asio::io_context& io_context, std::string host, std::uint16_t port)
    : io_context_(io_context), http_(io_context, std::move(host), port) {}

void BeeClient::request_json(HttpRequest request, JsonCallback done) {
    http_.async_send(std::move(request), [done = std::move(done)](Result<HttpResponse> result) {
        if (result.is_error()) {
            done(Err<json>(result.error()));
            return;
        }

        const HttpResponse& response = result.value();
        if (!response.is_success()) {
            const auto kind = response.status_code == static_cast<int>(HttpStatus::PAYMENT_REQUIRED)
                                  ? ErrorKind::PreconditionFailed
                                  : ErrorKind::RemoteError;
            done(Err<json>(kind, "HTTP " + std::to_string(response.status_code) + ": " +
                                     summarize_body(response)));
            return;
        }

        if (response.body.empty()) {
            done(Ok(json::object()));
            return;
        }

        json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
        if (body.is_discarded()) {
            done(Err<json>(ErrorKind::RemoteError, "Malformed JSON from node: " + summarize_body(response)));
            return;
        }
        done(Ok(std::move(body)));
    });
}

void BeeClient::create_transfer(HandleCallback done) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/tags";
    request.set_header("Content-Type", "application/json");

    request_json(std::move(request), [done = std::move(done)](Result<json> result) {
        if (result.is_error()) {
            done(Err<TransferHandle>(result.error()));
            return;
        }
        const json& body = result.value();
        auto uid = body.find("uid");
        if (uid == body.end() || !uid->is_number_unsigned()) {
            done(Err<TransferHandle>(ErrorKind::RemoteError, "Node reply has no tag uid: " + body.dump()));
            return;
        }
        const auto handle = uid->get<TransferHandle>();
        spdlog::debug("Created tag {}", handle);
        done(Ok(handle));
    });
}

void BeeClient::fetch_status(TransferHandle handle, StatusCallback done) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/tags/" + std::to_string(handle);

    request_json(std::move(request), [handle, done = std::move(done)](Result<json> result) {
        if (result.is_error()) {
            done(Err<TransferStatus>(result.error()));
            return;
        }
        TransferStatus status = status_from_json(result.value());
        if (status.uid == 0) {
            status.uid = handle;
        }
        done(Ok(status));
    });
}

void BeeClient::list_transfers(std::size_t limit, std::size_t offset, ListCallback done) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/tags?limit=" + std::to_string(limit) + "&offset=" + std::to_string(offset);

    request_json(std::move(request), [done = std::move(done)](Result<json> result) {
        if (result.is_error()) {
            done(Err<std::vector<TransferStatus>>(result.error()));
            return;
        }
        std::vector<TransferStatus> page;
        const json& body = result.value();
        auto tags = body.find("tags");
        if (tags != body.end() && tags->is_array()) {
            for (const auto& tag : *tags) {
                if (tag.is_object()) {
                    page.push_back(status_from_json(tag));
                }
            }
        }
        done(Ok(std::move(page)));
    });
}

void BeeClient::upload_payload(PayloadRequest payload, AddressCallback done) {
    if (payload.batch_id.empty()) {
        // Keep the callback asynchronous even when nothing is sent
        boost::asio::post(io_context_, [done = std::move(done)]() {
            done(Err<ContentAddress>(ErrorKind::PreconditionFailed, "Postage batch id is not set"));
        });
        return;
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/bzz?name=" + network::UrlUtils::encode_component(payload.name);
    request.set_header("Content-Type", payload.is_collection ? "application/x-tar" : "application/octet-stream");
    request.set_header(kBatchHeader, payload.batch_id);
    request.set_header(kTagHeader, std::to_string(payload.handle));
    if (payload.is_collection) {
        request.set_header(kCollectionHeader, "true");
        if (payload.entry_point) {
            request.set_header(kIndexDocumentHeader, *payload.entry_point);
        }
    }
    if (payload.body) {
        request.body = *payload.body;
    }

    spdlog::info("Uploading {} ({} bytes) with tag {}", payload.name, request.body.size(), payload.handle);

    request_json(std::move(request), [done = std::move(done)](Result<json> result) {
        if (result.is_error()) {
            done(Err<ContentAddress>(result.error()));
            return;
        }
        const json& body = result.value();
        auto reference = body.find("reference");
        if (reference == body.end() || !reference->is_string()) {
            done(Err<ContentAddress>(ErrorKind::RemoteError, "Node reply has no reference: " + body.dump()));
            return;
        }
        done(Ok(reference->get<ContentAddress>()));
    });
}

} // namespace swc::transport
