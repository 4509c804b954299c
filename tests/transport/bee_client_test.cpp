#include "swc/transport/bee_client.hpp"

#include "support/stub_node.hpp"

#include <gtest/gtest.h>

#include <optional>

using swc::ErrorKind;
using swc::Result;
using swc::network::HttpMethod;
using swc::network::HttpRequest;
using swc::network::HttpResponse;
using swc::network::HttpStatus;
using swc::test_support::json_response;
using swc::test_support::run_until;
using swc::test_support::StubNode;
using swc::transport::BeeClient;
using swc::transport::ContentAddress;
using swc::transport::PayloadRequest;
using swc::transport::TransferHandle;
using swc::transport::TransferStatus;

namespace {

class BeeClientTest : public ::testing::Test {
protected:
    boost::asio::io_context io;
    StubNode node{io};
    BeeClient client{io, "127.0.0.1", node.port()};
};

PayloadRequest payload(const std::string& body, bool collection = false) {
    PayloadRequest request;
    request.body = std::make_shared<const std::vector<std::uint8_t>>(body.begin(), body.end());
    request.name = "my file.txt";
    request.batch_id = "batch-1";
    request.handle = 42;
    request.is_collection = collection;
    return request;
}

} // namespace

TEST_F(BeeClientTest, CreateTransferPostsTags) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::CREATED, R"({"uid":42,"startedAt":"2024-01-01T00:00:00Z"})");
    });

    std::optional<Result<TransferHandle>> result;
    client.create_transfer([&](Result<TransferHandle> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_ok());
    EXPECT_EQ(result->value(), 42u);
    ASSERT_EQ(node.received().size(), 1u);
    EXPECT_EQ(node.received()[0].method, HttpMethod::POST);
    EXPECT_EQ(node.received()[0].path(), "/tags");
}

TEST_F(BeeClientTest, FetchStatusReadsCountersAndDefaultsMissingOnes) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::OK, R"({"uid":7,"split":10,"seen":4,"sent":2})");
    });

    std::optional<Result<TransferStatus>> result;
    client.fetch_status(7, [&](Result<TransferStatus> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_ok());
    EXPECT_EQ(result->value().uid, 7u);
    EXPECT_EQ(result->value().split, 10u);
    EXPECT_EQ(result->value().seen, 4u);
    EXPECT_EQ(result->value().sent, 2u);
    EXPECT_EQ(result->value().synced, 0u);
    EXPECT_EQ(result->value().stored, 0u);
    EXPECT_EQ(node.received()[0].url, "/tags/7");
}

TEST_F(BeeClientTest, ListTransfersSendsPagingParameters) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::OK, R"({"tags":[{"uid":1,"split":3,"synced":3},{"uid":2}]})");
    });

    std::optional<Result<std::vector<TransferStatus>>> result;
    client.list_transfers(1000, 2000, [&](Result<std::vector<TransferStatus>> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_ok());
    ASSERT_EQ(result->value().size(), 2u);
    EXPECT_TRUE(result->value()[0].fully_synced());
    EXPECT_EQ(result->value()[1].uid, 2u);
    EXPECT_EQ(node.received()[0].query_param("limit"), "1000");
    EXPECT_EQ(node.received()[0].query_param("offset"), "2000");
}

TEST_F(BeeClientTest, UploadFileSendsHeadersAndBody) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::CREATED, R"({"reference":"abcd1234"})");
    });

    std::optional<Result<ContentAddress>> result;
    client.upload_payload(payload("0123456789"), [&](Result<ContentAddress> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_ok());
    EXPECT_EQ(result->value(), "abcd1234");

    const auto& request = node.received().at(0);
    EXPECT_EQ(request.url, "/bzz?name=my%20file.txt");
    EXPECT_EQ(request.get_header("Content-Type"), "application/octet-stream");
    EXPECT_EQ(request.get_header("swarm-postage-batch-id"), "batch-1");
    EXPECT_EQ(request.get_header("swarm-tag"), "42");
    EXPECT_FALSE(request.has_header("swarm-collection"));
    EXPECT_EQ(request.body_as_string(), "0123456789");
}

TEST_F(BeeClientTest, UploadCollectionMarksEntryPoint) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::CREATED, R"({"reference":"ff00"})");
    });

    auto request = payload("tar bytes", true);
    request.entry_point = "index.html";

    std::optional<Result<ContentAddress>> result;
    client.upload_payload(request, [&](Result<ContentAddress> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_ok());

    const auto& sent = node.received().at(0);
    EXPECT_EQ(sent.get_header("Content-Type"), "application/x-tar");
    EXPECT_EQ(sent.get_header("swarm-collection"), "true");
    EXPECT_EQ(sent.get_header("swarm-index-document"), "index.html");
}

TEST_F(BeeClientTest, EmptyBatchIdFailsWithoutNetworkCall) {
    auto request = payload("x");
    request.batch_id.clear();

    std::optional<Result<ContentAddress>> result;
    client.upload_payload(request, [&](Result<ContentAddress> r) { result = std::move(r); });

    // The callback is never invoked inline
    EXPECT_FALSE(result.has_value());
    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().kind, ErrorKind::PreconditionFailed);
    EXPECT_TRUE(node.received().empty());
}

TEST_F(BeeClientTest, PaymentRequiredIsPreconditionFailure) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::PAYMENT_REQUIRED, R"({"message":"batch not usable"})");
    });

    std::optional<Result<ContentAddress>> result;
    client.upload_payload(payload("x"), [&](Result<ContentAddress> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().kind, ErrorKind::PreconditionFailed);
    EXPECT_NE(result->error().message.find("402"), std::string::npos);
}

TEST_F(BeeClientTest, ServerErrorIsRemoteError) {
    node.set_handler([](const HttpRequest&) {
        return json_response(HttpStatus::INTERNAL_SERVER_ERROR, R"({"message":"boom"})");
    });

    std::optional<Result<TransferHandle>> result;
    client.create_transfer([&](Result<TransferHandle> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().kind, ErrorKind::RemoteError);
    EXPECT_NE(result->error().message.find("boom"), std::string::npos);
}

TEST_F(BeeClientTest, MalformedReplyIsRemoteError) {
    node.set_handler([](const HttpRequest&) {
        HttpResponse response(HttpStatus::OK);
        response.set_body("<html>not json</html>");
        return response;
    });

    std::optional<Result<TransferHandle>> result;
    client.create_transfer([&](Result<TransferHandle> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().kind, ErrorKind::RemoteError);
}

TEST(BeeClientUnreachableTest, ClosedPortIsUnreachable) {
    boost::asio::io_context io;
    BeeClient client(io, "127.0.0.1", swc::test_support::closed_port());

    std::optional<Result<TransferStatus>> result;
    client.fetch_status(1, [&](Result<TransferStatus> r) { result = std::move(r); });

    ASSERT_TRUE(run_until(io, [&] { return result.has_value(); }));
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().kind, ErrorKind::Unreachable);
}
