#include "swc/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using swc::ErrorKind;
using swc::network::HttpMethod;
using swc::network::HttpParser;
using swc::network::HttpRequest;
using swc::network::ParseMode;
using swc::network::UrlUtils;

namespace {

swc::Result<bool> feed(HttpParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesResponseWithContentLength) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser,
        "HTTP/1.1 201 Created\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "{\"uid\":42}");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(response.reason_phrase, "Created");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"uid\":42}");
}

TEST(HttpParserTest, ResponseSplitAcrossReads) {
    HttpParser parser(ParseMode::Response);
    const std::string wire =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        auto partial = parser.parse(wire.data() + i, 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(wire.data() + wire.size() - 1, 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "hello");
}

TEST(HttpParserTest, ParsesChunkedResponse) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "4\r\n{\"re\r\n"
        "B;ext=1\r\nference\":\"a\r\n"
        "2\r\n\"}\r\n"
        "0\r\n"
        "\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "{\"reference\":\"a\"}");
}

TEST(HttpParserTest, BodyWithoutLengthRunsToEof) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial body");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(finished.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "partial body");
}

TEST(HttpParserTest, NoContentHasNoBody) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser, "HTTP/1.1 204 No Content\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
}

TEST(HttpParserTest, TruncatedMessageFailsOnFinish) {
    HttpParser parser(ParseMode::Response);
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 20\r\n\r\nshort").is_ok());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, ErrorKind::RemoteError);
}

TEST(HttpParserTest, RejectsGarbageStatusLine) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser, "HTTP/1.1 2x0 OK\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
}

TEST(HttpParserTest, OverflowingContentLengthIsRemoteError) {
    HttpParser parser(ParseMode::Response);
    swc::Result<bool> result = swc::Ok(false);
    EXPECT_NO_THROW(result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 99999999999999999999\r\n"
        "\r\n"));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
}

TEST(HttpParserTest, ContentLengthAboveCapIsRejected) {
    HttpParser parser(ParseMode::Response);
    const std::string too_big = std::to_string(HttpParser::kMaxBodySize + 1);
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: " + too_big + "\r\n\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
    // Nothing is allocated for the announced body
    EXPECT_EQ(parser.get_response().body.capacity(), 0u);
}

TEST(HttpParserTest, HugeChunkSizeIsRejected) {
    HttpParser parser(ParseMode::Response);
    auto result = feed(parser,
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "FFFFFFFFFFFFFFFFFFFF\r\n");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
}

TEST(HttpParserTest, ParsesRequestWithBinaryBody) {
    HttpParser parser(ParseMode::Request);
    std::string wire =
        "POST /bzz?name=a%20b.txt HTTP/1.1\r\n"
        "swarm-tag: 7\r\n"
        "Content-Length: 3\r\n"
        "\r\n";
    wire.push_back('\0');
    wire.push_back('\x01');
    wire.push_back('\xff');

    auto result = feed(parser, wire);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    HttpRequest request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.path(), "/bzz");
    EXPECT_EQ(request.query_param("name"), "a%20b.txt");
    EXPECT_EQ(UrlUtils::decode_component(request.query_param("name")), "a b.txt");
    EXPECT_EQ(request.get_header("Swarm-Tag"), "7");
    ASSERT_EQ(request.body.size(), 3u);
    EXPECT_EQ(request.body[2], 0xff);
}

TEST(HttpParserTest, SerializedRequestParsesBack) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = "/tags?limit=1000&offset=0";
    request.set_header("Host", "127.0.0.1:1633");

    const auto wire = request.serialize();
    HttpParser parser(ParseMode::Request);
    auto result = parser.parse(reinterpret_cast<const char*>(wire.data()), wire.size());
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_request().query_param("limit"), "1000");
    EXPECT_EQ(parser.get_request().get_header("content-length"), "0");
}

TEST(UrlUtilsTest, EncodesLikeEncodeURIComponent) {
    EXPECT_EQ(UrlUtils::encode_component("my file (1).txt"), "my%20file%20(1).txt");
    EXPECT_EQ(UrlUtils::encode_component("a/b?c=d&e"), "a%2Fb%3Fc%3Dd%26e");
    EXPECT_EQ(UrlUtils::encode_component("~keep-_.!*'"), "~keep-_.!*'");
    EXPECT_EQ(UrlUtils::encode_component("\xc3\xa9"), "%C3%A9");
}
