#pragma once

#include "http_types.hpp"
#include "swc/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace swc {
namespace network {

/**
 * @brief Which start line the parser expects
 *
 * The client parses responses from the node; the stub node in the tests
 * parses requests. Everything after the start line is shared.
 */
enum class ParseMode {
    Request,
    Response
};

/**
 * @brief State machine states for HTTP message parsing
 *
 * Request:   METHOD SP URL SP VERSION CRLF
 * Response:  VERSION SP STATUS_CODE SP REASON CRLF
 * Then:      Header-Name: Header-Value CRLF ... CRLF [body]
 *
 * The body is either Content-Length bytes, a chunked transfer coding, or
 * (responses only) everything up to connection close.
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    STATUS_VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_EOF,
    COMPLETE,
    PARSE_ERROR      // Renamed to avoid Windows macro conflict
};

/**
 * @brief Incremental HTTP/1.x parser
 *
 * Feed it whatever the socket delivered; it keeps its position between
 * calls, so a message may arrive in any number of pieces.
 *
 * ```cpp
 * HttpParser parser(ParseMode::Response);
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_ok() && result.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpParser {
public:
    /// Largest body accepted, whatever the headers announce
    static constexpr size_t kMaxBodySize = size_t(1) << 30;

    explicit HttpParser(ParseMode mode = ParseMode::Request) : mode_(mode) { reset(); }

    /**
     * @brief Parse incoming data
     * @return true once a full message has been parsed, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return fail("Parser in error state");
            }

            // Bulk-copy body bytes instead of walking them one at a time
            if (state_ == ParseState::BODY || state_ == ParseState::CHUNK_DATA) {
                const size_t take = std::min(remaining_, len - i);
                if (take > kMaxBodySize - body().size()) {
                    return body_too_large();
                }
                body().insert(body().end(), data + i, data + i + take);
                remaining_ -= take;
                i += take;
                if (remaining_ == 0) {
                    state_ = state_ == ParseState::BODY ? ParseState::COMPLETE : ParseState::CHUNK_DATA_END;
                }
                continue;
            }
            if (state_ == ParseState::BODY_UNTIL_EOF) {
                if (len - i > kMaxBodySize - body().size()) {
                    return body_too_large();
                }
                body().insert(body().end(), data + i, data + len);
                i = len;
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_request_version(c); break;
                case ParseState::STATUS_VERSION: ok = parse_status_version(c); break;
                case ParseState::STATUS_CODE: ok = parse_status_code(c); break;
                case ParseState::REASON: ok = parse_reason(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
                case ParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
                case ParseState::CHUNK_TRAILER: ok = parse_chunk_trailer(c); break;
                default: break;
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return fail("Malformed HTTP message at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Tell the parser the peer closed the connection
     *
     * Completes a response whose body runs to end-of-stream; anything else
     * left unfinished is an error.
     */
    Result<bool> finish() {
        if (state_ == ParseState::BODY_UNTIL_EOF) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        return fail("Connection closed before the message was complete");
    }

    HttpRequest get_request() const { return request_; }
    HttpResponse get_response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    void reset() {
        state_ = mode_ == ParseMode::Request ? ParseState::METHOD : ParseState::STATUS_VERSION;
        request_ = HttpRequest();
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseMode mode_;
    ParseState state_;
    HttpRequest request_;
    HttpResponse response_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    size_t remaining_;                  // Body or chunk bytes still expected
    size_t line_;                       // For error reporting
    bool last_char_was_cr_;

    static Result<bool> fail(const std::string& message) {
        return Err<bool>(ErrorKind::RemoteError, message);
    }

    Result<bool> body_too_large() {
        state_ = ParseState::PARSE_ERROR;
        return fail("HTTP body larger than " + std::to_string(kMaxBodySize) + " bytes");
    }

    HeaderMap& headers() { return mode_ == ParseMode::Request ? request_.headers : response_.headers; }
    std::vector<uint8_t>& body() { return mode_ == ParseMode::Request ? request_.body : response_.body; }

    static bool parse_length(const std::string& text, size_t& out) {
        if (text.empty()) {
            return false;
        }
        size_t value = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            value = value * 10 + static_cast<size_t>(c - '0');
            if (value > kMaxBodySize) {
                return false;
            }
        }
        out = value;
        return true;
    }

    static HttpVersion parse_version_token(const std::string& token) {
        if (token == "HTTP/1.1") return HttpVersion::HTTP_1_1;
        if (token == "HTTP/1.0") return HttpVersion::HTTP_1_0;
        return HttpVersion::UNKNOWN;
    }

    // Returns true when c completed a CRLF; CR alone is swallowed
    bool consume_crlf(char c, bool& ended) {
        ended = false;
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            ended = true;
            return true;
        }
        last_char_was_cr_ = false;
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_request_version(char c) {
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (!ended) {
                return true;
            }
            request_.version = parse_version_token(buffer_);
            if (request_.version == HttpVersion::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_version(char c) {
        if (c == ' ') {
            response_.version = parse_version_token(buffer_);
            if (response_.version == HttpVersion::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        bool ended = false;
        const bool line_char = consume_crlf(c, ended);
        if (c == ' ' || ended) {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ended ? ParseState::HEADER_NAME : ParseState::REASON;
            return true;
        }
        if (line_char) {
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (ended) {
                response_.reason_phrase = buffer_;
                buffer_.clear();
                state_ = ParseState::HEADER_NAME;
            }
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (ended) {
                if (!buffer_.empty()) {
                    return false;
                }
                return begin_body();
            }
            return true;
        }

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (ended) {
                while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                    buffer_.pop_back();
                }
                headers()[current_header_name_] = buffer_;
                buffer_.clear();
                current_header_name_.clear();
                state_ = ParseState::HEADER_NAME;
            }
            return true;
        }
        buffer_ += c;
        return true;
    }

    // Decide how the body is delimited once the blank line is seen
    bool begin_body() {
        const HeaderMap& hdrs = headers();
        const std::string content_length = detail::find_header(hdrs, "Content-Length");
        std::string transfer_encoding = detail::find_header(hdrs, "Transfer-Encoding");
        std::transform(transfer_encoding.begin(), transfer_encoding.end(), transfer_encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

        if (mode_ == ParseMode::Response) {
            const int code = response_.status_code;
            if ((code >= 100 && code < 200) || code == 204 || code == 304) {
                state_ = ParseState::COMPLETE;
                return true;
            }
        }

        if (transfer_encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        if (!content_length.empty()) {
            size_t length = 0;
            if (!parse_length(content_length, length)) {
                return false;
            }
            remaining_ = length;
            state_ = length > 0 ? ParseState::BODY : ParseState::COMPLETE;
            return true;
        }

        state_ = mode_ == ParseMode::Response ? ParseState::BODY_UNTIL_EOF : ParseState::COMPLETE;
        return true;
    }

    bool parse_chunk_size(char c) {
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (!ended) {
                return true;
            }
            const std::string size_text = buffer_.substr(0, buffer_.find(';'));
            buffer_.clear();
            if (size_text.empty()) {
                return false;
            }
            size_t size = 0;
            for (char h : size_text) {
                if (!std::isxdigit(static_cast<unsigned char>(h))) {
                    return false;
                }
                size = size * 16 + static_cast<size_t>(std::isdigit(static_cast<unsigned char>(h))
                                                            ? h - '0'
                                                            : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                if (size > kMaxBodySize) {
                    return false;
                }
            }
            remaining_ = size;
            state_ = size > 0 ? ParseState::CHUNK_DATA : ParseState::CHUNK_TRAILER;
            return true;
        }
        buffer_ += c;
        return true;
    }

    bool parse_chunk_data_end(char c) {
        bool ended = false;
        if (!consume_crlf(c, ended)) {
            return false;
        }
        if (ended) {
            state_ = ParseState::CHUNK_SIZE;
        }
        return true;
    }

    // Trailer fields are ignored; a blank line ends the message
    bool parse_chunk_trailer(char c) {
        bool ended = false;
        if (consume_crlf(c, ended)) {
            if (ended) {
                if (buffer_.empty()) {
                    state_ = ParseState::COMPLETE;
                }
                buffer_.clear();
            }
            return true;
        }
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace swc
