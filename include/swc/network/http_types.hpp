#pragma once

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace swc {
namespace network {

/**
 * @brief HTTP request methods the node API needs (plus the ones the stub
 * node in the tests has to recognise)
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the client treats specially or the stub node emits
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    PAYMENT_REQUIRED = 402,   // Bee: batch unusable / not found
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

// HTTP headers are case-insensitive per RFC 7230 but are stored as received
inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

} // namespace detail

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief An HTTP/1.1 request
 *
 * The client serialises these onto the wire; the stub node used by the
 * tests gets them back out of HttpParser.
 *
 * The body is a byte vector because upload payloads are arbitrary binary
 * data (files, tar archives).
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                 // Request target, e.g. "/tags/42"
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Path component of the target (everything before '?')
     */
    std::string path() const {
        return url.substr(0, url.find('?'));
    }

    /**
     * @brief Value of one query parameter, still percent-encoded
     */
    std::string query_param(const std::string& name) const {
        const auto q = url.find('?');
        if (q == std::string::npos) {
            return "";
        }
        std::istringstream query(url.substr(q + 1));
        std::string pair;
        while (std::getline(query, pair, '&')) {
            const auto eq = pair.find('=');
            if (pair.substr(0, eq) == name) {
                return eq == std::string::npos ? "" : pair.substr(eq + 1);
            }
        }
        return "";
    }

    /**
     * @brief Serialise to the HTTP wire format
     *
     * Content-Length is always written from the body size so callers
     * cannot get it out of sync.
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << url << " "
            << detail::version_to_string(version) << "\r\n";

        for (const auto& [name, value] : headers) {
            if (detail::strcasecmp_cross_platform(name.c_str(), "Content-Length") == 0) {
                continue;
            }
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << "\r\n";

        const std::string head = oss.str();
        std::vector<uint8_t> wire(head.begin(), head.end());
        wire.insert(wire.end(), body.begin(), body.end());
        return wire;
    }
};

/**
 * @brief An HTTP/1.1 response
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << detail::version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::PAYMENT_REQUIRED: return "Payment Required";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }
};

class UrlUtils {
public:
    /**
     * @brief Percent-encode a query component
     *
     * Leaves the RFC 3986 unreserved set plus !*'() untouched, which is the
     * same set browsers' encodeURIComponent keeps.
     */
    static std::string encode_component(const std::string& value) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value) {
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
                c == '*' || c == '\'' || c == '(' || c == ')') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 0x0F];
            }
        }
        return out;
    }

    static std::string decode_component(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '%' && i + 2 < value.size()) {
                const int hi = hex_value(value[i + 1]);
                const int lo = hex_value(value[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
            }
            out += value[i];
        }
        return out;
    }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace network
} // namespace swc
