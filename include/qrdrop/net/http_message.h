#ifndef QRDROP_NET_HTTP_MESSAGE_H
#define QRDROP_NET_HTTP_MESSAGE_H

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace qrdrop {

constexpr size_t kMaxHeadSize = 8192;

// HTTP request representation (simplified). Header names are stored lowercase.
struct HttpRequest {
    std::string method;           // GET, POST, OPTIONS, ...
    std::string path;             // without the query string
    std::string query_string;
    std::unordered_map<std::string, std::string> headers;
    std::unordered_map<std::string, std::string> query;

    std::string get_header(const std::string& name) const;
    bool has_header(const std::string& name) const;
    std::string query_param(const std::string& name) const;
};

// HTTP response representation (simplified)
struct HttpResponse {
    uint16_t status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // When set, the body is streamed from here instead of `body`
    std::shared_ptr<std::istream> body_stream;
    uint64_t body_length = 0;

    static HttpResponse json(uint16_t status, const std::string& json_body);
    static HttpResponse error(uint16_t status, const std::string& message);

    void set_header(const std::string& name, const std::string& value);
    std::string get_header(const std::string& name) const;

    uint64_t content_length() const;

    // Status line, headers, Content-Length and the blank line
    std::string serialize_head() const;
};

// Status line and headers of a response read by the client
struct HttpResponseHead {
    int status_code = 0;
    std::unordered_map<std::string, std::string> headers;  // lowercase names

    std::string get_header(const std::string& name) const;
    std::optional<uint64_t> content_length() const;
};

std::string status_text(uint16_t status);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);
std::unordered_map<std::string, std::string> parse_query_string(const std::string& query);

// `head` is everything before the first blank line
std::optional<HttpRequest> parse_http_request(const std::string& head);
std::optional<HttpResponseHead> parse_http_response_head(const std::string& head);

} // namespace qrdrop

#endif // QRDROP_NET_HTTP_MESSAGE_H
