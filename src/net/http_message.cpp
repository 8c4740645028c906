#include "qrdrop/net/http_message.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace qrdrop {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Reads "Name: value" lines until the end of head
void parse_header_lines(std::istringstream& stream,
                        std::unordered_map<std::string, std::string>& headers) {
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
}

} // anonymous namespace

std::string HttpRequest::get_header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.find(to_lower(name)) != headers.end();
}

std::string HttpRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    if (it != query.end()) {
        return it->second;
    }
    return {};
}

HttpResponse HttpResponse::json(uint16_t status, const std::string& json_body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.set_header("Content-Type", "application/json");
    resp.body = json_body;
    return resp;
}

HttpResponse HttpResponse::error(uint16_t status, const std::string& message) {
    return json(status, nlohmann::json{{"error", message}}.dump());
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    headers[name] = value;
}

std::string HttpResponse::get_header(const std::string& name) const {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

uint64_t HttpResponse::content_length() const {
    return body_stream ? body_length : body.size();
}

std::string HttpResponse::serialize_head() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status_code << " " << status_text(status_code) << "\r\n";
    for (const auto& [name, value] : headers) {
        if (to_lower(name) == "content-length") continue;
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << content_length() << "\r\n";
    out << "\r\n";
    return out.str();
}

std::string HttpResponseHead::get_header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

std::optional<uint64_t> HttpResponseHead::content_length() const {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(it->second.begin(), it->second.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(it->second);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string status_text(uint16_t status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string url_encode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0f]);
        }
    }
    return out;
}

std::string url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() &&
                   hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::optional<HttpRequest> parse_http_request(const std::string& head) {
    std::istringstream stream(head);
    std::string request_line;
    if (!std::getline(stream, request_line)) {
        return std::nullopt;
    }
    if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

    std::istringstream line_stream(request_line);
    std::string method, target, version;
    if (!(line_stream >> method >> target >> version)) {
        return std::nullopt;
    }
    if (version.rfind("HTTP/", 0) != 0 || target.empty()) {
        return std::nullopt;
    }

    HttpRequest req;
    req.method = method;
    auto qpos = target.find('?');
    if (qpos == std::string::npos) {
        req.path = url_decode(target);
    } else {
        req.path = url_decode(target.substr(0, qpos));
        req.query_string = target.substr(qpos + 1);
        req.query = parse_query_string(req.query_string);
    }

    parse_header_lines(stream, req.headers);
    return req;
}

std::optional<HttpResponseHead> parse_http_response_head(const std::string& head) {
    std::istringstream stream(head);
    std::string status_line;
    if (!std::getline(stream, status_line)) {
        return std::nullopt;
    }
    if (!status_line.empty() && status_line.back() == '\r') status_line.pop_back();

    std::istringstream line_stream(status_line);
    std::string version;
    int code = 0;
    if (!(line_stream >> version >> code) || version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }

    HttpResponseHead resp;
    resp.status_code = code;
    parse_header_lines(stream, resp.headers);
    return resp;
}

} // namespace qrdrop
