#include "qrdrop/net/http_connection.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace qrdrop {

HttpConnection::HttpConnection(std::string host, uint16_t port,
                               std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds read_timeout)
    : host_(std::move(host)),
      port_(port),
      connect_timeout_(connect_timeout),
      read_timeout_(read_timeout) {}

HttpResponseHead HttpConnection::get(const std::string& target) {
    socket_ = TcpSocket::connect(host_, port_, connect_timeout_);
    socket_.set_io_timeout(read_timeout_);

    std::ostringstream request;
    request << "GET " << target << " HTTP/1.1\r\n";
    request << "Host: " << host_ << ":" << port_ << "\r\n";
    request << "Accept: */*\r\n";
    request << "Connection: close\r\n";
    request << "\r\n";

    std::string request_str = request.str();
    socket_.send_all(request_str.data(), request_str.size());

    std::string buffer;
    char chunk[4096];
    size_t head_end = std::string::npos;
    while (head_end == std::string::npos) {
        size_t n = socket_.receive(chunk, sizeof(chunk));
        if (n == 0) {
            throw QrDropError(ErrorCode::ProtocolError,
                              "Connection closed before response headers from " + host_);
        }
        buffer.append(chunk, n);
        head_end = buffer.find("\r\n\r\n");
        if (head_end == std::string::npos && buffer.size() > kMaxHeadSize) {
            throw QrDropError(ErrorCode::ProtocolError, "Response headers too large");
        }
    }

    auto head = parse_http_response_head(buffer.substr(0, head_end));
    if (!head) {
        throw QrDropError(ErrorCode::ProtocolError, "Malformed HTTP response from " + host_);
    }

    pending_ = buffer.substr(head_end + 4);
    content_length_ = head->content_length();
    body_read_ = 0;
    body_done_ = content_length_ && *content_length_ == 0;
    return *head;
}

size_t HttpConnection::read_body(char* buffer, size_t size) {
    if (body_done_ || size == 0) {
        return 0;
    }

    size_t want = size;
    if (content_length_) {
        want = static_cast<size_t>(std::min<uint64_t>(want, *content_length_ - body_read_));
    }

    size_t n = 0;
    if (!pending_.empty()) {
        n = std::min(want, pending_.size());
        std::memcpy(buffer, pending_.data(), n);
        pending_.erase(0, n);
    } else {
        n = socket_.receive(buffer, want);
        if (n == 0) {
            body_done_ = true;
            if (content_length_ && body_read_ < *content_length_) {
                throw QrDropError(ErrorCode::ServerUnavailable,
                                  "Connection closed after " + std::to_string(body_read_) +
                                  " of " + std::to_string(*content_length_) + " bytes");
            }
            return 0;
        }
    }

    body_read_ += n;
    if (content_length_ && body_read_ >= *content_length_) {
        body_done_ = true;
    }
    return n;
}

std::string HttpConnection::read_body_to_string(size_t limit) {
    std::string body;
    char chunk[4096];
    while (true) {
        size_t n = read_body(chunk, sizeof(chunk));
        if (n == 0) break;
        body.append(chunk, n);
        if (body.size() > limit) {
            throw QrDropError(ErrorCode::ProtocolError, "Response body exceeds " + std::to_string(limit) + " bytes");
        }
    }
    return body;
}

void HttpConnection::shutdown() {
    socket_.shutdown();
}

void HttpConnection::close() {
    socket_.close();
}

} // namespace qrdrop
