#ifndef QRDROP_NET_HTTP_CONNECTION_H
#define QRDROP_NET_HTTP_CONNECTION_H

#include "qrdrop/net/http_message.h"
#include "qrdrop/net/tcp_socket.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace qrdrop {

// One blocking HTTP/1.1 GET exchange over a POSIX socket. The body is pulled
// by the caller chunk by chunk so large files never sit in memory.
class HttpConnection {
public:
    HttpConnection(std::string host, uint16_t port,
                   std::chrono::milliseconds connect_timeout,
                   std::chrono::milliseconds read_timeout);

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    // Connects, sends the request and reads the status line and headers.
    // Throws QrDropError on connect, send or protocol failure.
    HttpResponseHead get(const std::string& target);

    // Copies up to size body bytes into buffer; returns 0 once the body is done.
    // A connection that closes before Content-Length bytes arrive throws.
    size_t read_body(char* buffer, size_t size);

    std::string read_body_to_string(size_t limit = 1024 * 1024);

    uint64_t body_bytes_read() const { return body_read_; }

    // Aborts a blocked get()/read_body() from another thread
    void shutdown();
    void close();

private:
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds read_timeout_;

    TcpSocket socket_;
    std::string pending_;  // body bytes received together with the head
    std::optional<uint64_t> content_length_;
    uint64_t body_read_ = 0;
    bool body_done_ = false;
};

} // namespace qrdrop

#endif // QRDROP_NET_HTTP_CONNECTION_H
