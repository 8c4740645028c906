#include "qrdrop/net/tcp_socket.h"
#include "qrdrop/base/error_translate.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace qrdrop {

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_.exchange(-1)), shut_down_(other.shut_down_.load()) {}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_.exchange(-1);
        shut_down_ = other.shut_down_.load();
    }
    return *this;
}

TcpSocket TcpSocket::connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw QrDropError(ErrorCode::InvalidArgument, "Not an IPv4 address: " + ip);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw from_errno(errno, "Failed to create socket", ErrorCode::InternalError);
    }
    TcpSocket sock(fd);

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    std::string target = ip + ":" + std::to_string(port);
    int rc = ::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        throw from_errno(errno, "Failed to connect to " + target);
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            throw QrDropError(ErrorCode::ConnectionTimeout,
                              "Connect to " + target + " timed out after " +
                              std::to_string(timeout.count()) + "ms");
        }
        if (ready < 0) {
            throw from_errno(errno, "poll failed while connecting to " + target);
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            throw from_errno(errno, "getsockopt failed for " + target);
        }
        if (so_error != 0) {
            throw from_errno(so_error, "Failed to connect to " + target);
        }
    }

    fcntl(fd, F_SETFL, flags);

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    return sock;
}

void TcpSocket::set_io_timeout(std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void TcpSocket::send_all(const void* data, size_t size) {
    const char* ptr = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < size) {
        ssize_t n = ::send(fd_, ptr + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (shut_down_) {
                throw QrDropError(ErrorCode::Cancelled, "Connection shut down");
            }
            throw from_errno(errno, "Failed to send request");
        }
        sent += static_cast<size_t>(n);
    }
}

size_t TcpSocket::receive(void* data, size_t size) {
    while (true) {
        ssize_t n = ::recv(fd_, data, size, 0);
        if (n >= 0) {
            if (n == 0 && shut_down_) {
                throw QrDropError(ErrorCode::Cancelled, "Connection shut down");
            }
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (shut_down_) {
            throw QrDropError(ErrorCode::Cancelled, "Connection shut down");
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw QrDropError(ErrorCode::ConnectionTimeout, "Timed out waiting for data");
        }
        throw from_errno(errno, "Failed to receive data");
    }
}

void TcpSocket::shutdown() {
    int fd = fd_.load();
    if (fd >= 0) {
        shut_down_ = true;
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TcpSocket::close() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace qrdrop
