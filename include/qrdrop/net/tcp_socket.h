#ifndef QRDROP_NET_TCP_SOCKET_H
#define QRDROP_NET_TCP_SOCKET_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace qrdrop {

// Blocking IPv4 TCP socket owning its file descriptor
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    // Connects with a bounded wait, then restores blocking mode.
    // Throws QrDropError translated from the socket errno.
    static TcpSocket connect(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout);

    // SO_RCVTIMEO / SO_SNDTIMEO
    void set_io_timeout(std::chrono::milliseconds timeout);

    // Writes the whole buffer or throws
    void send_all(const void* data, size_t size);

    // Returns bytes read, 0 on orderly close; throws on error or timeout
    size_t receive(void* data, size_t size);

    // Unblocks a thread sitting in receive(); safe to call from any thread
    void shutdown();

    void close();

    bool is_open() const { return fd_.load() >= 0; }
    int fd() const { return fd_.load(); }

private:
    std::atomic<int> fd_{-1};
    std::atomic<bool> shut_down_{false};
};

} // namespace qrdrop

#endif // QRDROP_NET_TCP_SOCKET_H
