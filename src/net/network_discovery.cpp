#include "qrdrop/net/network_discovery.h"
#include "qrdrop/net/tcp_socket.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace qrdrop {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

} // anonymous namespace

std::string to_string(InterfaceType type) {
    switch (type) {
        case InterfaceType::Wifi: return "wifi";
        case InterfaceType::Ethernet: return "ethernet";
        case InterfaceType::Other: return "other";
        default: return "unknown";
    }
}

NetworkDiscovery::NetworkDiscovery()
    : enumerator_(&NetworkDiscovery::enumerate_system_interfaces) {}

NetworkDiscovery::NetworkDiscovery(InterfaceEnumerator enumerator)
    : enumerator_(std::move(enumerator)) {}

std::vector<RawInterface> NetworkDiscovery::enumerate_system_interfaces() {
    std::vector<RawInterface> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        Logger::instance().warning("getifaddrs failed: " + std::string(std::strerror(errno)));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) continue;

        result.push_back(RawInterface{ifa->ifa_name, buf});
    }

    freeifaddrs(ifaddr);
    return result;
}

InterfaceType NetworkDiscovery::classify_interface(const std::string& raw_name) {
    std::string name = to_lower(raw_name);

    if (contains(name, "wlan") ||
        contains(name, "wifi") ||
        starts_with(name, "en0") ||
        starts_with(name, "wlp") ||
        contains(name, "wireless") ||
        contains(name, "wi-fi") ||
        starts_with(name, "wl") ||
        contains(name, "802.11")) {
        return InterfaceType::Wifi;
    }

    if (contains(name, "eth") ||
        starts_with(name, "en1") ||
        starts_with(name, "enp") ||
        contains(name, "lan") ||
        contains(name, "ethernet") ||
        starts_with(name, "em") ||
        starts_with(name, "igb") ||
        starts_with(name, "re") ||
        contains(name, "local area connection")) {
        return InterfaceType::Ethernet;
    }

    return InterfaceType::Other;
}

bool NetworkDiscovery::is_private_address(const std::string& ip) {
    struct in_addr addr;
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return false;
    }
    uint32_t host = ntohl(addr.s_addr);
    uint32_t first = host >> 24;
    uint32_t second = (host >> 16) & 0xff;

    if (first == 10) return true;
    if (first == 172 && second >= 16 && second <= 31) return true;
    if (first == 192 && second == 168) return true;
    if (first == 169 && second == 254) return true;
    return false;
}

std::vector<InterfaceAddress> NetworkDiscovery::get_all_local_addresses() const {
    std::vector<InterfaceAddress> result;
    for (const auto& iface : enumerator_()) {
        if (!is_private_address(iface.address)) continue;
        result.push_back(InterfaceAddress{iface.name, iface.address, classify_interface(iface.name)});
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const InterfaceAddress& a, const InterfaceAddress& b) {
                         return static_cast<int>(a.type) < static_cast<int>(b.type);
                     });
    return result;
}

std::optional<std::string> NetworkDiscovery::get_local_ip_address() const {
    auto addresses = get_all_local_addresses();
    if (addresses.empty()) {
        Logger::instance().warning("No private IPv4 address found on any interface");
        return std::nullopt;
    }
    const auto& chosen = addresses.front();
    Logger::instance().debug("Using " + chosen.address + " on " + chosen.name +
                             " (" + to_string(chosen.type) + ")");
    return chosen.address;
}

bool NetworkDiscovery::is_connected_to_wifi() const {
    auto addresses = get_all_local_addresses();
    return std::any_of(addresses.begin(), addresses.end(),
                       [](const InterfaceAddress& a) { return a.type == InterfaceType::Wifi; });
}

std::optional<uint16_t> NetworkDiscovery::find_available_port(uint16_t start, uint16_t end,
                                                              const std::string& bind_address) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        Logger::instance().error("Invalid bind address: " + bind_address);
        return std::nullopt;
    }

    for (uint32_t port = start; port <= end; ++port) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            Logger::instance().error("Failed to create socket: " + std::string(std::strerror(errno)));
            return std::nullopt;
        }

        int one = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        addr.sin_port = htons(static_cast<uint16_t>(port));
        bool bound = ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
                     ::listen(fd, 1) == 0;
        ::close(fd);

        if (bound) {
            return static_cast<uint16_t>(port);
        }
        Logger::instance().debug("Port " + std::to_string(port) + " unavailable");
    }

    Logger::instance().warning("No available port in range " + std::to_string(start) +
                               "-" + std::to_string(end));
    return std::nullopt;
}

bool NetworkDiscovery::validate_connection(const std::string& ip, uint16_t port,
                                           std::chrono::milliseconds timeout) {
    try {
        TcpSocket sock = TcpSocket::connect(ip, port, timeout);
        return true;
    } catch (const QrDropError& e) {
        Logger::instance().debug("Connection check to " + ip + ":" + std::to_string(port) +
                                 " failed: " + e.what());
        return false;
    }
}

} // namespace qrdrop
