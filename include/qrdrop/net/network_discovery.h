#ifndef QRDROP_NET_NETWORK_DISCOVERY_H
#define QRDROP_NET_NETWORK_DISCOVERY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace qrdrop {

// Lower value wins when choosing the address to advertise
enum class InterfaceType {
    Wifi = 1,
    Ethernet = 2,
    Other = 3
};

std::string to_string(InterfaceType type);

// IPv4 address bound to an interface that is up and not loopback
struct RawInterface {
    std::string name;
    std::string address;
};

struct InterfaceAddress {
    std::string name;
    std::string address;
    InterfaceType type = InterfaceType::Other;

    bool operator==(const InterfaceAddress& other) const = default;
};

using InterfaceEnumerator = std::function<std::vector<RawInterface>()>;

class NetworkDiscovery {
public:
    static constexpr uint16_t kDefaultPortStart = 8080;
    static constexpr uint16_t kDefaultPortEnd = 8090;

    NetworkDiscovery();
    explicit NetworkDiscovery(InterfaceEnumerator enumerator);

    // First private address by interface priority (Wi-Fi, Ethernet, other)
    std::optional<std::string> get_local_ip_address() const;

    // Every private address, sorted by interface priority
    std::vector<InterfaceAddress> get_all_local_addresses() const;

    bool is_connected_to_wifi() const;

    // Binds each port in [start, end] in order and releases the first that succeeds
    static std::optional<uint16_t> find_available_port(uint16_t start = kDefaultPortStart,
                                                       uint16_t end = kDefaultPortEnd,
                                                       const std::string& bind_address = "0.0.0.0");

    // True iff a TCP connect to ip:port succeeds within timeout
    static bool validate_connection(const std::string& ip, uint16_t port,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(30));

    static InterfaceType classify_interface(const std::string& name);

    // 10/8, 172.16/12, 192.168/16 and link-local 169.254/16
    static bool is_private_address(const std::string& ip);

    // getifaddrs() based default enumerator
    static std::vector<RawInterface> enumerate_system_interfaces();

private:
    InterfaceEnumerator enumerator_;
};

} // namespace qrdrop

#endif // QRDROP_NET_NETWORK_DISCOVERY_H
