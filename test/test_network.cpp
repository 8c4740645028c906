#include <catch2/catch_test_macros.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "qrdrop/net/network_discovery.h"

using namespace qrdrop;
using namespace std::chrono_literals;

namespace {

// Listening socket held for the lifetime of the test
class Listener {
public:
    explicit Listener(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ok_ = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
              ::listen(fd_, 4) == 0;
    }
    ~Listener() {
        if (fd_ >= 0) ::close(fd_);
    }
    bool ok() const { return ok_; }

private:
    int fd_ = -1;
    bool ok_ = false;
};

InterfaceEnumerator fixed_interfaces(std::vector<RawInterface> interfaces) {
    return [interfaces]() { return interfaces; };
}

} // anonymous namespace

TEST_CASE("Interface classification", "[network][interface]") {
    REQUIRE(NetworkDiscovery::classify_interface("wlan0") == InterfaceType::Wifi);
    REQUIRE(NetworkDiscovery::classify_interface("wlp3s0") == InterfaceType::Wifi);
    REQUIRE(NetworkDiscovery::classify_interface("en0") == InterfaceType::Wifi);
    REQUIRE(NetworkDiscovery::classify_interface("Wi-Fi") == InterfaceType::Wifi);
    REQUIRE(NetworkDiscovery::classify_interface("eth0") == InterfaceType::Ethernet);
    REQUIRE(NetworkDiscovery::classify_interface("enp0s31f6") == InterfaceType::Ethernet);
    REQUIRE(NetworkDiscovery::classify_interface("en1") == InterfaceType::Ethernet);
    REQUIRE(NetworkDiscovery::classify_interface("docker0") == InterfaceType::Other);
    REQUIRE(NetworkDiscovery::classify_interface("tun0") == InterfaceType::Other);
}

TEST_CASE("Private address ranges", "[network][address]") {
    REQUIRE(NetworkDiscovery::is_private_address("10.0.0.5"));
    REQUIRE(NetworkDiscovery::is_private_address("172.16.0.1"));
    REQUIRE(NetworkDiscovery::is_private_address("172.31.255.254"));
    REQUIRE(NetworkDiscovery::is_private_address("192.168.1.50"));
    REQUIRE(NetworkDiscovery::is_private_address("169.254.10.10"));

    REQUIRE_FALSE(NetworkDiscovery::is_private_address("172.32.0.1"));
    REQUIRE_FALSE(NetworkDiscovery::is_private_address("8.8.8.8"));
    REQUIRE_FALSE(NetworkDiscovery::is_private_address("127.0.0.1"));
    REQUIRE_FALSE(NetworkDiscovery::is_private_address("not-an-ip"));
}

TEST_CASE("Local address prefers Wi-Fi", "[network][address]") {
    NetworkDiscovery discovery(fixed_interfaces({
        {"docker0", "172.17.0.1"},
        {"eth0", "192.168.1.20"},
        {"wlan0", "192.168.1.50"},
        {"ppp0", "203.0.113.9"}
    }));

    auto ip = discovery.get_local_ip_address();
    REQUIRE(ip.has_value());
    REQUIRE(*ip == "192.168.1.50");
    REQUIRE(discovery.is_connected_to_wifi());

    auto all = discovery.get_all_local_addresses();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].type == InterfaceType::Wifi);
    REQUIRE(all[1].type == InterfaceType::Ethernet);
    REQUIRE(all[2].name == "docker0");
}

TEST_CASE("No private interface means no address", "[network][address]") {
    NetworkDiscovery discovery(fixed_interfaces({{"ppp0", "203.0.113.9"}}));
    REQUIRE_FALSE(discovery.get_local_ip_address().has_value());
    REQUIRE_FALSE(discovery.is_connected_to_wifi());

    NetworkDiscovery wired(fixed_interfaces({{"eth0", "10.1.2.3"}}));
    REQUIRE(wired.get_local_ip_address() == std::optional<std::string>("10.1.2.3"));
    REQUIRE_FALSE(wired.is_connected_to_wifi());
}

TEST_CASE("Port scan skips an occupied port", "[network][port]") {
    auto first = NetworkDiscovery::find_available_port(18150, 18170, "127.0.0.1");
    REQUIRE(first.has_value());

    Listener occupied(*first);
    REQUIRE(occupied.ok());

    REQUIRE_FALSE(NetworkDiscovery::find_available_port(*first, *first, "127.0.0.1").has_value());

    auto next = NetworkDiscovery::find_available_port(*first, 18170, "127.0.0.1");
    if (next) {
        REQUIRE(*next > *first);
    }
}

TEST_CASE("Connection validation", "[network][connect]") {
    auto port = NetworkDiscovery::find_available_port(18171, 18190, "127.0.0.1");
    REQUIRE(port.has_value());

    REQUIRE_FALSE(NetworkDiscovery::validate_connection("127.0.0.1", *port, 500ms));

    Listener listening(*port);
    REQUIRE(listening.ok());
    REQUIRE(NetworkDiscovery::validate_connection("127.0.0.1", *port, 2s));

    REQUIRE_FALSE(NetworkDiscovery::validate_connection("not-an-ip", *port, 500ms));
}
