#ifndef QRDROP_SESSION_TRANSFER_SESSION_H
#define QRDROP_SESSION_TRANSFER_SESSION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace qrdrop {

constexpr size_t kSecurityTokenLength = 32;
constexpr size_t kMinSecurityTokenLength = 16;

// Immutable description of one file offered for transfer.
// file_path is only meaningful on the sending device; decoded sessions carry "".
class TransferSession {
public:
    using Clock = std::chrono::system_clock;

    static constexpr std::chrono::seconds kDefaultTimeout{3600};

    TransferSession(std::string session_id,
                    std::string file_path,
                    std::string file_name,
                    uint64_t file_size,
                    std::string ip_address,
                    uint16_t port,
                    std::string security_token,
                    Clock::time_point created_at = Clock::now(),
                    std::chrono::seconds session_timeout = kDefaultTimeout);

    // Builds a session for a local file with a fresh id and token.
    // Throws QrDropError: FileNotFound / PermissionDenied for the file,
    // NoNetwork for an empty ip, PortUnavailable for port 0.
    static TransferSession create(const std::string& file_path,
                                  const std::string& ip_address,
                                  uint16_t port,
                                  std::chrono::seconds session_timeout = kDefaultTimeout);

    const std::string& session_id() const { return session_id_; }
    const std::string& file_path() const { return file_path_; }
    const std::string& file_name() const { return file_name_; }
    uint64_t file_size() const { return file_size_; }
    const std::string& ip_address() const { return ip_address_; }
    uint16_t port() const { return port_; }
    const std::string& security_token() const { return security_token_; }
    Clock::time_point created_at() const { return created_at_; }
    std::chrono::seconds session_timeout() const { return session_timeout_; }

    bool is_expired() const;
    bool is_expired_at(Clock::time_point now) const;
    bool is_valid() const;

    // Base URL of the sending device, e.g. "http://192.168.1.50:8080"
    std::string base_url() const;

    // Diagnostic rendering; never includes the token
    std::string to_string() const;

    bool operator==(const TransferSession& other) const = default;

private:
    std::string session_id_;
    std::string file_path_;
    std::string file_name_;
    uint64_t file_size_;
    std::string ip_address_;
    uint16_t port_;
    std::string security_token_;
    Clock::time_point created_at_;
    std::chrono::seconds session_timeout_;
};

// 32 characters from [a-zA-Z0-9], drawn from the OpenSSL CSPRNG
std::string generate_security_token(size_t length = kSecurityTokenLength);

// session_<epoch millis>_<8 random alphanumerics>
std::string generate_session_id();

} // namespace qrdrop

#endif // QRDROP_SESSION_TRANSFER_SESSION_H
