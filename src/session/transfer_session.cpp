#include "qrdrop/session/transfer_session.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <filesystem>
#include <fstream>
#include <utility>

namespace qrdrop {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr size_t kAlphabetSize = sizeof(kAlphabet) - 1;

// Largest multiple of the alphabet size that fits in a byte; bytes at or above it
// are rejected so every character is equally likely.
constexpr unsigned int kRejectThreshold = 256 - (256 % kAlphabetSize);

std::string openssl_last_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string random_alphanumeric(size_t length) {
    std::string out;
    out.reserve(length);

    std::array<unsigned char, 64> pool{};
    while (out.size() < length) {
        if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
            throw QrDropError(ErrorCode::InternalError,
                              "RAND_bytes failed: " + openssl_last_error());
        }
        for (unsigned char b : pool) {
            if (b >= kRejectThreshold) continue;
            out.push_back(kAlphabet[b % kAlphabetSize]);
            if (out.size() == length) break;
        }
    }
    return out;
}

} // anonymous namespace

TransferSession::TransferSession(std::string session_id,
                                 std::string file_path,
                                 std::string file_name,
                                 uint64_t file_size,
                                 std::string ip_address,
                                 uint16_t port,
                                 std::string security_token,
                                 Clock::time_point created_at,
                                 std::chrono::seconds session_timeout)
    : session_id_(std::move(session_id)),
      file_path_(std::move(file_path)),
      file_name_(std::move(file_name)),
      file_size_(file_size),
      ip_address_(std::move(ip_address)),
      port_(port),
      security_token_(std::move(security_token)),
      created_at_(created_at),
      session_timeout_(session_timeout) {}

TransferSession TransferSession::create(const std::string& file_path,
                                        const std::string& ip_address,
                                        uint16_t port,
                                        std::chrono::seconds session_timeout) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(file_path, ec) || ec) {
        throw QrDropError(ErrorCode::FileNotFound, "File does not exist: " + file_path);
    }
    if (!fs::is_regular_file(file_path, ec)) {
        throw QrDropError(ErrorCode::InvalidArgument, "Not a regular file: " + file_path);
    }

    std::ifstream probe(file_path, std::ios::binary);
    if (!probe.is_open()) {
        throw QrDropError(ErrorCode::PermissionDenied, "Cannot read file: " + file_path);
    }

    uint64_t size = fs::file_size(file_path, ec);
    if (ec) {
        throw QrDropError(ErrorCode::FileNotFound,
                          "Cannot stat file " + file_path + ": " + ec.message());
    }

    if (ip_address.empty()) {
        throw QrDropError(ErrorCode::NoNetwork, "No IP address to advertise");
    }
    if (port == 0) {
        throw QrDropError(ErrorCode::PortUnavailable, "No port assigned");
    }

    TransferSession session(generate_session_id(),
                            file_path,
                            fs::path(file_path).filename().string(),
                            size,
                            ip_address,
                            port,
                            generate_security_token(),
                            Clock::now(),
                            session_timeout);

    Logger::instance().debug("Created session " + session.to_string());
    return session;
}

bool TransferSession::is_expired() const {
    return is_expired_at(Clock::now());
}

bool TransferSession::is_expired_at(Clock::time_point now) const {
    return now - created_at_ > session_timeout_;
}

bool TransferSession::is_valid() const {
    return !is_expired() &&
           security_token_.size() >= kMinSecurityTokenLength &&
           !session_id_.empty() &&
           !ip_address_.empty() &&
           port_ > 0;
}

std::string TransferSession::base_url() const {
    return "http://" + ip_address_ + ":" + std::to_string(port_);
}

std::string TransferSession::to_string() const {
    return "TransferSession(id=" + session_id_ +
           ", file=" + file_name_ +
           ", size=" + std::to_string(file_size_) +
           ", endpoint=" + ip_address_ + ":" + std::to_string(port_) + ")";
}

std::string generate_security_token(size_t length) {
    return random_alphanumeric(length);
}

std::string generate_session_id() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "session_" + std::to_string(millis) + "_" + random_alphanumeric(8);
}

} // namespace qrdrop
