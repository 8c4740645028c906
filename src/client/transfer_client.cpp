#include "qrdrop/client/transfer_client.h"
#include "qrdrop/client/save_path.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/error_translate.h"
#include "qrdrop/base/logger.h"
#include "qrdrop/net/http_connection.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <vector>

using json = nlohmann::json;

namespace qrdrop {

namespace {

constexpr size_t kReceiveBufferSize = 64 * 1024;

std::string session_query(const TransferSession& session) {
    return "?sessionId=" + url_encode(session.session_id()) +
           "&token=" + url_encode(session.security_token());
}

} // anonymous namespace

std::string to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Idle: return "idle";
        case DownloadState::Connecting: return "connecting";
        case DownloadState::Downloading: return "downloading";
        case DownloadState::Completed: return "completed";
        case DownloadState::Failed: return "failed";
        case DownloadState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

struct TransferClient::Impl {
    ClientConfig config;
    ProgressChannel progress;
    SleepFunction sleep = default_sleep;

    std::atomic<bool> downloading{false};
    // Survives between retry attempts; cleared when a new download starts
    std::atomic<bool> cancelled{false};
    std::atomic<bool> retrying{false};
    std::atomic<DownloadState> state{DownloadState::Idle};

    std::mutex connection_mutex;
    std::shared_ptr<HttpConnection> active_connection;

    explicit Impl(const ClientConfig& cfg) : config(cfg) {}

    std::chrono::milliseconds connect_timeout() const {
        return std::chrono::seconds(config.connect_timeout_sec);
    }

    std::chrono::milliseconds read_timeout() const {
        return std::chrono::seconds(config.read_timeout_sec);
    }

    void check_cancelled() const {
        if (cancelled.load()) {
            throw QrDropError(ErrorCode::Cancelled, "Download cancelled");
        }
    }

    // Registers the connection so cancel_download() can interrupt it
    std::shared_ptr<HttpConnection> open(const std::string& host, uint16_t port,
                                         std::chrono::milliseconds read_timeout) {
        auto connection = std::make_shared<HttpConnection>(host, port, connect_timeout(), read_timeout);
        std::lock_guard<std::mutex> lock(connection_mutex);
        check_cancelled();
        active_connection = connection;
        return connection;
    }

    void release(const std::shared_ptr<HttpConnection>& connection) {
        connection->close();
        std::lock_guard<std::mutex> lock(connection_mutex);
        if (active_connection == connection) {
            active_connection.reset();
        }
    }
};

namespace {

// Clears the single-flight flag and any leftover connection on every exit path
class DownloadGuard {
public:
    DownloadGuard(std::atomic<bool>& downloading, std::mutex& mutex,
                  std::shared_ptr<HttpConnection>& connection)
        : downloading_(downloading), mutex_(mutex), connection_(connection) {}

    ~DownloadGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_.reset();
        }
        downloading_.store(false);
    }

private:
    std::atomic<bool>& downloading_;
    std::mutex& mutex_;
    std::shared_ptr<HttpConnection>& connection_;
};

// Clears the retry flag when download_file_with_retry() returns or throws
class RetryScope {
public:
    explicit RetryScope(std::atomic<bool>& retrying) : retrying_(retrying) {
        retrying_.store(true);
    }
    ~RetryScope() {
        retrying_.store(false);
    }

private:
    std::atomic<bool>& retrying_;
};

std::filesystem::path storage_directory(const std::optional<std::filesystem::path>& custom_path,
                                        const std::filesystem::path& download_directory) {
    if (!custom_path) {
        return download_directory;
    }
    if (custom_path->has_parent_path()) {
        return custom_path->parent_path();
    }
    return std::filesystem::current_path();
}

void remove_partial_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        Logger::instance().info("Removed partial file " + path.string());
    } else if (ec) {
        Logger::instance().warning("Failed to remove partial file {}: {}", path.string(), ec.message());
    }
}

} // anonymous namespace

TransferClient::TransferClient(const ClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

TransferClient::~TransferClient() {
    cancel_download();
}

bool TransferClient::validate_connection(const std::string& ip, uint16_t port, const std::string& /*token*/) {
    std::shared_ptr<HttpConnection> connection;
    try {
        // Health probe uses the connect timeout for the whole exchange
        connection = impl_->open(ip, port, impl_->connect_timeout());
        auto head = connection->get("/health");
        impl_->release(connection);
        return head.status_code == 200;
    } catch (const QrDropError& e) {
        if (connection) {
            impl_->release(connection);
        }
        Logger::instance().debug("Health check for {}:{} failed: {}", ip, port, e.what());
        return false;
    }
}

FileInfo TransferClient::fetch_file_info(const TransferSession& session) {
    auto connection = impl_->open(session.ip_address(), session.port(), impl_->read_timeout());
    try {
        auto head = connection->get("/info/" + url_encode(session.session_id()) + session_query(session));
        if (head.status_code != 200) {
            throw from_http_status(head.status_code, "GET /info");
        }
        std::string body = connection->read_body_to_string();
        impl_->release(connection);

        json data = json::parse(body);
        FileInfo info;
        info.session_id = data.value("sessionId", session.session_id());
        info.file_name = data.value("fileName", session.file_name());
        info.file_size = data.value("fileSize", session.file_size());
        info.content_type = data.value("contentType", std::string("application/octet-stream"));
        return info;
    } catch (const json::exception& e) {
        impl_->release(connection);
        throw QrDropError(ErrorCode::ProtocolError, std::string("Invalid file info response: ") + e.what());
    } catch (const QrDropError&) {
        impl_->release(connection);
        throw;
    }
}

std::filesystem::path TransferClient::download_directory() const {
    if (!impl_->config.download_dir.empty()) {
        return impl_->config.download_dir;
    }
    return default_download_directory();
}

std::filesystem::path TransferClient::resolve_save_path(
    const std::string& file_name,
    const std::optional<std::filesystem::path>& custom_path) const {
    try {
        if (custom_path) {
            if (custom_path->has_parent_path()) {
                std::filesystem::create_directories(custom_path->parent_path());
            }
            return *custom_path;
        }
        auto directory = download_directory();
        std::filesystem::create_directories(directory);
        return unique_save_path(directory, file_name);
    } catch (const std::filesystem::filesystem_error& e) {
        throw from_filesystem_error(e);
    }
}

std::filesystem::path TransferClient::download_file(
    const TransferSession& session,
    const std::optional<std::filesystem::path>& custom_path) {
    bool expected = false;
    if (!impl_->downloading.compare_exchange_strong(expected, true)) {
        throw QrDropError(ErrorCode::InvalidState, "Download already in progress");
    }
    DownloadGuard guard(impl_->downloading, impl_->connection_mutex, impl_->active_connection);
    if (!impl_->retrying.load()) {
        impl_->cancelled.store(false);
    }

    if (!session.is_valid()) {
        impl_->state.store(DownloadState::Failed);
        if (session.is_expired()) {
            throw QrDropError(ErrorCode::SessionExpired, "Session " + session.session_id() + " has expired");
        }
        throw QrDropError(ErrorCode::InvalidArgument, "Invalid session: " + session.to_string());
    }

    impl_->state.store(DownloadState::Connecting);
    Logger::instance().info("Connecting to {}:{} for {}", session.ip_address(), session.port(), session.file_name());

    std::optional<std::filesystem::path> save_path;
    // Only a file this attempt opened for writing is ours to remove
    bool created = false;
    TransferProgress frame = TransferProgress::start(session.file_size());
    try {
        impl_->check_cancelled();
        if (!validate_connection(session.ip_address(), session.port(), session.security_token())) {
            impl_->check_cancelled();
            throw QrDropError(ErrorCode::ServerUnavailable,
                              "Cannot connect to server at " + session.ip_address() + ":" +
                              std::to_string(session.port()));
        }

        FileInfo info = fetch_file_info(session);
        frame = TransferProgress::start(info.file_size);
        save_path = resolve_save_path(info.file_name, custom_path);

        auto connection = impl_->open(session.ip_address(), session.port(), impl_->read_timeout());
        auto head = connection->get("/file/" + url_encode(session.session_id()) + session_query(session));
        if (head.status_code != 200) {
            throw from_http_status(head.status_code, "GET /file");
        }

        std::ofstream out(*save_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw from_errno(errno, "Cannot create " + save_path->string(), ErrorCode::PermissionDenied);
        }
        created = true;

        impl_->state.store(DownloadState::Downloading);
        impl_->progress.publish(frame);
        Logger::instance().info("Downloading {} ({}) to {}", info.file_name,
                                format_bytes(info.file_size), save_path->string());

        std::vector<char> buffer(kReceiveBufferSize);
        uint64_t received = 0;
        while (true) {
            impl_->check_cancelled();
            size_t n = connection->read_body(buffer.data(), buffer.size());
            if (n == 0) break;

            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                int err = errno;
                if (err == ENOSPC) {
                    Logger::instance().warning("Disk full while writing " + save_path->string());
                }
                throw from_errno(err, "Failed writing " + save_path->string(), ErrorCode::InsufficientStorage);
            }
            received += n;
            frame = frame.update_progress(received);
            impl_->progress.publish(frame);
        }

        out.close();
        if (out.fail()) {
            throw from_errno(errno, "Failed closing " + save_path->string(), ErrorCode::InsufficientStorage);
        }
        impl_->release(connection);

        if (received != info.file_size) {
            throw QrDropError(ErrorCode::CorruptedFile,
                              "Received " + std::to_string(received) + " of " +
                              std::to_string(info.file_size) + " bytes");
        }

        frame = frame.complete();
        impl_->progress.publish(frame);
        impl_->state.store(DownloadState::Completed);
        Logger::instance().info("Download complete: " + save_path->string());
        return *save_path;
    } catch (const QrDropError& e) {
        if (created) {
            remove_partial_file(*save_path);
        }
        impl_->progress.publish(frame.abort());
        bool was_cancelled = e.code() == ErrorCode::Cancelled || impl_->cancelled.load();
        impl_->state.store(was_cancelled ? DownloadState::Cancelled : DownloadState::Failed);
        if (was_cancelled) {
            Logger::instance().info("Download of {} cancelled", session.file_name());
            if (e.code() != ErrorCode::Cancelled) {
                throw QrDropError(ErrorCode::Cancelled, "Download cancelled");
            }
        } else {
            Logger::instance().error("Download of {} failed: {}", session.file_name(), e.what());
        }
        throw;
    }
}

std::filesystem::path TransferClient::download_file_with_retry(
    const TransferSession& session,
    const std::optional<std::filesystem::path>& custom_path,
    uint32_t max_retries,
    std::chrono::milliseconds retry_delay) {
    impl_->cancelled.store(false);
    RetryScope scope(impl_->retrying);
    const auto directory = storage_directory(custom_path, download_directory());

    auto path = retry_execute(
        [&]() {
            // A cancel that landed while waiting between attempts
            if (impl_->cancelled.load()) {
                impl_->state.store(DownloadState::Cancelled);
                throw QrDropError(ErrorCode::Cancelled, "Download cancelled");
            }
            if (!has_enough_storage(session.file_size(), directory)) {
                throw QrDropError(ErrorCode::InsufficientStorage,
                                  "Not enough free space for " + format_bytes(session.file_size()) +
                                  " in " + directory.string());
            }
            return download_file(session, custom_path);
        },
        RetryConfig::fixed(max_retries, retry_delay),
        default_should_retry,
        [](uint32_t attempt, const QrDropError& e) {
            Logger::instance().warning("Download attempt {} failed: {}", attempt, e.what());
        },
        impl_->sleep);

    if (!validate_downloaded_file(path, session.file_size())) {
        throw QrDropError(ErrorCode::CorruptedFile, "Downloaded file validation failed: " + path.string());
    }
    return path;
}

std::filesystem::path TransferClient::download_file_with_retry(
    const TransferSession& session,
    const std::optional<std::filesystem::path>& custom_path) {
    return download_file_with_retry(session, custom_path, impl_->config.max_retries,
                                    std::chrono::milliseconds(impl_->config.retry_delay_ms));
}

bool TransferClient::validate_downloaded_file(const std::filesystem::path& path, uint64_t expected_size) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return false;
    }
    return size == expected_size;
}

bool TransferClient::has_enough_storage(uint64_t bytes) const {
    return has_enough_storage(bytes, download_directory());
}

bool TransferClient::has_enough_storage(uint64_t bytes, const std::filesystem::path& directory) const {
    std::error_code ec;
    std::filesystem::path probe = directory;
    while (!probe.empty() && !std::filesystem::exists(probe, ec)) {
        if (probe == probe.parent_path()) break;
        probe = probe.parent_path();
    }
    if (probe.empty()) {
        probe = std::filesystem::current_path(ec);
    }

    auto info = std::filesystem::space(probe, ec);
    if (ec) {
        Logger::instance().warning("Cannot determine free space at {}: {}", probe.string(), ec.message());
        return true;
    }

    uint64_t buffer = impl_->config.storage_buffer_mb * 1024ULL * 1024ULL;
    if (info.available <= bytes + buffer) {
        Logger::instance().warning("Insufficient storage: need {} plus {} buffer, {} available",
                                   format_bytes(bytes), format_bytes(buffer), format_bytes(info.available));
        return false;
    }
    return true;
}

void TransferClient::cancel_download() {
    if (!impl_->downloading.load() && !impl_->retrying.load()) {
        return;
    }
    impl_->cancelled.store(true);
    std::lock_guard<std::mutex> lock(impl_->connection_mutex);
    if (impl_->active_connection) {
        impl_->active_connection->shutdown();
    }
}

bool TransferClient::is_downloading() const {
    return impl_->downloading.load();
}

DownloadState TransferClient::state() const {
    return impl_->state.load();
}

ProgressChannel& TransferClient::progress() {
    return impl_->progress;
}

void TransferClient::set_sleep_function(SleepFunction sleep) {
    impl_->sleep = std::move(sleep);
}

} // namespace qrdrop
