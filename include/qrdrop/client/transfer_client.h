#ifndef QRDROP_CLIENT_TRANSFER_CLIENT_H
#define QRDROP_CLIENT_TRANSFER_CLIENT_H

#include "qrdrop/base/config.h"
#include "qrdrop/base/retry.h"
#include "qrdrop/session/transfer_session.h"
#include "qrdrop/transfer/progress_channel.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace qrdrop {

// Caller-facing lifecycle of one download
enum class DownloadState {
    Idle,
    Connecting,
    Downloading,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(DownloadState state);

// Body of GET /info/{sessionId}
struct FileInfo {
    std::string session_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::string content_type;
};

class TransferClient {
public:
    explicit TransferClient(const ClientConfig& config);
    virtual ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    // GET /health within the connect timeout. /health is unauthenticated, so the
    // token is only proven by /info or /file.
    bool validate_connection(const std::string& ip, uint16_t port, const std::string& token = "");

    // Single download: health check, /info, save path, streamed /file.
    // Returns the written path. A failed or cancelled download removes the partial file.
    // Throws QrDropError; InvalidState if another download is active on this client.
    virtual std::filesystem::path download_file(
        const TransferSession& session,
        const std::optional<std::filesystem::path>& custom_path = std::nullopt);

    // download_file() behind a storage check and fixed-delay retry, then a size check.
    // Storage is checked where the file will land: the custom path's directory, or
    // the download directory. InsufficientStorage aborts before any attempt; a size
    // mismatch throws CorruptedFile and is not retried here.
    std::filesystem::path download_file_with_retry(
        const TransferSession& session,
        const std::optional<std::filesystem::path>& custom_path,
        uint32_t max_retries,
        std::chrono::milliseconds retry_delay);

    // Uses ClientConfig::max_retries and retry_delay_ms
    std::filesystem::path download_file_with_retry(
        const TransferSession& session,
        const std::optional<std::filesystem::path>& custom_path = std::nullopt);

    FileInfo fetch_file_info(const TransferSession& session);

    std::filesystem::path resolve_save_path(
        const std::string& file_name,
        const std::optional<std::filesystem::path>& custom_path) const;

    bool validate_downloaded_file(const std::filesystem::path& path, uint64_t expected_size) const;

    // Free space in directory (or the nearest existing ancestor) must exceed bytes
    // plus the configured buffer. Returns true when the free space cannot be determined.
    virtual bool has_enough_storage(uint64_t bytes, const std::filesystem::path& directory) const;

    // Checks the download directory
    bool has_enough_storage(uint64_t bytes) const;

    // Shuts down the active connection. A retry loop waiting between attempts
    // stops before its next attempt. No-op when idle.
    void cancel_download();

    bool is_downloading() const;
    DownloadState state() const;

    ProgressChannel& progress();

    std::filesystem::path download_directory() const;

    void set_sleep_function(SleepFunction sleep);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrdrop

#endif // QRDROP_CLIENT_TRANSFER_CLIENT_H
