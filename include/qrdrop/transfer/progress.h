#ifndef QRDROP_TRANSFER_PROGRESS_H
#define QRDROP_TRANSFER_PROGRESS_H

#include <chrono>
#include <cstdint>
#include <string>

namespace qrdrop {

enum class TransferState {
    InProgress,
    Completed,
    Aborted
};

std::string to_string(TransferState state);

// Immutable snapshot of a transfer; every transition returns a new value.
class TransferProgress {
public:
    using Clock = std::chrono::steady_clock;

    TransferProgress() = default;
    TransferProgress(uint64_t bytes_transferred,
                     uint64_t total_bytes,
                     Clock::time_point start_time,
                     Clock::time_point last_update_time,
                     TransferState state = TransferState::InProgress);

    static TransferProgress start(uint64_t total_bytes);

    TransferProgress update_progress(uint64_t bytes_transferred) const;
    TransferProgress update_progress(uint64_t bytes_transferred, Clock::time_point now) const;
    TransferProgress complete() const;
    // Terminal frame for a transfer that ended before all bytes were moved
    TransferProgress abort() const;

    uint64_t bytes_transferred() const { return bytes_transferred_; }
    uint64_t total_bytes() const { return total_bytes_; }
    Clock::time_point start_time() const { return start_time_; }
    Clock::time_point last_update_time() const { return last_update_time_; }
    TransferState state() const { return state_; }

    double percentage() const;
    bool is_complete() const;
    bool has_started() const { return bytes_transferred_ > 0; }
    bool is_terminal() const { return state_ != TransferState::InProgress; }
    bool is_aborted() const { return state_ == TransferState::Aborted; }

    double speed_bytes_per_second() const;
    std::chrono::seconds estimated_time_remaining() const;

    std::string formatted_speed() const;       // "1.5 MB/s"
    std::string formatted_eta() const;         // "2m 30s", "Complete", "Calculating..."
    std::string formatted_progress() const;    // "1.2 MB / 5.0 MB (24.0%)"
    std::string to_string() const;

    bool operator==(const TransferProgress& other) const = default;

private:
    uint64_t bytes_transferred_ = 0;
    uint64_t total_bytes_ = 0;
    Clock::time_point start_time_{};
    Clock::time_point last_update_time_{};
    TransferState state_ = TransferState::InProgress;
};

std::string format_bytes(uint64_t bytes);

} // namespace qrdrop

#endif // QRDROP_TRANSFER_PROGRESS_H
