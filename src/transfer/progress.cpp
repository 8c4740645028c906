#include "qrdrop/transfer/progress.h"
#include <fmt/format.h>
#include <cmath>

namespace qrdrop {

namespace {

constexpr double kKiB = 1024.0;
constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

} // anonymous namespace

std::string to_string(TransferState state) {
    switch (state) {
        case TransferState::InProgress: return "in_progress";
        case TransferState::Completed: return "completed";
        case TransferState::Aborted: return "aborted";
        default: return "unknown";
    }
}

std::string format_bytes(uint64_t bytes) {
    double value = static_cast<double>(bytes);
    if (value >= kGiB) return fmt::format("{:.1f} GB", value / kGiB);
    if (value >= kMiB) return fmt::format("{:.1f} MB", value / kMiB);
    if (value >= kKiB) return fmt::format("{:.1f} KB", value / kKiB);
    return fmt::format("{} B", bytes);
}

TransferProgress::TransferProgress(uint64_t bytes_transferred,
                                   uint64_t total_bytes,
                                   Clock::time_point start_time,
                                   Clock::time_point last_update_time,
                                   TransferState state)
    : bytes_transferred_(bytes_transferred),
      total_bytes_(total_bytes),
      start_time_(start_time),
      last_update_time_(last_update_time),
      state_(state) {}

TransferProgress TransferProgress::start(uint64_t total_bytes) {
    auto now = Clock::now();
    return TransferProgress(0, total_bytes, now, now);
}

TransferProgress TransferProgress::update_progress(uint64_t bytes_transferred) const {
    return update_progress(bytes_transferred, Clock::now());
}

TransferProgress TransferProgress::update_progress(uint64_t bytes_transferred,
                                                   Clock::time_point now) const {
    return TransferProgress(bytes_transferred, total_bytes_, start_time_, now, state_);
}

TransferProgress TransferProgress::complete() const {
    return TransferProgress(total_bytes_, total_bytes_, start_time_, Clock::now(),
                            TransferState::Completed);
}

TransferProgress TransferProgress::abort() const {
    return TransferProgress(bytes_transferred_, total_bytes_, start_time_, Clock::now(),
                            TransferState::Aborted);
}

double TransferProgress::percentage() const {
    if (total_bytes_ == 0) return 0.0;
    return static_cast<double>(bytes_transferred_) / static_cast<double>(total_bytes_) * 100.0;
}

bool TransferProgress::is_complete() const {
    return total_bytes_ > 0 && bytes_transferred_ >= total_bytes_;
}

double TransferProgress::speed_bytes_per_second() const {
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        last_update_time_ - start_time_).count();
    if (elapsed_ms <= 0) return 0.0;
    return static_cast<double>(bytes_transferred_) / (static_cast<double>(elapsed_ms) / 1000.0);
}

std::chrono::seconds TransferProgress::estimated_time_remaining() const {
    double speed = speed_bytes_per_second();
    if (is_complete() || speed <= 0.0 || bytes_transferred_ >= total_bytes_) {
        return std::chrono::seconds(0);
    }
    double remaining = static_cast<double>(total_bytes_ - bytes_transferred_);
    return std::chrono::seconds(static_cast<int64_t>(std::llround(remaining / speed)));
}

std::string TransferProgress::formatted_speed() const {
    double speed = speed_bytes_per_second();
    if (speed >= kMiB) return fmt::format("{:.1f} MB/s", speed / kMiB);
    if (speed >= kKiB) return fmt::format("{:.1f} KB/s", speed / kKiB);
    return fmt::format("{:.0f} B/s", speed);
}

std::string TransferProgress::formatted_eta() const {
    if (is_complete()) return "Complete";

    auto eta = estimated_time_remaining().count();
    if (eta == 0) return "Calculating...";

    auto hours = eta / 3600;
    auto minutes = (eta / 60) % 60;
    auto seconds = eta % 60;

    if (hours > 0) return fmt::format("{}h {}m", hours, minutes);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, seconds);
    return fmt::format("{}s", seconds);
}

std::string TransferProgress::formatted_progress() const {
    return fmt::format("{} / {} ({:.1f}%)",
                       format_bytes(bytes_transferred_), format_bytes(total_bytes_), percentage());
}

std::string TransferProgress::to_string() const {
    return fmt::format("TransferProgress({}, {}, ETA: {}, {})",
                       formatted_progress(), formatted_speed(), formatted_eta(),
                       qrdrop::to_string(state_));
}

} // namespace qrdrop
