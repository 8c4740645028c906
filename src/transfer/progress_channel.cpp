#include "qrdrop/transfer/progress_channel.h"
#include <algorithm>

namespace qrdrop {

std::optional<TransferProgress> ProgressSubscription::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::optional<TransferProgress> ProgressSubscription::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (published_ == consumed_) {
        return std::nullopt;
    }
    consumed_ = published_;
    return latest_;
}

std::optional<TransferProgress> ProgressSubscription::wait_for_update(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return published_ != consumed_; })) {
        return std::nullopt;
    }
    consumed_ = published_;
    return latest_;
}

uint64_t ProgressSubscription::frames_published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

void ProgressSubscription::deliver(const TransferProgress& progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = progress;
        ++published_;
    }
    cv_.notify_all();
}

std::shared_ptr<ProgressSubscription> ProgressChannel::subscribe() {
    auto subscription = std::make_shared<ProgressSubscription>();
    std::lock_guard<std::mutex> lock(mutex_);
    if (latest_) {
        subscription->deliver(*latest_);
    }
    subscribers_.push_back(subscription);
    return subscription;
}

void ProgressChannel::publish(const TransferProgress& progress) {
    // Delivery stays under the channel lock so concurrent publishers reach every
    // subscriber in the same order as latest_
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = progress;
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [](const std::weak_ptr<ProgressSubscription>& w) { return w.expired(); }),
        subscribers_.end());
    for (const auto& weak : subscribers_) {
        if (auto sub = weak.lock()) {
            sub->deliver(progress);
        }
    }
}

std::optional<TransferProgress> ProgressChannel::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

size_t ProgressChannel::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& weak : subscribers_) {
        if (!weak.expired()) ++count;
    }
    return count;
}

} // namespace qrdrop
