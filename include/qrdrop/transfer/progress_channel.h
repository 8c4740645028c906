#ifndef QRDROP_TRANSFER_PROGRESS_CHANNEL_H
#define QRDROP_TRANSFER_PROGRESS_CHANNEL_H

#include "qrdrop/transfer/progress.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace qrdrop {

// One subscriber's view of a ProgressChannel. Holds only the newest frame;
// a frame that was not consumed before the next publish is replaced.
class ProgressSubscription {
public:
    std::optional<TransferProgress> latest() const;

    // Returns the newest frame not yet consumed by this subscriber, if any
    std::optional<TransferProgress> poll();

    // Waits up to timeout for a frame not yet consumed
    std::optional<TransferProgress> wait_for_update(std::chrono::milliseconds timeout);

    uint64_t frames_published() const;

private:
    friend class ProgressChannel;

    void deliver(const TransferProgress& progress);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<TransferProgress> latest_;
    uint64_t published_ = 0;
    uint64_t consumed_ = 0;
};

// Multi-consumer broadcast of TransferProgress snapshots. publish() never waits
// for a subscriber to consume; subscriptions dropped by their owner are pruned.
// Every subscriber observes concurrent publishes in one order.
class ProgressChannel {
public:
    // New subscribers start with the most recent frame, if one was published
    std::shared_ptr<ProgressSubscription> subscribe();

    void publish(const TransferProgress& progress);

    std::optional<TransferProgress> latest() const;
    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<TransferProgress> latest_;
    std::vector<std::weak_ptr<ProgressSubscription>> subscribers_;
};

} // namespace qrdrop

#endif // QRDROP_TRANSFER_PROGRESS_CHANNEL_H
