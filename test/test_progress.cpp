#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>
#include "qrdrop/transfer/progress.h"
#include "qrdrop/transfer/progress_channel.h"

using namespace qrdrop;
using namespace std::chrono_literals;

namespace {

TransferProgress frame_at(uint64_t bytes, uint64_t total, std::chrono::milliseconds elapsed) {
    auto start = TransferProgress::Clock::now();
    return TransferProgress(bytes, total, start, start + elapsed);
}

} // anonymous namespace

TEST_CASE("Start and complete frames", "[progress]") {
    for (uint64_t total : {1ULL, 1024ULL, 1048576ULL}) {
        auto start = TransferProgress::start(total);
        REQUIRE(start.percentage() == 0.0);
        REQUIRE_FALSE(start.is_complete());
        REQUIRE_FALSE(start.has_started());
        REQUIRE_FALSE(start.is_terminal());

        auto done = start.complete();
        REQUIRE(done.percentage() == 100.0);
        REQUIRE(done.is_complete());
        REQUIRE(done.state() == TransferState::Completed);
        REQUIRE(done.bytes_transferred() == total);
        REQUIRE(done.formatted_eta() == "Complete");
    }
}

TEST_CASE("Percentage of an empty file is zero", "[progress]") {
    auto start = TransferProgress::start(0);
    REQUIRE(start.percentage() == 0.0);
    REQUIRE_FALSE(start.is_complete());
}

TEST_CASE("Speed and ETA from elapsed time", "[progress][speed]") {
    auto frame = frame_at(5 * 1024 * 1024, 10 * 1024 * 1024, 5000ms);
    REQUIRE(frame.speed_bytes_per_second() == 1024.0 * 1024.0);
    REQUIRE(frame.estimated_time_remaining() == 5s);
    REQUIRE(frame.percentage() == 50.0);
    REQUIRE(frame.formatted_speed() == "1.0 MB/s");
    REQUIRE(frame.formatted_eta() == "5s");
    REQUIRE(frame.formatted_progress() == "5.0 MB / 10.0 MB (50.0%)");
}

TEST_CASE("No elapsed time means no speed", "[progress][speed]") {
    auto frame = frame_at(1000, 2000, 0ms);
    REQUIRE(frame.speed_bytes_per_second() == 0.0);
    REQUIRE(frame.estimated_time_remaining() == 0s);
    REQUIRE(frame.formatted_eta() == "Calculating...");
}

TEST_CASE("ETA formatting", "[progress][eta]") {
    // 1 KB/s with 150 KB left
    auto minutes = frame_at(10 * 1024, 160 * 1024, 10000ms);
    REQUIRE(minutes.estimated_time_remaining() == 150s);
    REQUIRE(minutes.formatted_eta() == "2m 30s");

    // 1 B/s with 7200 bytes left
    auto hours = frame_at(10, 7210, 10000ms);
    REQUIRE(hours.formatted_eta() == "2h 0m");
}

TEST_CASE("Updates keep the start time", "[progress]") {
    auto start = TransferProgress::start(100);
    auto later = start.update_progress(40, start.start_time() + 2s);
    REQUIRE(later.start_time() == start.start_time());
    REQUIRE(later.bytes_transferred() == 40);
    REQUIRE(later.speed_bytes_per_second() == 20.0);
    REQUIRE(later.state() == TransferState::InProgress);

    // Snapshots are values: the original is unchanged
    REQUIRE(start.bytes_transferred() == 0);
}

TEST_CASE("Aborted frame keeps the bytes moved", "[progress]") {
    auto frame = TransferProgress::start(100).update_progress(30).abort();
    REQUIRE(frame.is_aborted());
    REQUIRE(frame.is_terminal());
    REQUIRE_FALSE(frame.is_complete());
    REQUIRE(frame.bytes_transferred() == 30);
}

TEST_CASE("Byte formatting", "[progress][format]") {
    REQUIRE(format_bytes(512) == "512 B");
    REQUIRE(format_bytes(1536) == "1.5 KB");
    REQUIRE(format_bytes(1048576) == "1.0 MB");
    REQUIRE(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.0 GB");
}

TEST_CASE("Channel delivers to every subscriber", "[progress][channel]") {
    ProgressChannel channel;
    auto a = channel.subscribe();
    auto b = channel.subscribe();
    REQUIRE(channel.subscriber_count() == 2);

    auto frame = TransferProgress::start(10).update_progress(5);
    channel.publish(frame);

    REQUIRE(a->poll() == frame);
    REQUIRE(b->poll() == frame);
    REQUIRE_FALSE(a->poll().has_value());
}

TEST_CASE("Channel keeps only the latest frame for a slow subscriber", "[progress][channel]") {
    ProgressChannel channel;
    auto sub = channel.subscribe();

    auto base = TransferProgress::start(100);
    channel.publish(base.update_progress(10));
    channel.publish(base.update_progress(20));
    channel.publish(base.update_progress(30));

    auto frame = sub->poll();
    REQUIRE(frame.has_value());
    REQUIRE(frame->bytes_transferred() == 30);
    REQUIRE(sub->frames_published() == 3);
    REQUIRE_FALSE(sub->poll().has_value());
}

TEST_CASE("Late subscriber receives the latest frame", "[progress][channel]") {
    ProgressChannel channel;
    REQUIRE_FALSE(channel.latest().has_value());

    channel.publish(TransferProgress::start(100).update_progress(60));
    auto late = channel.subscribe();
    auto frame = late->poll();
    REQUIRE(frame.has_value());
    REQUIRE(frame->bytes_transferred() == 60);
}

TEST_CASE("Dropped subscriptions are pruned", "[progress][channel]") {
    ProgressChannel channel;
    auto keep = channel.subscribe();
    {
        auto temporary = channel.subscribe();
        REQUIRE(channel.subscriber_count() == 2);
    }
    channel.publish(TransferProgress::start(1));
    REQUIRE(channel.subscriber_count() == 1);
}

TEST_CASE("Waiting subscriber wakes on publish", "[progress][channel]") {
    ProgressChannel channel;
    auto sub = channel.subscribe();

    REQUIRE_FALSE(sub->wait_for_update(20ms).has_value());

    std::thread publisher([&channel] {
        std::this_thread::sleep_for(50ms);
        channel.publish(TransferProgress::start(10).complete());
    });
    auto frame = sub->wait_for_update(5s);
    publisher.join();

    REQUIRE(frame.has_value());
    REQUIRE(frame->state() == TransferState::Completed);
}

TEST_CASE("Concurrent publishers leave subscribers on the channel's latest frame", "[progress][channel]") {
    ProgressChannel channel;
    auto first = channel.subscribe();
    auto second = channel.subscribe();

    constexpr uint64_t kFramesPerThread = 2000;
    auto base = TransferProgress::start(4 * kFramesPerThread);
    std::vector<std::thread> publishers;
    for (uint64_t t = 0; t < 4; ++t) {
        publishers.emplace_back([&channel, &base, t] {
            for (uint64_t i = 1; i <= kFramesPerThread; ++i) {
                channel.publish(base.update_progress(t * kFramesPerThread + i));
            }
        });
    }
    for (auto& publisher : publishers) {
        publisher.join();
    }

    auto latest = channel.latest();
    REQUIRE(latest.has_value());
    REQUIRE(first->latest() == latest);
    REQUIRE(second->latest() == latest);

    channel.publish(latest->complete());
    REQUIRE(first->latest()->state() == TransferState::Completed);
    REQUIRE(second->latest()->state() == TransferState::Completed);
}
