#include <doctest/doctest.h>
#include <memory>
#include <string>
#include <thread>

#include "utils/latest_frame_queue.hpp"

TEST_CASE("UTILS_LATEST_FRAME_QUEUE-Newest_Wins") {
    utils::LatestFrameQueue<std::string> queue;
    REQUIRE_FALSE(queue.PullLatest().has_value());

    REQUIRE_FALSE(queue.Push("F1"));
    REQUIRE(queue.Push("F2"));
    REQUIRE(queue.Push("F3"));

    const auto latest = queue.PullLatest();
    REQUIRE(latest.has_value());
    REQUIRE_EQ(latest.value(), "F3");
    REQUIRE_EQ(queue.GetDroppedCount(), 2);
    REQUIRE_EQ(queue.GetPushedCount(), 3);
    REQUIRE_EQ(queue.GetDeliveredCount(), 1);

    // delivered means gone
    REQUIRE_FALSE(queue.PullLatest().has_value());
    REQUIRE_FALSE(queue.HasPending());
}

TEST_CASE("UTILS_LATEST_FRAME_QUEUE-Clear_Counts_As_Dropped") {
    utils::LatestFrameQueue<std::shared_ptr<int>> queue;
    queue.Push(std::make_shared<int>(1));
    REQUIRE(queue.HasPending());
    queue.Clear();
    REQUIRE_FALSE(queue.HasPending());
    REQUIRE_EQ(queue.GetDroppedCount(), 1);
    queue.Clear();
    REQUIRE_EQ(queue.GetDroppedCount(), 1);
}

TEST_CASE("UTILS_LATEST_FRAME_QUEUE-Producer_And_Consumer_Threads") {
    utils::LatestFrameQueue<int> queue;
    const int frame_count = 10000;

    std::thread producer([&queue]() {
        for (int i = 1; i <= frame_count; i++) {
            queue.Push(int(i));
        }
    });

    int last_seen = 0;
    uint64_t pulled = 0;
    while (last_seen < frame_count) {
        const auto item = queue.PullLatest();
        if (!item.has_value()) {
            std::this_thread::yield();
            continue;
        }
        // never older than what we already saw
        REQUIRE(item.value() > last_seen);
        last_seen = item.value();
        pulled++;
    }
    producer.join();

    REQUIRE_EQ(queue.GetDroppedCount() + pulled, static_cast<uint64_t>(frame_count));
}
