#include <doctest/doctest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
using namespace std::literals;

#include "service/frame_consumer.hpp"
#include "service/stream_viewer.hpp"
#include "session_fakes.hpp"
#include "test_domain/frame_packing.hpp"
#include "test_infrastructure/test_stream/multipart.hpp"

class TestConsumerConfig: public service::FrameConsumerConfig {
public:
    [[nodiscard]] int get_consumer_poll_interval_ms() const override {
        return 1;
    }
};

static const domain::FrameDimensions small_frame = { 64, 16 };

TEST_CASE("SERVICE_FRAME_CONSUMER-Decodes_The_Newest_Frame") {
    const auto first = make_ramp(64 * 16, 1023, 1);
    const auto second = make_ramp(64 * 16, 1023, 2);
    auto source = std::make_shared<FakeStreamSource>(
        std::vector<std::string>{
            make_multipart({ pack_raw10_5_per_4(first), pack_raw10_5_per_4(second) })
        },
        4096
    );
    auto clock = std::make_shared<FakeTimeSource>();
    const auto config = make_viewer_config(
        infrastructure::StreamSourceType::FILE, small_frame, std::nullopt, 100
    );
    auto session = std::make_shared<service::StreamSession>(config, source, clock);

    std::vector<domain::PixelGridPtr> posted;
    const TestConsumerConfig consumer_config;
    auto consumer = std::make_shared<service::FrameConsumer>(
        consumer_config,
        session,
        [&posted](domain::PixelGridPtr &&grid) {
            posted.push_back(std::move(grid));
        },
        clock
    );

    // nothing yet: no wait, no grid
    REQUIRE_FALSE(consumer->PollOnce());
    REQUIRE(consumer->GetLastGrid() == nullptr);

    while (session->Step() != service::SessionState::FAILED) {}

    REQUIRE(consumer->PollOnce());
    REQUIRE_EQ(posted.size(), 1);
    REQUIRE_EQ(posted[0]->GetWidth(), 64);
    REQUIRE_EQ(posted[0]->GetHeight(), 16);
    // the first frame was replaced before anyone looked at it
    REQUIRE(posted[0]->GetSamples() == second);

    // nothing new keeps the last grid around
    REQUIRE_FALSE(consumer->PollOnce());
    REQUIRE(consumer->GetLastGrid() == posted[0]);
    REQUIRE_EQ(consumer->GetDecodedCount(), 1);
    REQUIRE_EQ(consumer->GetFailedCount(), 0);
    REQUIRE_EQ(session->GetStatistics().dropped_frame_count, 1);
}

TEST_CASE("SERVICE_FRAME_CONSUMER-Runs_On_Its_Own_Thread") {
    auto source = std::make_shared<FakeStreamSource>(
        std::vector<std::string>{ make_multipart({ std::vector<uint8_t>(1024, 0x80) }) }, 4096, true
    );
    const auto config = make_viewer_config(
        infrastructure::StreamSourceType::FILE, small_frame, std::nullopt, 100
    );
    auto session = std::make_shared<service::StreamSession>(config, source, utils::SteadyTimeSource::Create());

    std::atomic<int> grids = { 0 };
    auto consumer = service::FrameConsumer::Create(
        TestConsumerConfig(),
        session,
        [&grids](domain::PixelGridPtr &&grid) {
            grids++;
        }
    );
    session->Start();
    consumer->Start();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (grids == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    consumer->Stop();
    session->Stop();

    REQUIRE_EQ(grids.load(), 1);
    const auto grid = consumer->GetLastGrid();
    REQUIRE(grid != nullptr);
    // raw8 widened to 10 bits
    REQUIRE_EQ(grid->GetBitDepth(), 10);
    REQUIRE_EQ(grid->At(0, 0), 0x80 << 2);
}

TEST_CASE("SERVICE_STREAM_VIEWER-Replays_A_Recording") {
    std::vector<std::vector<uint8_t>> frames;
    for (uint32_t seed = 0; seed < 5; seed++) {
        frames.push_back(pack_raw10_5_per_4(make_ramp(64 * 16, 1023, seed)));
    }
    const auto recording = std::filesystem::temp_directory_path() / "rawstream_viewer_replay.bin";
    {
        const auto contents = make_multipart(frames);
        std::ofstream out(recording, std::ios::out | std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    const auto config = make_viewer_config(
        infrastructure::StreamSourceType::FILE, small_frame, std::nullopt, 100, 0, 20, recording.string()
    );
    std::atomic<int> grids = { 0 };
    auto viewer = service::StreamViewer::Create(config, [&grids](domain::PixelGridPtr &&grid) {
        if (grid->GetWidth() == 64 && grid->GetHeight() == 16) {
            grids++;
        }
    });
    viewer->Start();

    // the end of the recording is a dropped connection, so the replay starts over
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (viewer->GetStatistics().reconnects < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    viewer->Stop();

    const auto statistics = viewer->GetStatistics();
    REQUIRE(statistics.reconnects >= 2);
    REQUIRE(statistics.frames_received >= 10);
    REQUIRE_EQ(statistics.rejected_payloads, 0);
    REQUIRE(grids.load() > 0);
    REQUIRE_EQ(viewer->GetFailedCount(), 0);
    viewer->Unset();

    std::filesystem::remove(recording);
}
