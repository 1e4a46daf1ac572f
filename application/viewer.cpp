#include "config.hpp"
#include "runtime.hpp"

#include "service/stream_viewer.hpp"

#include <atomic>
#include <iomanip>
#include <iostream>

static infrastructure::StreamSourceType to_stream_source_type(const std::string& type) {
    if (type == "HTTP") return infrastructure::StreamSourceType::HTTP;
    else if (type == "FILE") return infrastructure::StreamSourceType::FILE;
    throw std::runtime_error("Unknown stream source type: " + type);
}

int main(int argc, char* argv[]) {

    auto config = application::get_json_config(application::AppType::VIEWER, argc, argv);

    const uint64_t tolerance = config.value("detectionToleranceBytes", 1000);
    const service::StreamViewerConfig viewer_config(
        to_stream_source_type(config.value("sourceType", "HTTP")),
        config.value("streamHost", "192.168.4.1"),
        config.value("streamPort", 80),
        config.value("streamPath", "/stream"),
        application::resolve_config_path(config.value("replayFile", "")).string(),
        application::get_frame_dimensions(config),
        application::get_frame_format(config),
        tolerance,
        config.value("boundaryMarker", ""),
        config.value("bufferCeilingBytes", 0),
        config.value("reconnectBackoffMs", 500),
        config.value("readChunkBytes", 131072),
        config.value("minFragmentBytes", tolerance),
        config.value("connectTimeoutMs", 10000),
        config.value("readTimeoutMs", 10000),
        config.value("pollIntervalMs", 5)
    );

    // color reconstruction sits behind this callback; the viewer only reports what arrives
    std::atomic<uint64_t> grids_seen = { 0 };
    auto viewer = service::StreamViewer::Create(
        viewer_config,
        [&grids_seen](domain::PixelGridPtr &&grid) {
            if (grids_seen++ == 0) {
                std::cout << "viewer: first grid " << grid->GetWidth() << "x" << grid->GetHeight() << "x" <<
                    grid->GetChannels() << " at " << grid->GetBitDepth() << " bits" << std::endl;
            }
        }
    );
    viewer->Start();

    application::WaitForShutdown([&viewer]() {
        const auto statistics = viewer->GetStatistics();
        std::cout << "viewer: " << service::ToString(statistics.state) << ", " <<
            std::fixed << std::setprecision(1) << statistics.frames_per_second << " fps, " <<
            statistics.frames_received << " received, " <<
            statistics.dropped_frame_count << " dropped, " <<
            viewer->GetDecodedCount() << " decoded, " <<
            statistics.reconnects << " reconnects, format " <<
            (statistics.current_pinned_format ? domain::ToString(*statistics.current_pinned_format) : "none") <<
            std::endl;
    });

    viewer->Stop();
    viewer->Unset();
}
