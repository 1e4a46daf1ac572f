#include "stream_viewer.hpp"

namespace service {

    std::shared_ptr<StreamViewer> StreamViewer::Create(
        const StreamViewerConfig &config, PixelGridCallback grid_callback
    ) {
        auto stream_viewer = std::make_shared<StreamViewer>();
        stream_viewer->initialize(config, std::move(grid_callback));
        return stream_viewer;
    }

    void StreamViewer::initialize(const StreamViewerConfig &config, PixelGridCallback grid_callback) {
        _session = StreamSession::Create(config);
        _consumer = FrameConsumer::Create(config, _session, std::move(grid_callback));
    }
}
