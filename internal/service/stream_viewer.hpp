#ifndef SERVICE_STREAM_VIEWER_HPP
#define SERVICE_STREAM_VIEWER_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "stream_session.hpp"
#include "frame_consumer.hpp"

namespace service {

    struct StreamViewerConfig:
        public StreamSessionConfig,
        public FrameConsumerConfig
    {
        StreamViewerConfig(
            infrastructure::StreamSourceType stream_source_type,
            std::string stream_host, int stream_port, std::string stream_path,
            std::string stream_replay_file,
            domain::FrameDimensions frame_dimensions,
            std::optional<domain::FrameFormat> frame_format,
            uint64_t detection_tolerance_bytes,
            std::string stream_boundary_marker,
            std::size_t stream_buffer_ceiling,
            int session_backoff_ms,
            std::size_t session_read_chunk_size,
            std::size_t session_min_fragment_bytes,
            int stream_connect_timeout_ms,
            int stream_read_timeout_ms,
            int consumer_poll_interval_ms
        ):
            _stream_source_type(stream_source_type),
            _stream_host(std::move(stream_host)),
            _stream_port(stream_port),
            _stream_path(std::move(stream_path)),
            _stream_replay_file(std::move(stream_replay_file)),
            _frame_dimensions(frame_dimensions),
            _frame_format(frame_format),
            _detection_tolerance_bytes(detection_tolerance_bytes),
            _stream_boundary_marker(std::move(stream_boundary_marker)),
            _stream_buffer_ceiling(stream_buffer_ceiling),
            _session_backoff_ms(session_backoff_ms),
            _session_read_chunk_size(session_read_chunk_size),
            _session_min_fragment_bytes(session_min_fragment_bytes),
            _stream_connect_timeout_ms(stream_connect_timeout_ms),
            _stream_read_timeout_ms(stream_read_timeout_ms),
            _consumer_poll_interval_ms(consumer_poll_interval_ms)
        {}
        [[nodiscard]] infrastructure::StreamSourceType get_stream_source_type() const override {
            return _stream_source_type;
        }
        [[nodiscard]] std::string get_stream_host() const override {
            return _stream_host;
        }
        [[nodiscard]] int get_stream_port() const override {
            return _stream_port;
        }
        [[nodiscard]] std::string get_stream_path() const override {
            return _stream_path;
        }
        [[nodiscard]] std::string get_stream_replay_file() const override {
            return _stream_replay_file;
        }
        [[nodiscard]] int get_stream_connect_timeout_ms() const override {
            return _stream_connect_timeout_ms;
        }
        [[nodiscard]] int get_stream_read_timeout_ms() const override {
            return _stream_read_timeout_ms;
        }
        [[nodiscard]] domain::FrameDimensions get_frame_dimensions() const override {
            return _frame_dimensions;
        }
        [[nodiscard]] std::optional<domain::FrameFormat> get_frame_format() const override {
            return _frame_format;
        }
        [[nodiscard]] uint64_t get_detection_tolerance_bytes() const override {
            return _detection_tolerance_bytes;
        }
        [[nodiscard]] std::string get_stream_boundary_marker() const override {
            return _stream_boundary_marker;
        }
        // 0 picks two frames of the largest format
        [[nodiscard]] std::size_t get_stream_buffer_ceiling() const override {
            if (_stream_buffer_ceiling == 0) {
                return DefaultBufferCeiling(_frame_dimensions);
            }
            return _stream_buffer_ceiling;
        }
        [[nodiscard]] int get_session_backoff_ms() const override {
            return _session_backoff_ms;
        }
        [[nodiscard]] std::size_t get_session_read_chunk_size() const override {
            return _session_read_chunk_size;
        }
        [[nodiscard]] std::size_t get_session_min_fragment_bytes() const override {
            return _session_min_fragment_bytes;
        }
        [[nodiscard]] int get_consumer_poll_interval_ms() const override {
            return _consumer_poll_interval_ms;
        }
    private:
        const infrastructure::StreamSourceType _stream_source_type;
        const std::string _stream_host;
        const int _stream_port;
        const std::string _stream_path;
        const std::string _stream_replay_file;
        const domain::FrameDimensions _frame_dimensions;
        const std::optional<domain::FrameFormat> _frame_format;
        const uint64_t _detection_tolerance_bytes;
        const std::string _stream_boundary_marker;
        const std::size_t _stream_buffer_ceiling;
        const int _session_backoff_ms;
        const std::size_t _session_read_chunk_size;
        const std::size_t _session_min_fragment_bytes;
        const int _stream_connect_timeout_ms;
        const int _stream_read_timeout_ms;
        const int _consumer_poll_interval_ms;
    };

    // ingestion and consumer tasks wired through the session's latest frame slot
    class StreamViewer: public std::enable_shared_from_this<StreamViewer> {
    public:
        static std::shared_ptr<StreamViewer> Create(const StreamViewerConfig &config, PixelGridCallback grid_callback);
        StreamViewer(): _is_started(false) {}
        void Start() {
            if (_is_started) {
                return;
            }
            _session->Start();
            _consumer->Start();
            _is_started = true;
        }
        void Stop() {
            if (!_is_started) {
                return;
            }
            _consumer->Stop();
            _session->Stop();
            _is_started = false;
        }
        void Unset() {
            _consumer->Unset();
            _session->Unset();
            _consumer.reset();
            _session.reset();
        }
        [[nodiscard]] SessionStatistics GetStatistics() const {
            return _session->GetStatistics();
        }
        [[nodiscard]] uint64_t GetDecodedCount() const {
            return _consumer->GetDecodedCount();
        }
        [[nodiscard]] uint64_t GetFailedCount() const {
            return _consumer->GetFailedCount();
        }
    private:
        void initialize(const StreamViewerConfig &config, PixelGridCallback grid_callback);
        std::atomic_bool _is_started = false;
        std::shared_ptr<StreamSession> _session = nullptr;
        std::shared_ptr<FrameConsumer> _consumer = nullptr;
    };
}

#endif //SERVICE_STREAM_VIEWER_HPP
