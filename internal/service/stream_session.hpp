#ifndef SERVICE_STREAM_SESSION_HPP
#define SERVICE_STREAM_SESSION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "domain/frame.hpp"
#include "domain/format_detector.hpp"
#include "infrastructure/stream/stream_framer.hpp"
#include "infrastructure/stream/stream_source.hpp"
#include "utils/clock.hpp"
#include "utils/latest_frame_queue.hpp"

namespace service {

    struct FrameDecoderConfig {
        [[nodiscard]] virtual domain::FrameDimensions get_frame_dimensions() const = 0;
        // nullopt means detect from the payload size
        [[nodiscard]] virtual std::optional<domain::FrameFormat> get_frame_format() const = 0;
        [[nodiscard]] virtual uint64_t get_detection_tolerance_bytes() const = 0;
    };

    // an empty boundary marker means whatever the source announces, or the default marker
    struct StreamSessionConfig:
        public FrameDecoderConfig,
        public infrastructure::StreamFramerConfig,
        public infrastructure::StreamSourceConfig
    {
        [[nodiscard]] virtual int get_session_backoff_ms() const = 0;
        [[nodiscard]] virtual std::size_t get_session_read_chunk_size() const = 0;
        // payloads smaller than this are keep-alive noise, not frames
        [[nodiscard]] virtual std::size_t get_session_min_fragment_bytes() const = 0;
    };

    enum class SessionState {
        IDLE,
        CONNECTING,
        CONNECTED,
        FAILED,
        BACKOFF,
        STOPPED,
    };

    [[nodiscard]] std::string ToString(SessionState state);

    struct SessionStatistics {
        double frames_per_second = 0.0;
        uint64_t dropped_frame_count = 0;
        std::optional<domain::FrameFormat> current_pinned_format = std::nullopt;
        uint64_t frames_received = 0;
        uint64_t noise_fragments = 0;
        uint64_t rejected_payloads = 0;
        uint64_t truncated_payloads = 0;
        uint64_t buffer_overflows = 0;
        uint64_t reconnects = 0;
        SessionState state = SessionState::IDLE;
    };

    // two frames of the largest format that fits the dimensions
    [[nodiscard]] std::size_t DefaultBufferCeiling(const domain::FrameDimensions &dimensions);

    /*
     * one logical stream: connect, frame, validate, hand the newest frame over, and reconnect with
     * backoff whenever the transport gives out. Step advances the state machine by one transition
     * (or one read while connected); Start runs Step on the ingestion thread until Stop.
     */
    class StreamSession: public std::enable_shared_from_this<StreamSession> {
    public:
        static constexpr std::chrono::milliseconds BackoffSlice = std::chrono::milliseconds(50);

        [[nodiscard]] static std::shared_ptr<StreamSession> Create(const StreamSessionConfig &config);
        StreamSession(
            const StreamSessionConfig &config,
            infrastructure::StreamSourcePtr source,
            utils::TimeSourcePtr time_source
        );
        StreamSession (const StreamSession&) = delete;
        StreamSession& operator= (const StreamSession&) = delete;
        ~StreamSession();

        void Start();
        void Stop();
        void Unset();

        SessionState Step();

        // newest frame not handed out yet, nullptr if there is none
        [[nodiscard]] domain::RawFramePtr PullLatest();
        [[nodiscard]] SessionStatistics GetStatistics() const;
        [[nodiscard]] SessionState GetState() const;
        [[nodiscard]] std::optional<domain::FrameFormat> GetPinnedFormat() const;
        [[nodiscard]] const domain::FrameDimensions &GetDimensions() const {
            return _dimensions;
        }
    private:
        void run();
        void connect();
        void readOnce();
        void fail();
        void backoff();
        void handlePayload(infrastructure::FramePayload &&payload);
        void countFrame();
        void setState(SessionState state);
        void pinFormat(std::optional<domain::FrameFormat> format);

        const domain::FrameDimensions _dimensions;
        const std::optional<domain::FrameFormat> _configured_format;
        const domain::FormatDetector _detector;
        const std::string _configured_marker;
        const std::chrono::milliseconds _backoff;
        const std::size_t _min_fragment_bytes;

        infrastructure::StreamSourcePtr _source;
        utils::TimeSourcePtr _time_source;
        infrastructure::StreamFramer _framer;
        std::vector<uint8_t> _read_buffer;
        utils::LatestFrameQueue<domain::RawFramePtr> _queue;

        // only touched from the thread that steps the session
        std::optional<domain::FrameFormat> _pinned_format;
        ClockPoint _backoff_deadline;
        ClockPoint _window_start;
        uint64_t _window_frames = 0;
        std::string _last_failure;

        mutable std::mutex _statistics_mutex;
        SessionStatistics _statistics;

        std::unique_ptr<std::thread> _work_thread;
        std::atomic<bool> _work_stop = { false };
        std::atomic_bool _is_started = false;
    };

}

#endif //SERVICE_STREAM_SESSION_HPP
