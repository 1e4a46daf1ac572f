#include "stream_session.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace service {

    std::string ToString(const SessionState state) {
        switch (state) {
            case SessionState::IDLE:
                return "IDLE";
            case SessionState::CONNECTING:
                return "CONNECTING";
            case SessionState::CONNECTED:
                return "CONNECTED";
            case SessionState::FAILED:
                return "FAILED";
            case SessionState::BACKOFF:
                return "BACKOFF";
            case SessionState::STOPPED:
                return "STOPPED";
        }
        return "UNKNOWN";
    }

    std::size_t DefaultBufferCeiling(const domain::FrameDimensions &dimensions) {
        uint64_t largest = 0;
        for (const auto format : domain::DetectionOrder()) {
            largest = std::max(largest, domain::SizeFor(format, dimensions));
        }
        return static_cast<std::size_t>(largest * 2);
    }

    static std::string resolve_marker(const std::string &configured) {
        return configured.empty() ? infrastructure::StreamFramer::DefaultBoundaryMarker : configured;
    }

    std::shared_ptr<StreamSession> StreamSession::Create(const StreamSessionConfig &config) {
        return std::make_shared<StreamSession>(
            config,
            infrastructure::StreamSource::Create(config),
            utils::SteadyTimeSource::Create()
        );
    }

    StreamSession::StreamSession(
        const StreamSessionConfig &config,
        infrastructure::StreamSourcePtr source,
        utils::TimeSourcePtr time_source
    ):
        _dimensions(config.get_frame_dimensions()),
        _configured_format(config.get_frame_format()),
        _detector(config.get_detection_tolerance_bytes()),
        _configured_marker(config.get_stream_boundary_marker()),
        _backoff(config.get_session_backoff_ms()),
        _min_fragment_bytes(config.get_session_min_fragment_bytes()),
        _source(std::move(source)),
        _time_source(std::move(time_source)),
        _framer(resolve_marker(config.get_stream_boundary_marker()), config.get_stream_buffer_ceiling()),
        _read_buffer(std::max<std::size_t>(config.get_session_read_chunk_size(), 1)),
        _pinned_format(config.get_frame_format())
    {
        if (!_source) {
            throw std::invalid_argument("StreamSession: no stream source");
        }
        if (!_time_source) {
            throw std::invalid_argument("StreamSession: no time source");
        }
        if (_dimensions.PixelCount() == 0) {
            throw std::invalid_argument("StreamSession: frame dimensions must not be zero");
        }
        if (_configured_format.has_value()) {
            domain::ValidateDimensions(_configured_format.value(), _dimensions);
        }
        _statistics.current_pinned_format = _pinned_format;
    }

    StreamSession::~StreamSession() {
        Stop();
    }

    void StreamSession::Start() {
        if (_is_started) {
            return;
        }
        _is_started = true;
        _work_stop = false;
        _source->Resume();
        setState(SessionState::IDLE);

        auto self(shared_from_this());
        _work_thread = std::make_unique<std::thread>([this, s = std::move(self)]() mutable { run(); });
    }

    void StreamSession::Stop() {
        if (!_is_started) {
            return;
        }
        _work_stop = true;
        // a read blocked in the source would otherwise hold the join up until its timeout
        _source->Cancel();
        if (_work_thread) {
            if (_work_thread->joinable()) {
                _work_thread->join();
            }
            _work_thread.reset();
        }
        _source->Disconnect();
        setState(SessionState::STOPPED);
        _is_started = false;
    }

    void StreamSession::Unset() {
        _queue.Clear();
        _source.reset();
        _time_source.reset();
    }

    void StreamSession::run() {
        std::cout << "StreamSession::run: ingesting " << _dimensions.width << "x" << _dimensions.height <<
            " frames" << std::endl;
        while (Step() != SessionState::STOPPED) {}
        std::cout << "StreamSession::run: stopped" << std::endl;
    }

    SessionState StreamSession::Step() {
        if (_work_stop) {
            setState(SessionState::STOPPED);
            return SessionState::STOPPED;
        }
        switch (GetState()) {
            case SessionState::IDLE:
                setState(SessionState::CONNECTING);
                break;
            case SessionState::CONNECTING:
                connect();
                break;
            case SessionState::CONNECTED:
                readOnce();
                break;
            case SessionState::FAILED:
                fail();
                break;
            case SessionState::BACKOFF:
                backoff();
                break;
            case SessionState::STOPPED:
                break;
        }
        return GetState();
    }

    void StreamSession::connect() {
        try {
            _source->Connect();
        } catch (const infrastructure::TransportError &e) {
            _last_failure = e.what();
            setState(SessionState::FAILED);
            return;
        } catch (const std::exception &e) {
            _last_failure = std::string("unexpected: ") + e.what();
            setState(SessionState::FAILED);
            return;
        }

        const auto announced_marker = _source->GetBoundaryMarker();
        if (_configured_marker.empty() && !announced_marker.empty() &&
            announced_marker != _framer.GetBoundaryMarker()) {
            std::cout << "StreamSession::connect: adopting announced boundary " << announced_marker << std::endl;
            _framer.SetBoundaryMarker(announced_marker);
        } else {
            _framer.Reset();
        }

        const auto announced_dimensions = _source->GetAnnouncedDimensions();
        if (announced_dimensions.has_value() && !(announced_dimensions.value() == _dimensions)) {
            std::cerr << "StreamSession::connect: stream announces " << announced_dimensions->width << "x" <<
                announced_dimensions->height << " but " << _dimensions.width << "x" << _dimensions.height <<
                " is configured; payloads will be matched against the configured size" << std::endl;
        }

        pinFormat(_configured_format);
        _window_start = _time_source->Now();
        _window_frames = 0;
        setState(SessionState::CONNECTED);
    }

    void StreamSession::readOnce() {
        std::size_t bytes_read;
        try {
            bytes_read = _source->ReadSome(_read_buffer.data(), _read_buffer.size());
        } catch (const infrastructure::TransportError &e) {
            _last_failure = e.what();
            setState(SessionState::FAILED);
            return;
        } catch (const std::exception &e) {
            _last_failure = std::string("unexpected: ") + e.what();
            setState(SessionState::FAILED);
            return;
        }
        if (bytes_read == 0) {
            return;
        }

        auto payloads = _framer.Feed(_read_buffer.data(), bytes_read);
        {
            std::unique_lock<std::mutex> lock(_statistics_mutex);
            _statistics.buffer_overflows = _framer.GetOverflowCount();
        }
        for (auto &payload : payloads) {
            handlePayload(std::move(payload));
        }
    }

    void StreamSession::fail() {
        std::cerr << "StreamSession::fail: stream lost (" << _last_failure << "), reconnecting in " <<
            _backoff.count() << "ms" << std::endl;
        _source->Disconnect();
        _framer.Reset();
        {
            std::unique_lock<std::mutex> lock(_statistics_mutex);
            _statistics.reconnects++;
            _statistics.frames_per_second = 0.0;
        }
        _backoff_deadline = _time_source->Now() + _backoff;
        setState(SessionState::BACKOFF);
    }

    void StreamSession::backoff() {
        while (!_work_stop) {
            const auto now = _time_source->Now();
            if (now >= _backoff_deadline) {
                setState(SessionState::CONNECTING);
                return;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(_backoff_deadline - now);
            _time_source->SleepFor(std::max(std::chrono::milliseconds(1), std::min(remaining, BackoffSlice)));
        }
        setState(SessionState::STOPPED);
    }

    void StreamSession::handlePayload(infrastructure::FramePayload &&payload) {
        const auto size = payload.size();
        if (size < _min_fragment_bytes) {
            std::unique_lock<std::mutex> lock(_statistics_mutex);
            _statistics.noise_fragments++;
            if (_statistics.noise_fragments <= 3) {
                std::cout << "StreamSession::handlePayload: dropping " << size << " byte fragment as noise" <<
                    std::endl;
            }
            return;
        }

        auto format = _pinned_format;
        if (format.has_value()) {
            if (!_detector.Matches(format.value(), size, _dimensions)) {
                std::cerr << "StreamSession::handlePayload: unrecognized payload of " << size << " bytes, expected " <<
                    domain::SizeFor(format.value(), _dimensions) << " for " << domain::ToString(format.value()) <<
                    std::endl;
                std::unique_lock<std::mutex> lock(_statistics_mutex);
                _statistics.rejected_payloads++;
                return;
            }
        } else {
            format = _detector.Detect(size, _dimensions);
            if (!format.has_value()) {
                std::cerr << "StreamSession::handlePayload: unrecognized payload of " << size << " bytes" << std::endl;
                std::unique_lock<std::mutex> lock(_statistics_mutex);
                _statistics.rejected_payloads++;
                return;
            }
            std::cout << "StreamSession::handlePayload: detected " << domain::ToString(format.value()) <<
                " from " << size << " bytes, pinning it for this connection" << std::endl;
            pinFormat(format);
        }

        const auto expected = domain::SizeFor(format.value(), _dimensions);
        if (size < expected) {
            std::cerr << "StreamSession::handlePayload: truncated payload of " << size << " bytes, " <<
                domain::ToString(format.value()) << " needs " << expected << std::endl;
            std::unique_lock<std::mutex> lock(_statistics_mutex);
            _statistics.truncated_payloads++;
            return;
        }
        payload.resize(expected);

        auto frame = std::make_shared<const domain::RawFrame>(std::move(payload), _dimensions, format);
        _queue.Push(std::move(frame));
        countFrame();
    }

    void StreamSession::countFrame() {
        _window_frames++;
        const auto now = _time_source->Now();
        const auto elapsed = std::chrono::duration<double>(now - _window_start);
        std::unique_lock<std::mutex> lock(_statistics_mutex);
        _statistics.frames_received++;
        if (_statistics.frames_received <= 3) {
            std::cout << "StreamSession::countFrame: frame " << _statistics.frames_received << " received" << std::endl;
        }
        if (elapsed >= std::chrono::seconds(1)) {
            _statistics.frames_per_second = static_cast<double>(_window_frames) / elapsed.count();
            _window_frames = 0;
            _window_start = now;
        }
    }

    void StreamSession::setState(const SessionState state) {
        std::unique_lock<std::mutex> lock(_statistics_mutex);
        _statistics.state = state;
    }

    void StreamSession::pinFormat(const std::optional<domain::FrameFormat> format) {
        _pinned_format = format;
        std::unique_lock<std::mutex> lock(_statistics_mutex);
        _statistics.current_pinned_format = format;
    }

    domain::RawFramePtr StreamSession::PullLatest() {
        auto frame = _queue.PullLatest();
        if (!frame.has_value()) {
            return nullptr;
        }
        return std::move(frame.value());
    }

    SessionStatistics StreamSession::GetStatistics() const {
        SessionStatistics statistics;
        {
            std::unique_lock<std::mutex> lock(_statistics_mutex);
            statistics = _statistics;
        }
        statistics.dropped_frame_count = _queue.GetDroppedCount();
        return statistics;
    }

    SessionState StreamSession::GetState() const {
        std::unique_lock<std::mutex> lock(_statistics_mutex);
        return _statistics.state;
    }

    std::optional<domain::FrameFormat> StreamSession::GetPinnedFormat() const {
        std::unique_lock<std::mutex> lock(_statistics_mutex);
        return _statistics.current_pinned_format;
    }

}
