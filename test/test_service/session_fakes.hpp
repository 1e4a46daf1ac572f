#ifndef TEST_SERVICE_SESSION_FAKES_HPP
#define TEST_SERVICE_SESSION_FAKES_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "service/stream_viewer.hpp"
#include "utils/clock.hpp"

// time only moves when someone sleeps on it or the test advances it
class FakeTimeSource: public utils::TimeSource {
public:
    [[nodiscard]] ClockPoint Now() const override {
        std::unique_lock<std::mutex> lock(_mutex);
        return _now;
    }
    void SleepFor(std::chrono::milliseconds duration) override {
        std::unique_lock<std::mutex> lock(_mutex);
        _now += duration;
        _slept += duration;
        _sleep_calls++;
    }
    void Advance(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(_mutex);
        _now += duration;
    }
    [[nodiscard]] std::chrono::milliseconds GetSlept() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _slept;
    }
    [[nodiscard]] int GetSleepCalls() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _sleep_calls;
    }
private:
    mutable std::mutex _mutex;
    ClockPoint _now = ClockPoint(std::chrono::hours(1));
    std::chrono::milliseconds _slept = std::chrono::milliseconds(0);
    int _sleep_calls = 0;
};

/*
 * scripted source: each connection plays the next recording in chunks of read_size, then fails
 * like a dropped connection. connects beyond the last recording are refused. with block_when_done
 * a finished connection waits for Cancel instead of failing.
 */
class FakeStreamSource: public infrastructure::StreamSource {
public:
    FakeStreamSource(std::vector<std::string> recordings, std::size_t read_size, bool block_when_done = false):
        _recordings(std::move(recordings)),
        _read_size(read_size),
        _block_when_done(block_when_done)
    {}

    void Connect() override {
        std::unique_lock<std::mutex> lock(_mutex);
        _connect_attempts++;
        if (_is_cancelled) {
            throw infrastructure::TransportError("FakeStreamSource: cancelled");
        }
        if (_next_recording >= _recordings.size()) {
            throw infrastructure::TransportError("FakeStreamSource: connection refused");
        }
        _current = _recordings[_next_recording++];
        _offset = 0;
        _connected = true;
    }

    [[nodiscard]] std::size_t ReadSome(uint8_t *data, std::size_t size) override {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_is_cancelled) {
            throw infrastructure::TransportError("FakeStreamSource: cancelled");
        }
        if (!_connected) {
            throw infrastructure::TransportError("FakeStreamSource: not connected");
        }
        if (_offset >= _current.size()) {
            if (!_block_when_done) {
                throw infrastructure::TransportError("FakeStreamSource: connection reset");
            }
            _blocked = true;
            _cancel_cv.wait(lock, [this]() { return _is_cancelled.load(); });
            throw infrastructure::TransportError("FakeStreamSource: cancelled");
        }
        const auto count = std::min({ size, _read_size, _current.size() - _offset });
        std::copy(_current.begin() + _offset, _current.begin() + _offset + count, data);
        _offset += count;
        return count;
    }

    void Disconnect() override {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_connected) {
            _disconnects++;
        }
        _connected = false;
    }

    void Cancel() override {
        std::unique_lock<std::mutex> lock(_mutex);
        _is_cancelled = true;
        _cancel_cv.notify_all();
    }

    void Resume() override {
        std::unique_lock<std::mutex> lock(_mutex);
        _is_cancelled = false;
    }

    [[nodiscard]] std::string GetBoundaryMarker() const override {
        return _announced_marker;
    }

    void SetAnnouncedMarker(std::string marker) {
        _announced_marker = std::move(marker);
    }
    [[nodiscard]] int GetConnectAttempts() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _connect_attempts;
    }
    [[nodiscard]] int GetDisconnects() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _disconnects;
    }
    [[nodiscard]] bool IsBlocked() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _blocked;
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cancel_cv;
    const std::vector<std::string> _recordings;
    const std::size_t _read_size;
    const bool _block_when_done;
    std::string _announced_marker;
    std::size_t _next_recording = 0;
    std::string _current;
    std::size_t _offset = 0;
    bool _connected = false;
    bool _blocked = false;
    std::atomic<bool> _is_cancelled = { false };
    int _connect_attempts = 0;
    int _disconnects = 0;
};

inline service::StreamViewerConfig make_viewer_config(
    infrastructure::StreamSourceType source_type,
    domain::FrameDimensions dimensions,
    std::optional<domain::FrameFormat> format,
    uint64_t tolerance,
    int port = 0,
    int backoff_ms = 500,
    std::string replay_file = ""
) {
    return service::StreamViewerConfig(
        source_type,
        "127.0.0.1", port, "/stream",
        std::move(replay_file),
        dimensions,
        format,
        tolerance,
        "",
        0,
        backoff_ms,
        16384,
        tolerance,
        2000,
        5000,
        1
    );
}

#endif //TEST_SERVICE_SESSION_FAKES_HPP
