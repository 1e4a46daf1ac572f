#ifndef SERVICE_FRAME_CONSUMER_HPP
#define SERVICE_FRAME_CONSUMER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "domain/frame_decoder.hpp"
#include "utils/clock.hpp"
#include "stream_session.hpp"

namespace service {

    struct FrameConsumerConfig {
        [[nodiscard]] virtual int get_consumer_poll_interval_ms() const = 0;
    };

    typedef std::function<void(domain::PixelGridPtr&&)> PixelGridCallback;

    /*
     * the consumer task: polls the session for the newest frame, decodes it and hands the grid to
     * whatever does color reconstruction. when nothing new arrived it keeps the last grid around.
     */
    class FrameConsumer: public std::enable_shared_from_this<FrameConsumer> {
    public:
        [[nodiscard]] static std::shared_ptr<FrameConsumer> Create(
            const FrameConsumerConfig &config,
            std::shared_ptr<StreamSession> session,
            PixelGridCallback grid_callback
        );
        FrameConsumer(
            const FrameConsumerConfig &config,
            std::shared_ptr<StreamSession> session,
            PixelGridCallback grid_callback,
            utils::TimeSourcePtr time_source
        );
        FrameConsumer (const FrameConsumer&) = delete;
        FrameConsumer& operator= (const FrameConsumer&) = delete;
        ~FrameConsumer();

        void Start();
        void Stop();
        void Unset();

        // one poll; returns true if a new frame was decoded and posted
        bool PollOnce();

        [[nodiscard]] domain::PixelGridPtr GetLastGrid() const;
        [[nodiscard]] uint64_t GetDecodedCount() const {
            return _decoded_count;
        }
        [[nodiscard]] uint64_t GetFailedCount() const {
            return _failed_count;
        }
    private:
        void run();

        const std::chrono::milliseconds _poll_interval;
        domain::FrameDecoder _decoder;
        std::shared_ptr<StreamSession> _session;
        PixelGridCallback _grid_callback;
        utils::TimeSourcePtr _time_source;

        mutable std::mutex _last_grid_mutex;
        domain::PixelGridPtr _last_grid = nullptr;

        std::atomic<uint64_t> _decoded_count = { 0 };
        std::atomic<uint64_t> _failed_count = { 0 };

        std::unique_ptr<std::thread> _work_thread;
        std::atomic<bool> _work_stop = { true };
    };

}

#endif //SERVICE_FRAME_CONSUMER_HPP
