#include "frame_consumer.hpp"

#include <iostream>
#include <stdexcept>

namespace service {

    std::shared_ptr<FrameConsumer> FrameConsumer::Create(
        const FrameConsumerConfig &config,
        std::shared_ptr<StreamSession> session,
        PixelGridCallback grid_callback
    ) {
        return std::make_shared<FrameConsumer>(
            config, std::move(session), std::move(grid_callback), utils::SteadyTimeSource::Create()
        );
    }

    FrameConsumer::FrameConsumer(
        const FrameConsumerConfig &config,
        std::shared_ptr<StreamSession> session,
        PixelGridCallback grid_callback,
        utils::TimeSourcePtr time_source
    ):
        _poll_interval(config.get_consumer_poll_interval_ms()),
        _session(std::move(session)),
        _grid_callback(std::move(grid_callback)),
        _time_source(std::move(time_source))
    {
        if (!_session) {
            throw std::invalid_argument("FrameConsumer: no stream session to consume");
        }
    }

    FrameConsumer::~FrameConsumer() {
        Stop();
    }

    void FrameConsumer::Start() {
        if (!_work_stop) {
            return;
        }
        _work_stop = false;

        auto self(shared_from_this());
        _work_thread = std::make_unique<std::thread>([this, s = std::move(self)]() mutable { run(); });
    }

    void FrameConsumer::Stop() {
        if (_work_stop) {
            return;
        }
        _work_stop = true;
        if (_work_thread) {
            if (_work_thread->joinable()) {
                _work_thread->join();
            }
            _work_thread.reset();
        }
    }

    void FrameConsumer::Unset() {
        _session.reset();
        _grid_callback = nullptr;
        std::unique_lock<std::mutex> lock(_last_grid_mutex);
        _last_grid.reset();
    }

    void FrameConsumer::run() {
        while (!_work_stop) {
            if (!PollOnce()) {
                _time_source->SleepFor(_poll_interval);
            }
        }
    }

    bool FrameConsumer::PollOnce() {
        if (!_session) {
            return false;
        }
        auto frame = _session->PullLatest();
        if (frame == nullptr) {
            return false;
        }

        domain::PixelGridPtr grid;
        try {
            grid = _decoder.Decode(*frame);
        } catch (const domain::DecodeError &e) {
            _failed_count++;
            std::cerr << "FrameConsumer::PollOnce: skipping frame: " << e.what() << std::endl;
            return false;
        } catch (const std::invalid_argument &e) {
            _failed_count++;
            std::cerr << "FrameConsumer::PollOnce: skipping frame: " << e.what() << std::endl;
            return false;
        }

        _decoded_count++;
        {
            std::unique_lock<std::mutex> lock(_last_grid_mutex);
            _last_grid = grid;
        }
        if (_grid_callback) {
            _grid_callback(std::move(grid));
        }
        return true;
    }

    domain::PixelGridPtr FrameConsumer::GetLastGrid() const {
        std::unique_lock<std::mutex> lock(_last_grid_mutex);
        return _last_grid;
    }

}
