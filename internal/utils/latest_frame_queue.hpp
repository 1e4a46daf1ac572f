#ifndef UTILS_LATEST_FRAME_QUEUE_HPP
#define UTILS_LATEST_FRAME_QUEUE_HPP

#include <mutex>
#include <optional>
#include <utility>
#include <cstdint>

namespace utils {

    /*
     * single slot hand-off between one producer and one consumer. a push over an undelivered item
     * replaces it and counts it as dropped; a pull never waits and always sees the newest item.
     */
    template <typename T>
    class LatestFrameQueue {
    public:
        LatestFrameQueue() = default;
        LatestFrameQueue (const LatestFrameQueue&) = delete;
        LatestFrameQueue& operator= (const LatestFrameQueue&) = delete;

        // returns true if an undelivered item was overwritten
        bool Push(T &&item) {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            const bool overwritten = _slot.has_value();
            if (overwritten) {
                _dropped_count++;
            }
            _slot = std::move(item);
            _pushed_count++;
            return overwritten;
        }

        [[nodiscard]] std::optional<T> PullLatest() {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            if (!_slot.has_value()) {
                return std::nullopt;
            }
            std::optional<T> item = std::move(_slot);
            _slot.reset();
            _delivered_count++;
            return item;
        }

        [[nodiscard]] bool HasPending() const {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            return _slot.has_value();
        }

        // a cleared item was never delivered, so it counts as dropped too
        void Clear() {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            if (_slot.has_value()) {
                _dropped_count++;
                _slot.reset();
            }
        }

        [[nodiscard]] uint64_t GetDroppedCount() const {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            return _dropped_count;
        }
        [[nodiscard]] uint64_t GetPushedCount() const {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            return _pushed_count;
        }
        [[nodiscard]] uint64_t GetDeliveredCount() const {
            std::unique_lock<std::mutex> lock(_slot_mutex);
            return _delivered_count;
        }

    private:
        mutable std::mutex _slot_mutex;
        std::optional<T> _slot = std::nullopt;
        uint64_t _dropped_count = 0;
        uint64_t _pushed_count = 0;
        uint64_t _delivered_count = 0;
    };

}

#endif //UTILS_LATEST_FRAME_QUEUE_HPP
