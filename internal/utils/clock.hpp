#ifndef UTILS_CLOCK_HPP
#define UTILS_CLOCK_HPP

#include <chrono>
#include <memory>
#include <thread>

typedef std::chrono::steady_clock Clock;
typedef Clock::time_point ClockPoint;

namespace utils {

    // wall-clock seam so anything that sleeps or measures rates can be driven by a test clock
    class TimeSource {
    public:
        virtual ~TimeSource() = default;
        [[nodiscard]] virtual ClockPoint Now() const = 0;
        virtual void SleepFor(std::chrono::milliseconds duration) = 0;
    };

    typedef std::shared_ptr<TimeSource> TimeSourcePtr;

    class SteadyTimeSource: public TimeSource {
    public:
        static TimeSourcePtr Create() {
            return std::make_shared<SteadyTimeSource>();
        }
        [[nodiscard]] ClockPoint Now() const override {
            return Clock::now();
        }
        void SleepFor(std::chrono::milliseconds duration) override {
            if (duration.count() > 0) {
                std::this_thread::sleep_for(duration);
            }
        }
    };

}

#endif //UTILS_CLOCK_HPP
