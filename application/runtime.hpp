#ifndef RAWSTREAM_APPLICATION_RUNTIME_HPP
#define RAWSTREAM_APPLICATION_RUNTIME_HPP

#include <functional>

namespace application {

    // blocks until SIGINT / SIGTERM, calling on_tick about once a second while waiting
    void WaitForShutdown(const std::function<void()> &on_tick = nullptr);

}

#endif //RAWSTREAM_APPLICATION_RUNTIME_HPP
