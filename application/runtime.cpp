#include "runtime.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

#include <chrono>
using namespace std::literals;


namespace application {

    static std::atomic<bool> exit_requested = { false };

    static void signal_handler(int signal) {
        exit_requested = true;
    }

    void WaitForShutdown(const std::function<void()> &on_tick) {
        exit_requested = false;

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        while (!exit_requested) {
            std::this_thread::sleep_for(1s);
            if (on_tick && !exit_requested) {
                on_tick();
            }
        }
        std::cout << "shutdown..." << std::endl;
    }
}
