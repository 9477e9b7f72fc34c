#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "app/ShutdownSignal.hpp"

using namespace missioncontrol::app;
using namespace std::chrono;

int main() {
    std::cout << "[Test] Starting ShutdownSignal Test..." << std::endl;

    ShutdownSignal::Install();
    assert(!ShutdownSignal::Requested());

    std::atomic<int> stops{0};
    std::atomic<std::thread::id> caller{};
    {
        ShutdownSignal watcher([&stops, &caller]() {
            caller.store(std::this_thread::get_id());
            stops.fetch_add(1);
        }, milliseconds(10));

        std::this_thread::sleep_for(milliseconds(50));
        assert(stops.load() == 0);

        std::raise(SIGTERM);
        assert(ShutdownSignal::Requested());

        const auto give_up = steady_clock::now() + seconds(2);
        while (stops.load() == 0 && steady_clock::now() < give_up) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        assert(stops.load() >= 1);
        // The stop callback runs on the watcher thread, never inside the handler.
        assert(caller.load() != std::this_thread::get_id());
    }
    std::cout << "[PASS] SIGTERM stops through the watcher thread." << std::endl;

    // The process survives a broken pipe.
    std::raise(SIGPIPE);
    std::cout << "[PASS] SIGPIPE is ignored." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
