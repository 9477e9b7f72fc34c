/**
 * @file ShutdownSignal.hpp
 * @brief SIGINT/SIGTERM handling that stops the server from a normal thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace missioncontrol::app {

/**
 * @class ShutdownSignal
 * @brief The signal handler only raises a lock-free flag; a watcher thread polls
 *        the flag and runs the stop callback outside signal context.
 */
class ShutdownSignal {
public:
    /** @brief Routes SIGINT and SIGTERM to the flag and ignores SIGPIPE. */
    static void Install();

    static bool Requested();

    /**
     * @brief Starts watching. Once a signal has arrived, `onStop` runs on the watcher
     *        thread every poll interval until this object is destroyed.
     */
    explicit ShutdownSignal(std::function<void()> onStop,
                            std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

private:
    void watch();

    std::function<void()> m_onStop;
    std::chrono::milliseconds m_pollInterval;
    std::atomic<bool> m_done{false};
    std::thread m_thread;
};

} // namespace missioncontrol::app
