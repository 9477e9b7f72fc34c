#include "app/ShutdownSignal.hpp"
#include <csignal>
#include <iostream>
#include <utility>

namespace missioncontrol::app {

namespace {

std::atomic<bool> g_stopRequested{false};

static_assert(std::atomic<bool>::is_always_lock_free, "signal flag must be lock-free");

void OnStopSignal(int) {
    g_stopRequested.store(true);
}

} // namespace

void ShutdownSignal::Install() {
    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool ShutdownSignal::Requested() {
    return g_stopRequested.load();
}

ShutdownSignal::ShutdownSignal(std::function<void()> onStop, std::chrono::milliseconds pollInterval)
    : m_onStop(std::move(onStop)), m_pollInterval(pollInterval) {
    m_thread = std::thread([this]() { watch(); });
}

ShutdownSignal::~ShutdownSignal() {
    m_done.store(true);
    if (m_thread.joinable()) m_thread.join();
}

void ShutdownSignal::watch() {
    bool announced = false;
    while (!m_done.load()) {
        if (Requested()) {
            if (!announced) {
                std::cout << "[ShutdownSignal] Stop requested." << std::endl;
                announced = true;
            }
            // Repeated until the owner goes away: a stop issued before the server
            // is listening has no effect.
            m_onStop();
        }
        std::this_thread::sleep_for(m_pollInterval);
    }
}

} // namespace missioncontrol::app
