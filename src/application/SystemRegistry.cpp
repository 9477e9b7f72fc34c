#include "application/SystemRegistry.hpp"
#include <future>
#include <iostream>
#include <system_error>
#include <thread>

namespace missioncontrol::application {

SystemRegistry::SystemRegistry(std::vector<std::shared_ptr<domain::SystemAdapter>> adapters,
                               std::chrono::milliseconds deadline)
    : m_adapters(adapters.begin(), adapters.end()), m_deadline(deadline) {}

std::vector<domain::SystemStatus> SystemRegistry::aggregate() const {
    const auto deadline = std::chrono::steady_clock::now() + m_deadline;

    // Futures come from promises rather than std::async so that dropping a late
    // one does not block on its worker.
    std::vector<std::future<domain::SystemStatus>> pending;
    pending.reserve(m_adapters.size());

    for (const auto& adapter : m_adapters) {
        auto promise = std::make_shared<std::promise<domain::SystemStatus>>();
        pending.push_back(promise->get_future());
        try {
            std::thread([adapter, promise]() {
                try {
                    promise->set_value(adapter->describe());
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[SystemRegistry] Could not start worker for " << adapter->id() << ": " << e.what()
                      << ". Describing inline." << std::endl;
            try {
                promise->set_value(adapter->describe());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }
    }

    std::vector<domain::SystemStatus> results;
    results.reserve(m_adapters.size());
    for (size_t i = 0; i < m_adapters.size(); ++i) {
        const auto& adapter = m_adapters[i];
        if (pending[i].wait_until(deadline) != std::future_status::ready) {
            std::cerr << "[SystemRegistry] " << adapter->id() << " missed the aggregation deadline." << std::endl;
            results.push_back(adapter->unresponsive());
            continue;
        }
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& e) {
            std::cerr << "[SystemRegistry] " << adapter->id() << " failed: " << e.what() << std::endl;
            results.push_back(adapter->unresponsive());
        } catch (...) {
            std::cerr << "[SystemRegistry] " << adapter->id() << " failed with a non-standard exception." << std::endl;
            results.push_back(adapter->unresponsive());
        }
    }
    return results;
}

} // namespace missioncontrol::application
