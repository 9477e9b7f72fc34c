/**
 * @file WorkerAdapter.hpp
 * @brief Adapter for the autonomous background worker.
 */

#pragma once
#include <chrono>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

/**
 * @class WorkerAdapter
 * @brief Reachable: reports mode and today's counters from `/health`, or how many
 *        tasks are paused when the worker was killed. Unreachable: installed or
 *        missing depending on the install directory.
 */
class WorkerAdapter : public domain::SystemAdapter {
public:
    WorkerAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout,
                  std::chrono::milliseconds healthTimeout);

    domain::SystemStatus describe() const override;

private:
    AdapterSpec m_spec;
    std::chrono::milliseconds m_probeTimeout;
    std::chrono::milliseconds m_healthTimeout;
};

} // namespace missioncontrol::infrastructure::adapters
