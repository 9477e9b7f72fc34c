/**
 * @file HubAdapter.hpp
 * @brief Adapter for the task-dispatch hub.
 */

#pragma once
#include <chrono>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

/**
 * @class HubAdapter
 * @brief Port probe, then `/health`. A failed health call keeps the hub online
 *        with a generic detail.
 */
class HubAdapter : public domain::SystemAdapter {
public:
    HubAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout, std::chrono::milliseconds healthTimeout);

    domain::SystemStatus describe() const override;

private:
    AdapterSpec m_spec;
    std::chrono::milliseconds m_probeTimeout;
    std::chrono::milliseconds m_healthTimeout;
};

} // namespace missioncontrol::infrastructure::adapters
