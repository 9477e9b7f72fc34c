/**
 * @file ServiceAdapter.hpp
 * @brief Adapter for a networked system that is also installed locally.
 */

#pragma once
#include <chrono>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

/**
 * @class ServiceAdapter
 * @brief Online when its port answers; otherwise installed or missing by directory.
 */
class ServiceAdapter : public domain::SystemAdapter {
public:
    ServiceAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout);

    domain::SystemStatus describe() const override;

private:
    AdapterSpec m_spec;
    std::chrono::milliseconds m_probeTimeout;
};

} // namespace missioncontrol::infrastructure::adapters
