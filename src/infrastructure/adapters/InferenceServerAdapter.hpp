/**
 * @file InferenceServerAdapter.hpp
 * @brief Adapter for the local inference server.
 */

#pragma once
#include <chrono>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

class InferenceServerAdapter : public domain::SystemAdapter {
public:
    static constexpr size_t kListedModels = 4;

    InferenceServerAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout,
                           std::chrono::milliseconds healthTimeout);

    /** @brief Online detail lists the first kListedModels model names plus the total count. */
    domain::SystemStatus describe() const override;

private:
    AdapterSpec m_spec;
    std::chrono::milliseconds m_probeTimeout;
    std::chrono::milliseconds m_healthTimeout;
};

} // namespace missioncontrol::infrastructure::adapters
