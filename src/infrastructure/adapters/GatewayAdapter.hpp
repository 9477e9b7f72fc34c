/**
 * @file GatewayAdapter.hpp
 * @brief Adapter for the local agent gateway.
 */

#pragma once
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

/**
 * @class GatewayAdapter
 * @brief Probes the gateway port; when reachable, reads the gateway's JSON config
 *        for the primary model and the enabled plugins.
 */
class GatewayAdapter : public domain::SystemAdapter {
public:
    GatewayAdapter(const AdapterSpec& spec, std::chrono::milliseconds probeTimeout);

    domain::SystemStatus describe() const override;

private:
    std::optional<nlohmann::json> readConfig() const;

    AdapterSpec m_spec;
    std::chrono::milliseconds m_probeTimeout;
};

} // namespace missioncontrol::infrastructure::adapters
