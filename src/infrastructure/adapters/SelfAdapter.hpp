/**
 * @file SelfAdapter.hpp
 * @brief The dashboard's own registry entry. Always online while it can answer.
 */

#pragma once
#include "domain/SystemAdapter.hpp"
#include "infrastructure/HubConfig.hpp"

namespace missioncontrol::infrastructure::adapters {

class SelfAdapter : public domain::SystemAdapter {
public:
    SelfAdapter(const AdapterSpec& spec, int listenPort);

    domain::SystemStatus describe() const override;
    domain::SystemStatus unresponsive() const override { return describe(); }

private:
    AdapterSpec m_spec;
    int m_port;
};

} // namespace missioncontrol::infrastructure::adapters
